// ============================================================
// transfer_codec.cpp
// ============================================================

#include "transfer_codec.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cstring>
#include <fstream>
#include <sstream>
#include <iomanip>

namespace {

std::string hex64(u64 v) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << v;
    return ss.str();
}

} // namespace

// ---- EncodedChunk ----

ChunkHdr EncodedChunk::header() const {
    ChunkHdr hdr{};
    hdr.raw_len       = raw_len;
    hdr.data_len      = (u32)data.size();
    hdr.xxh3_32       = xxh3_32;
    hdr.compress_algo = static_cast<u8>(algo);
    return hdr;
}

EncodedChunk EncodedChunk::from_wire(const ChunkHdr& hdr, std::vector<u8> data) {
    if (hdr.compress_algo > static_cast<u8>(CompressAlgo::ZSTD)) {
        throw ProtocolError("unknown chunk compression: " + std::to_string(hdr.compress_algo));
    }
    EncodedChunk c;
    c.raw_len = hdr.raw_len;
    c.xxh3_32 = hdr.xxh3_32;
    c.algo    = static_cast<CompressAlgo>(hdr.compress_algo);
    c.data    = std::move(data);
    return c;
}

// ---- UploadSignal ----

UploadSignal UploadSignal::continue_at(i32 index) {
    if (index < 0) {
        throw ProtocolError("upload index must be non-negative: " + std::to_string(index));
    }
    return UploadSignal(Kind::CONTINUE, index);
}

UploadSignal UploadSignal::from_wire(i32 value) {
    if (value == UPLOAD_REPLY_REJECT)   return rejected();
    if (value == UPLOAD_REPLY_COMPLETE) return completed();
    if (value < 0) {
        throw ProtocolError("unexpected upload reply: " + std::to_string(value));
    }
    return UploadSignal(Kind::CONTINUE, value);
}

// ---- TransferCodec ----

TransferCodec::TransferCodec(bool use_compress, u32 block_size)
    : use_compress_(use_compress)
    , block_size_(block_size ? block_size : TRANSFER_BLOCK_SIZE)
{
}

EncodedChunk TransferCodec::encode(const void* data, size_t len) const {
    EncodedChunk c;
    c.raw_len = (u32)len;
    c.xxh3_32 = hash::xxh3_32(data, len);
    if (len == 0) return c;

    if (use_compress_) {
        std::vector<u8> packed = compress::compress_to_vec(data, len);
        if (packed.size() < len) {
            c.algo = CompressAlgo::ZSTD;
            c.data = std::move(packed);
            return c;
        }
    }
    const u8* p = static_cast<const u8*>(data);
    c.data.assign(p, p + len);
    return c;
}

std::vector<u8> TransferCodec::decode(const EncodedChunk& chunk) const {
    if (chunk.raw_len > block_size_ || chunk.data.size() > MAX_PAYLOAD_LEN) {
        throw ProtocolError("chunk too large: raw " + std::to_string(chunk.raw_len) +
                            " data " + std::to_string(chunk.data.size()) +
                            " (block " + std::to_string(block_size_) + ")");
    }
    std::vector<u8> raw;
    if (chunk.algo == CompressAlgo::ZSTD) {
        try {
            raw = compress::decompress_to_vec(chunk.data.data(), chunk.data.size(),
                                              chunk.raw_len);
        } catch (const std::runtime_error& e) {
            throw ProtocolError(e.what());
        }
    } else {
        if (chunk.data.size() != chunk.raw_len) {
            throw ProtocolError("chunk length mismatch: header " +
                                std::to_string(chunk.raw_len) + " data " +
                                std::to_string(chunk.data.size()));
        }
        raw = chunk.data;
    }

    if (hash::xxh3_32(raw.data(), raw.size()) != chunk.xxh3_32) {
        throw ProtocolError("chunk checksum mismatch (" +
                            std::to_string(raw.size()) + " bytes)");
    }
    return raw;
}

u32 TransferCodec::upload(const std::string& path, const AppendFn& append) const {
    file_io::MmapReader reader(path);
    hash::StreamHasher64 hasher;

    u64 offset  = 0;
    u32 appends = 0;
    for (;;) {
        u64 n = reader.chunk_len(offset, block_size_);
        const char* p = reader.chunk_ptr(offset);
        append(encode(p, (size_t)n));
        hasher.update(p, (size_t)n);
        ++appends;
        offset += n;
        if (n != block_size_) break;
    }

    LOG_INFO("Uploaded " + path + " (" + utils::format_bytes(offset) + ", " +
             std::to_string(appends) + " chunks, xxh3=" + hex64(hasher.digest()) + ")");
    return appends;
}

void TransferCodec::upload_acknowledged(const std::string& path,
                                        const AckAppendFn& append) const
{
    file_io::MmapReader reader(path);

    u64  offset     = 0;
    i32  part       = 0;
    bool final_sent = false;
    for (;;) {
        u64 n = reader.chunk_len(offset, block_size_);
        EncodedChunk chunk = encode(reader.chunk_ptr(offset), (size_t)n);
        offset += n;

        i32 wire_part = part;
        if (chunk.empty()) {
            wire_part  = UPLOAD_PART_FINAL;
            final_sent = true;
        }

        UploadSignal sig = UploadSignal::from_wire(append(chunk, wire_part));
        switch (sig.kind()) {
            case UploadSignal::Kind::REJECTED:
                throw RemoteRejectedError("project busy, upload not allowed");
            case UploadSignal::Kind::COMPLETED:
                LOG_DEBUG("upload of " + path + " finished (" +
                          utils::format_bytes(offset) + ")");
                return;
            case UploadSignal::Kind::CONTINUE:
                if (final_sent) {
                    throw ProtocolError("server granted index " + std::to_string(sig.index()) +
                                        " after the final chunk");
                }
                if (sig.index() <= part) {
                    throw ProtocolError("server granted non-increasing index " +
                                        std::to_string(sig.index()) + " after " +
                                        std::to_string(part));
                }
                part = sig.index();
                break;
        }
    }
}

u64 TransferCodec::download(const FetchFn& fetch, const std::string& dest_path) const {
    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TransferError("Cannot create " + dest_path);
    }

    hash::StreamHasher64 hasher;
    u64 total = 0;
    for (u32 part = 0;; ++part) {
        FileChunkReply reply;
        std::vector<u8> raw;
        int attempts_left = GET_FILE_ATTEMPTS;
        for (;;) {
            try {
                reply = fetch(part);
                if (!reply.end_of_file) raw = decode(reply.chunk);
                break;
            } catch (const ControlError& e) {
                if (!is_transient(e.kind())) {
                    out.close();
                    throw;
                }
                --attempts_left;
                LOG_WARN("get_file part " + std::to_string(part) + " failed, retry " +
                         std::to_string(attempts_left) + " times: " + e.what());
                if (attempts_left == 0) {
                    out.close();
                    throw TransferError("file transfer failed: " + dest_path + " at part " +
                                        std::to_string(part) + " (" + e.what() + ")");
                }
            }
        }

        if (reply.end_of_file) break;

        out.write(reinterpret_cast<const char*>(raw.data()), (std::streamsize)raw.size());
        if (!out) {
            throw TransferError("write failed: " + dest_path);
        }
        hasher.update(raw.data(), raw.size());
        total += raw.size();
    }

    out.close();
    if (!out) {
        throw TransferError("close failed: " + dest_path);
    }
    LOG_INFO("Downloaded " + dest_path + " (" + utils::format_bytes(total) +
             ", xxh3=" + hex64(hasher.digest()) + ")");
    return total;
}

#pragma once

// ============================================================
// transfer_codec.hpp -- Block upload / chunked download of files
//
// Three transfer shapes share one chunk encoding:
//   upload()              fire-and-forget appends, short block ends the loop
//   upload_acknowledged() server grants every next index (configuration doc)
//   download()            ascending get-chunk calls until end-of-file
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include <functional>
#include <string>
#include <vector>

// One transport-encoded block.
struct EncodedChunk {
    u32             raw_len{0};
    u32             xxh3_32{0};
    CompressAlgo    algo{CompressAlgo::NONE};
    std::vector<u8> data;

    bool empty() const { return raw_len == 0; }

    // Wire header (host order)
    ChunkHdr header() const;
    static EncodedChunk from_wire(const ChunkHdr& hdr, std::vector<u8> data);
};

// Reply to one getFile(part) call.
struct FileChunkReply {
    bool         end_of_file{false};
    EncodedChunk chunk;
};

// Decoded server reply to an acknowledged upload call.
class UploadSignal {
public:
    enum class Kind : u8 {
        CONTINUE,   // send the next block with index()
        REJECTED,   // project busy; abort the upload
        COMPLETED,  // document accepted; stop sending
    };

    static UploadSignal continue_at(i32 index);
    static UploadSignal rejected()  { return UploadSignal(Kind::REJECTED, UPLOAD_REPLY_REJECT); }
    static UploadSignal completed() { return UploadSignal(Kind::COMPLETED, UPLOAD_REPLY_COMPLETE); }

    // Throws ProtocolError for negative values other than the two sentinels.
    static UploadSignal from_wire(i32 value);
    i32 to_wire() const { return value_; }

    Kind kind() const { return kind_; }
    i32 index() const { return value_; }

private:
    UploadSignal(Kind kind, i32 value) : kind_(kind), value_(value) {}

    Kind kind_;
    i32  value_;
};

class TransferCodec {
public:
    using AppendFn    = std::function<void(const EncodedChunk&)>;
    using AckAppendFn = std::function<i32(const EncodedChunk&, i32 part)>;
    using FetchFn     = std::function<FileChunkReply(u32 part)>;

    explicit TransferCodec(bool use_compress = true,
                           u32 block_size = TRANSFER_BLOCK_SIZE);

    // zstd-compress the block when that makes it smaller; checksum the raw bytes.
    EncodedChunk encode(const void* data, size_t len) const;

    // Throws ProtocolError on a corrupt or mismatching chunk.
    std::vector<u8> decode(const EncodedChunk& chunk) const;

    // Appends every block of 'path', including the terminal short (possibly
    // empty) one. Returns the number of append calls made.
    u32 upload(const std::string& path, const AppendFn& append) const;

    // Flow-controlled upload: 'append' returns the server's raw reply.
    // Throws RemoteRejectedError on reject, ProtocolError on a reply that
    // breaks the index contract.
    void upload_acknowledged(const std::string& path, const AckAppendFn& append) const;

    // Writes chunks 0, 1, ... to dest_path until end-of-file. Each index gets
    // GET_FILE_ATTEMPTS tries on transient errors; exhausting them throws
    // TransferError and leaves the partial file in place.
    u64 download(const FetchFn& fetch, const std::string& dest_path) const;

    u32 block_size() const { return block_size_; }
    bool use_compress() const { return use_compress_; }

private:
    bool use_compress_;
    u32  block_size_;
};

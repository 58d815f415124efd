#pragma once

// ============================================================
// protocol_io.hpp -- Frame and field encoding with byte-order handling
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u32 hton32(u32 v) { return htobe32(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

inline void encode_chunk_hdr(ChunkHdr& c) {
    c.raw_len  = hton32(c.raw_len);
    c.data_len = hton32(c.data_len);
    c.xxh3_32  = hton32(c.xxh3_32);
}

inline void decode_chunk_hdr(ChunkHdr& c) {
    c.raw_len  = ntoh32(c.raw_len);
    c.data_len = ntoh32(c.data_len);
    c.xxh3_32  = ntoh32(c.xxh3_32);
}

// ---- Payload field writer ----
// Fields are appended in call order; the reader must consume them in the
// same order.
class Writer {
public:
    Writer& u8v(u8 v)  { buf_.push_back(v); return *this; }
    Writer& u16v(u16 v) { v = hton16(v); append(&v, 2); return *this; }
    Writer& u32v(u32 v) { v = hton32(v); append(&v, 4); return *this; }
    Writer& i32v(i32 v) { return u32v(static_cast<u32>(v)); }
    Writer& boolv(bool v) { return u8v(v ? 1 : 0); }

    Writer& str(const std::string& s) {
        if (s.size() > 0xFFFFu) {
            throw ProtocolError("string field too long: " + std::to_string(s.size()));
        }
        u16v(static_cast<u16>(s.size()));
        append(s.data(), s.size());
        return *this;
    }

    // Chunk header (host order in, wire order out) followed by its data.
    Writer& chunk(ChunkHdr hdr, const u8* data) {
        u32 data_len = hdr.data_len;
        encode_chunk_hdr(hdr);
        append(&hdr, sizeof(hdr));
        append(data, data_len);
        return *this;
    }

    const std::vector<u8>& bytes() const { return buf_; }
    u32 size() const { return static_cast<u32>(buf_.size()); }

private:
    void append(const void* p, size_t n) {
        if (n == 0) return;
        const u8* b = static_cast<const u8*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }

    std::vector<u8> buf_;
};

// ---- Payload field reader ----
// Throws ProtocolError when the payload is shorter than the fields read.
class Reader {
public:
    explicit Reader(const std::vector<u8>& buf) : buf_(buf) {}

    u8 u8v() { need(1); return buf_[pos_++]; }

    u16 u16v() {
        u16 v; need(2); std::memcpy(&v, buf_.data() + pos_, 2); pos_ += 2;
        return ntoh16(v);
    }

    u32 u32v() {
        u32 v; need(4); std::memcpy(&v, buf_.data() + pos_, 4); pos_ += 4;
        return ntoh32(v);
    }

    i32 i32v() { return static_cast<i32>(u32v()); }
    bool boolv() { return u8v() != 0; }

    std::string str() {
        u16 len = u16v();
        need(len);
        std::string s(reinterpret_cast<const char*>(buf_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    // Returns the header in host order; data is copied into 'data'.
    ChunkHdr chunk(std::vector<u8>& data) {
        ChunkHdr hdr{};
        need(sizeof(ChunkHdr));
        std::memcpy(&hdr, buf_.data() + pos_, sizeof(ChunkHdr));
        pos_ += sizeof(ChunkHdr);
        decode_chunk_hdr(hdr);
        need(hdr.data_len);
        data.assign(buf_.begin() + pos_, buf_.begin() + pos_ + hdr.data_len);
        pos_ += hdr.data_len;
        return hdr;
    }

    bool at_end() const { return pos_ == buf_.size(); }
    size_t remaining() const { return buf_.size() - pos_; }

private:
    void need(size_t n) const {
        if (buf_.size() - pos_ < n) {
            throw ProtocolError("short payload: need " + std::to_string(n) +
                                " bytes at offset " + std::to_string(pos_) +
                                " of " + std::to_string(buf_.size()));
        }
    }

    const std::vector<u8>& buf_;
    size_t pos_{0};
};

} // namespace proto

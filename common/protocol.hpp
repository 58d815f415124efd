#pragma once

// protocol.hpp -- Wire protocol definitions for the pbuilder build service

#include "platform.hpp"
#include <cstring>

// Magic number: "PBR1", carried by MT_GET_VERSION requests
static constexpr u32 PBREMOTE_MAGIC = 0x50425231u;

// Compared verbatim against the service's getVersion reply.
static constexpr const char* PBREMOTE_PROTOCOL_VERSION = "14.2";

static constexpr u32 MAX_PAYLOAD_LEN = 64u * 1024u * 1024u;

// Every upload and download moves the file in blocks of this size.
static constexpr u32 TRANSFER_BLOCK_SIZE = 1u * 1024u * 1024u;

// Download retry budget for one chunk index.
static constexpr int GET_FILE_ATTEMPTS = 5;

// ---- Acknowledged upload sentinels (uploadFile) ----
// Client -> server: part index of the final, possibly empty, chunk.
static constexpr i32 UPLOAD_PART_FINAL    = -1;
// Server -> client replies.
static constexpr i32 UPLOAD_REPLY_REJECT   = -1;  // project busy, upload refused
static constexpr i32 UPLOAD_REPLY_COMPLETE = -2;  // whole document accepted

// ---- Project state strings ----
static constexpr const char* PROJECT_FINISH_SENTINEL = "ELBE-FINISH";
static constexpr const char* PROJECT_STATUS_DONE     = "build_done";

// Remote name of the build configuration inside a project.
static constexpr const char* PROJECT_CONFIG_NAME = "source.xml";
static constexpr const char* PROJECT_LOG_NAME    = "log.txt";

// ---- Message Types (all prefixed MT_ to avoid macro collisions) ----
enum class MsgType : u16 {
    MT_GET_VERSION    = 0x0001,
    MT_LOGIN          = 0x0002,

    MT_CREATE_PROJECT = 0x0010,
    MT_UPLOAD_FILE    = 0x0011,  // acknowledged upload, reply carries UploadSignal
    MT_RM_LOG         = 0x0012,

    MT_BUILD_PBUILDER  = 0x0020,
    MT_UPDATE_PBUILDER = 0x0021,

    MT_GET_PROJECT_BUSY = 0x0030,
    MT_GET_PROJECT      = 0x0031,

    MT_START_UPLOAD_ORIG  = 0x0040,
    MT_APPEND_UPLOAD_ORIG = 0x0041,
    MT_FINISH_UPLOAD_ORIG = 0x0042,

    MT_START_PDEBUILD  = 0x0050,
    MT_APPEND_PDEBUILD = 0x0051,
    MT_FINISH_PDEBUILD = 0x0052,

    MT_START_CDROM  = 0x0060,
    MT_APPEND_CDROM = 0x0061,
    MT_FINISH_CDROM = 0x0062,

    MT_GET_FILES = 0x0070,
    MT_GET_FILE  = 0x0071,  // reply: u8 eof flag, then a chunk when eof == 0

    MT_REPLY     = 0x00F0,
    MT_ERROR_MSG = 0x00FF,
};

inline const char* msg_type_name(MsgType t) {
    switch (t) {
        case MsgType::MT_GET_VERSION:        return "getVersion";
        case MsgType::MT_LOGIN:              return "login";
        case MsgType::MT_CREATE_PROJECT:     return "createProject";
        case MsgType::MT_UPLOAD_FILE:        return "uploadFile";
        case MsgType::MT_RM_LOG:             return "rmLog";
        case MsgType::MT_BUILD_PBUILDER:     return "buildPbuilder";
        case MsgType::MT_UPDATE_PBUILDER:    return "updatePbuilder";
        case MsgType::MT_GET_PROJECT_BUSY:   return "getProjectBusy";
        case MsgType::MT_GET_PROJECT:        return "getProject";
        case MsgType::MT_START_UPLOAD_ORIG:  return "startUploadOrig";
        case MsgType::MT_APPEND_UPLOAD_ORIG: return "appendUploadOrig";
        case MsgType::MT_FINISH_UPLOAD_ORIG: return "finishUploadOrig";
        case MsgType::MT_START_PDEBUILD:     return "startPdebuild";
        case MsgType::MT_APPEND_PDEBUILD:    return "appendPdebuild";
        case MsgType::MT_FINISH_PDEBUILD:    return "finishPdebuild";
        case MsgType::MT_START_CDROM:        return "startCdrom";
        case MsgType::MT_APPEND_CDROM:       return "appendCdrom";
        case MsgType::MT_FINISH_CDROM:       return "finishCdrom";
        case MsgType::MT_GET_FILES:          return "getFiles";
        case MsgType::MT_GET_FILE:           return "getFile";
        case MsgType::MT_REPLY:              return "reply";
        case MsgType::MT_ERROR_MSG:          return "error";
    }
    return "unknown";
}

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Compress algo ----
enum class CompressAlgo : u8 {
    NONE = 0,
    ZSTD = 1,
};

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// ChunkHdr: 16 bytes fixed + data
struct ChunkHdr {
    u32 raw_len;        // original block length
    u32 data_len;       // bytes following (compressed if compress_algo=ZSTD)
    u32 xxh3_32;        // hash of raw (uncompressed) data
    u8  compress_algo;
    u8  pad[3];
};
static_assert(sizeof(ChunkHdr) == 16, "ChunkHdr size mismatch");

#pragma pack(pop)

// ============================================================
// remote_client.cpp -- Framed TCP implementation of RemoteService
//
// Request payloads (fields in order, see protocol_io.hpp):
//   MT_GET_VERSION       u32 magic                      -> str version
//   MT_LOGIN             str user, str passwd           -> u8 accepted
//   MT_CREATE_PROJECT    -                              -> str project
//   MT_UPLOAD_FILE       str prj, str name, i32 part, chunk -> i32 signal
//   MT_BUILD_PBUILDER    str prj, u8 cross, u8 ccache, str ccache_size
//   MT_GET_PROJECT_BUSY  str prj                        -> str message
//   MT_GET_PROJECT       str prj                        -> str status
//   MT_START_PDEBUILD    str prj, i32 cpuset
//   MT_FINISH_PDEBUILD   str prj, str profile, u8 cross
//   MT_APPEND_*          str prj, chunk
//   MT_GET_FILES         str prj                        -> u32 n, n x (str name, str desc)
//   MT_GET_FILE          str prj, str name, u32 part    -> u8 eof [, chunk]
//   everything else      str prj                        -> -
// ============================================================

#include "remote_client.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <stdexcept>

TcpRemoteService::~TcpRemoteService() {
    close();
}

void TcpRemoteService::open(const std::string& host, u16 port, int timeout_s) {
    host_      = host;
    port_      = port;
    timeout_s_ = timeout_s;
    logged_in_ = false;
    connect_socket();
}

void TcpRemoteService::close() {
    sock_.close();
}

void TcpRemoteService::connect_socket() {
    try {
        sock_.connect(host_, port_);
        if (timeout_s_ > 0) sock_.set_recv_timeout_ms(timeout_s_ * 1000);
    } catch (const std::runtime_error& e) {
        sock_.close();
        throw NetworkError(e.what());
    }
    LOG_DEBUG("connected to build service " + sock_.peer_addr());
}

void TcpRemoteService::ensure_connected() {
    if (sock_.is_valid()) return;
    if (host_.empty()) {
        throw NetworkError("not connected to a build service");
    }
    connect_socket();
    LOG_WARN("reconnected to " + host_ + ":" + std::to_string(port_));
    if (logged_in_) {
        proto::Writer req;
        req.str(user_).str(passwd_);
        std::vector<u8> reply = call(MsgType::MT_LOGIN, req);
        proto::Reader rd(reply);
        if (!rd.boolv()) {
            logged_in_ = false;
            throw RemoteError("login rejected on reconnect for user " + user_);
        }
    }
}

std::vector<u8> TcpRemoteService::call(MsgType type, const proto::Writer& req) {
    ensure_connected();

    FrameHeader hdr{};
    std::vector<u8> payload;
    try {
        sock_.write_frame(type, 0, req.bytes().data(), req.size());
        if (!sock_.read_frame(hdr, payload)) {
            sock_.close();
            throw NetworkError(std::string(msg_type_name(type)) +
                               ": connection closed or timed out (" + host_ + ")");
        }
    } catch (const ControlError&) {
        throw;
    } catch (const std::runtime_error& e) {
        sock_.close();
        throw NetworkError(std::string(msg_type_name(type)) + ": " + e.what());
    }

    MsgType reply_type = static_cast<MsgType>(hdr.msg_type);
    if (reply_type == MsgType::MT_ERROR_MSG) {
        throw RemoteError(std::string(msg_type_name(type)) + ": " +
                          std::string(payload.begin(), payload.end()));
    }
    if (reply_type != MsgType::MT_REPLY) {
        // Out of step with the server; start over on the next call.
        sock_.close();
        throw ProtocolError(std::string(msg_type_name(type)) + ": unexpected reply type " +
                            std::to_string(hdr.msg_type));
    }
    return payload;
}

void TcpRemoteService::call_void(MsgType type, const proto::Writer& req) {
    call(type, req);
}

std::string TcpRemoteService::call_string(MsgType type, const proto::Writer& req) {
    std::vector<u8> reply = call(type, req);
    proto::Reader rd(reply);
    return rd.str();
}

// ---- Session ----

std::string TcpRemoteService::get_version() {
    proto::Writer req;
    req.u32v(PBREMOTE_MAGIC);
    return call_string(MsgType::MT_GET_VERSION, req);
}

void TcpRemoteService::login(const std::string& user, const std::string& passwd) {
    proto::Writer req;
    req.str(user).str(passwd);
    std::vector<u8> reply = call(MsgType::MT_LOGIN, req);
    proto::Reader rd(reply);
    if (!rd.boolv()) {
        throw RemoteError("login rejected for user " + user);
    }
    user_      = user;
    passwd_    = passwd;
    logged_in_ = true;
}

// ---- Project lifecycle ----

std::string TcpRemoteService::create_project() {
    return call_string(MsgType::MT_CREATE_PROJECT, proto::Writer());
}

i32 TcpRemoteService::upload_file(const std::string& project, const std::string& name,
                                  const EncodedChunk& chunk, i32 part)
{
    proto::Writer req;
    req.str(project).str(name).i32v(part).chunk(chunk.header(), chunk.data.data());
    std::vector<u8> reply = call(MsgType::MT_UPLOAD_FILE, req);
    proto::Reader rd(reply);
    return rd.i32v();
}

void TcpRemoteService::rm_log(const std::string& project) {
    proto::Writer req;
    req.str(project);
    call_void(MsgType::MT_RM_LOG, req);
}

// ---- Pbuilder environment ----

void TcpRemoteService::build_pbuilder(const std::string& project, bool cross,
                                      const CcacheOptions& ccache)
{
    proto::Writer req;
    req.str(project).boolv(cross).boolv(ccache.enabled).str(ccache.size);
    call_void(MsgType::MT_BUILD_PBUILDER, req);
}

void TcpRemoteService::update_pbuilder(const std::string& project) {
    proto::Writer req;
    req.str(project);
    call_void(MsgType::MT_UPDATE_PBUILDER, req);
}

// ---- Busy state ----

std::string TcpRemoteService::get_project_busy(const std::string& project) {
    proto::Writer req;
    req.str(project);
    return call_string(MsgType::MT_GET_PROJECT_BUSY, req);
}

std::string TcpRemoteService::get_project_status(const std::string& project) {
    proto::Writer req;
    req.str(project);
    return call_string(MsgType::MT_GET_PROJECT, req);
}

// ---- Orig tarballs ----

void TcpRemoteService::start_upload_orig(const std::string& project, const std::string& fname) {
    proto::Writer req;
    req.str(project).str(fname);
    call_void(MsgType::MT_START_UPLOAD_ORIG, req);
}

void TcpRemoteService::append_upload_orig(const std::string& project, const EncodedChunk& chunk) {
    proto::Writer req;
    req.str(project).chunk(chunk.header(), chunk.data.data());
    call_void(MsgType::MT_APPEND_UPLOAD_ORIG, req);
}

void TcpRemoteService::finish_upload_orig(const std::string& project) {
    proto::Writer req;
    req.str(project);
    call_void(MsgType::MT_FINISH_UPLOAD_ORIG, req);
}

// ---- Source archive ----

void TcpRemoteService::start_pdebuild(const std::string& project, int cpuset) {
    proto::Writer req;
    req.str(project).i32v(cpuset);
    call_void(MsgType::MT_START_PDEBUILD, req);
}

void TcpRemoteService::append_pdebuild(const std::string& project, const EncodedChunk& chunk) {
    proto::Writer req;
    req.str(project).chunk(chunk.header(), chunk.data.data());
    call_void(MsgType::MT_APPEND_PDEBUILD, req);
}

void TcpRemoteService::finish_pdebuild(const std::string& project, const std::string& profile,
                                       bool cross)
{
    proto::Writer req;
    req.str(project).str(profile).boolv(cross);
    call_void(MsgType::MT_FINISH_PDEBUILD, req);
}

// ---- Disk image ----

void TcpRemoteService::start_cdrom(const std::string& project) {
    proto::Writer req;
    req.str(project);
    call_void(MsgType::MT_START_CDROM, req);
}

void TcpRemoteService::append_cdrom(const std::string& project, const EncodedChunk& chunk) {
    proto::Writer req;
    req.str(project).chunk(chunk.header(), chunk.data.data());
    call_void(MsgType::MT_APPEND_CDROM, req);
}

void TcpRemoteService::finish_cdrom(const std::string& project) {
    proto::Writer req;
    req.str(project);
    call_void(MsgType::MT_FINISH_CDROM, req);
}

// ---- Results ----

std::vector<RemoteFile> TcpRemoteService::get_files(const std::string& project) {
    proto::Writer req;
    req.str(project);
    std::vector<u8> reply = call(MsgType::MT_GET_FILES, req);
    proto::Reader rd(reply);

    u32 count = rd.u32v();
    // Each entry carries two length-prefixed strings.
    if (count > rd.remaining() / 4) {
        throw ProtocolError("file list claims " + std::to_string(count) + " entries in " +
                            std::to_string(rd.remaining()) + " bytes");
    }
    std::vector<RemoteFile> files;
    files.reserve(count);
    for (u32 i = 0; i < count; ++i) {
        RemoteFile f;
        f.name        = rd.str();
        f.description = rd.str();
        files.push_back(std::move(f));
    }
    return files;
}

FileChunkReply TcpRemoteService::get_file(const std::string& project, const std::string& name,
                                          u32 part)
{
    proto::Writer req;
    req.str(project).str(name).u32v(part);
    std::vector<u8> reply = call(MsgType::MT_GET_FILE, req);
    proto::Reader rd(reply);

    FileChunkReply out;
    out.end_of_file = rd.boolv();
    if (!out.end_of_file) {
        std::vector<u8> data;
        ChunkHdr hdr = rd.chunk(data);
        out.chunk = EncodedChunk::from_wire(hdr, std::move(data));
    }
    return out;
}

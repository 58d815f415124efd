#pragma once

// ============================================================
// remote_client.hpp -- RemoteService over one framed TCP connection
//
// Each call writes one request frame and blocks for one reply frame.
// A dropped connection is re-opened on the next call (with the last
// login replayed), so pollers can simply retry after a NetworkError.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol_io.hpp"
#include "../common/socket.hpp"
#include "remote_service.hpp"
#include <string>
#include <vector>

class TcpRemoteService : public RemoteService {
public:
    TcpRemoteService() = default;
    ~TcpRemoteService() override;

    TcpRemoteService(const TcpRemoteService&) = delete;
    TcpRemoteService& operator=(const TcpRemoteService&) = delete;

    void open(const std::string& host, u16 port, int timeout_s) override;
    void close() override;

    std::string get_version() override;
    void login(const std::string& user, const std::string& passwd) override;

    std::string create_project() override;
    i32 upload_file(const std::string& project, const std::string& name,
                    const EncodedChunk& chunk, i32 part) override;
    void rm_log(const std::string& project) override;

    void build_pbuilder(const std::string& project, bool cross,
                        const CcacheOptions& ccache) override;
    void update_pbuilder(const std::string& project) override;

    std::string get_project_busy(const std::string& project) override;
    std::string get_project_status(const std::string& project) override;

    void start_upload_orig(const std::string& project, const std::string& fname) override;
    void append_upload_orig(const std::string& project, const EncodedChunk& chunk) override;
    void finish_upload_orig(const std::string& project) override;

    void start_pdebuild(const std::string& project, int cpuset) override;
    void append_pdebuild(const std::string& project, const EncodedChunk& chunk) override;
    void finish_pdebuild(const std::string& project, const std::string& profile,
                         bool cross) override;

    void start_cdrom(const std::string& project) override;
    void append_cdrom(const std::string& project, const EncodedChunk& chunk) override;
    void finish_cdrom(const std::string& project) override;

    std::vector<RemoteFile> get_files(const std::string& project) override;
    FileChunkReply get_file(const std::string& project, const std::string& name,
                            u32 part) override;

private:
    TcpSocket   sock_;
    std::string host_;
    u16         port_{0};
    int         timeout_s_{0};

    bool        logged_in_{false};
    std::string user_;
    std::string passwd_;

    // Send request, wait for MT_REPLY; returns its payload.
    std::vector<u8> call(MsgType type, const proto::Writer& req);
    void call_void(MsgType type, const proto::Writer& req);
    std::string call_string(MsgType type, const proto::Writer& req);

    void connect_socket();
    void ensure_connected();
};

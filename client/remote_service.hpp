#pragma once

// ============================================================
// remote_service.hpp -- Primitive operations of the build service
//
// One method per remote call. Implementations report:
//   NetworkError   transport failures (connect, closed socket, timeout)
//   ProtocolError  malformed replies
//   RemoteError    the service answered with an error message
// ============================================================

#include "../common/platform.hpp"
#include "transfer_codec.hpp"
#include <string>
#include <vector>

struct RemoteFile {
    std::string name;
    std::string description;
};

struct CcacheOptions {
    bool        enabled{true};
    std::string size{"10G"};
};

class RemoteService {
public:
    virtual ~RemoteService() = default;

    // Transport
    virtual void open(const std::string& host, u16 port, int timeout_s) = 0;
    virtual void close() = 0;

    // Session
    virtual std::string get_version() = 0;
    virtual void login(const std::string& user, const std::string& passwd) = 0;

    // Project lifecycle
    virtual std::string create_project() = 0;
    virtual i32 upload_file(const std::string& project, const std::string& name,
                            const EncodedChunk& chunk, i32 part) = 0;
    virtual void rm_log(const std::string& project) = 0;

    // Pbuilder environment
    virtual void build_pbuilder(const std::string& project, bool cross,
                                const CcacheOptions& ccache) = 0;
    virtual void update_pbuilder(const std::string& project) = 0;

    // Busy state
    virtual std::string get_project_busy(const std::string& project) = 0;
    virtual std::string get_project_status(const std::string& project) = 0;

    // Orig tarballs
    virtual void start_upload_orig(const std::string& project, const std::string& fname) = 0;
    virtual void append_upload_orig(const std::string& project, const EncodedChunk& chunk) = 0;
    virtual void finish_upload_orig(const std::string& project) = 0;

    // Source archive to build
    virtual void start_pdebuild(const std::string& project, int cpuset) = 0;
    virtual void append_pdebuild(const std::string& project, const EncodedChunk& chunk) = 0;
    virtual void finish_pdebuild(const std::string& project, const std::string& profile,
                                 bool cross) = 0;

    // Disk image
    virtual void start_cdrom(const std::string& project) = 0;
    virtual void append_cdrom(const std::string& project, const EncodedChunk& chunk) = 0;
    virtual void finish_cdrom(const std::string& project) = 0;

    // Results
    virtual std::vector<RemoteFile> get_files(const std::string& project) = 0;
    virtual FileChunkReply get_file(const std::string& project, const std::string& name,
                                    u32 part) = 0;
};

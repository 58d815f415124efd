#pragma once

// ============================================================
// build_session.hpp -- Primitive build-service operations
//
// Facade over one lazily opened Session plus the TransferCodec.
// Nothing touches the network until the first operation runs.
// ============================================================

#include "../common/platform.hpp"
#include "session_manager.hpp"
#include "transfer_codec.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Selects remote result files by exact prefix and/or shell wildcard.
// An empty filter selects everything.
struct FileFilter {
    std::vector<std::string> prefixes;
    std::string              wildcard;

    bool matches(const std::string& name) const;

    static FileFilter all() { return FileFilter(); }
    static FileFilter pbuilder_only();
};

struct PdebuildOptions {
    std::string profile;
    bool        cross{false};
    int         cpuset{-1};
};

class BuildSession {
public:
    BuildSession(SessionManager& manager, SessionParams params,
                 TransferCodec codec = TransferCodec());

    // Must be called before the first operation to take effect.
    void set_connect_retries(int retries) { params_.max_retries = retries; }
    void set_poll_interval(std::chrono::milliseconds iv) { poll_interval_ = iv; }
    bool connected() const { return session_ != nullptr; }

    std::string create_project();
    void set_configuration(const std::string& project, const std::string& xml_path);

    void push_orig_file(const std::string& project, const std::string& path);
    void push_source_archive(const std::string& project, const std::string& path,
                             const PdebuildOptions& opt);
    void push_disk_image(const std::string& project, const std::string& path);

    void build_pbuilder(const std::string& project, bool cross, const CcacheOptions& ccache);
    void update_pbuilder(const std::string& project);

    std::vector<RemoteFile> list_files(const std::string& project,
                                       const FileFilter& filter = FileFilter::all());
    // Downloads every selected file to outdir/<basename>; returns local paths.
    std::vector<std::string> fetch_files(const std::string& project, const std::string& outdir,
                                         const FileFilter& filter = FileFilter::all());
    u64 dump_file(const std::string& project, const std::string& remote_name,
                  const std::string& local_path);
    u64 fetch_log(const std::string& project, const std::string& local_path);

    // Drains the busy stream, then requires the build_done status.
    void wait_busy(const std::string& project);

    void remove_log(const std::string& project);

private:
    RemoteService& remote();

    SessionManager&           manager_;
    SessionParams             params_;
    TransferCodec             codec_;
    std::chrono::milliseconds poll_interval_{100};
    std::unique_ptr<Session>  session_;
};

// ============================================================
// build_session.cpp
// ============================================================

#include "build_session.hpp"
#include "status_stream.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <fnmatch.h>
#include <filesystem>

namespace fs = std::filesystem;

// ---- FileFilter ----

bool FileFilter::matches(const std::string& name) const {
    if (!prefixes.empty()) {
        bool hit = false;
        for (const auto& p : prefixes) {
            if (name.compare(0, p.size(), p) == 0) { hit = true; break; }
        }
        if (!hit) return false;
    }
    if (!wildcard.empty() && ::fnmatch(wildcard.c_str(), name.c_str(), 0) != 0) {
        return false;
    }
    return true;
}

FileFilter FileFilter::pbuilder_only() {
    FileFilter f;
    f.prefixes = {"pbuilder_cross", "pbuilder"};
    return f;
}

// ---- BuildSession ----

BuildSession::BuildSession(SessionManager& manager, SessionParams params, TransferCodec codec)
    : manager_(manager)
    , params_(std::move(params))
    , codec_(codec)
{
}

RemoteService& BuildSession::remote() {
    if (!session_) {
        session_ = manager_.connect(params_);
    }
    return *session_->remote;
}

std::string BuildSession::create_project() {
    std::string project = remote().create_project();
    if (project.empty()) {
        throw ProtocolError("createProject returned an empty project handle");
    }
    LOG_INFO("Created project " + project);
    return project;
}

void BuildSession::set_configuration(const std::string& project, const std::string& xml_path) {
    RemoteService& svc = remote();
    codec_.upload_acknowledged(xml_path, [&](const EncodedChunk& chunk, i32 part) {
        return svc.upload_file(project, PROJECT_CONFIG_NAME, chunk, part);
    });
    LOG_INFO("Configuration " + xml_path + " set on " + project);
}

void BuildSession::push_orig_file(const std::string& project, const std::string& path) {
    RemoteService& svc = remote();
    std::string fname = fs::path(path).filename().string();
    svc.start_upload_orig(project, fname);
    codec_.upload(path, [&](const EncodedChunk& chunk) {
        svc.append_upload_orig(project, chunk);
    });
    svc.finish_upload_orig(project);
}

void BuildSession::push_source_archive(const std::string& project, const std::string& path,
                                       const PdebuildOptions& opt)
{
    RemoteService& svc = remote();
    svc.start_pdebuild(project, opt.cpuset);
    codec_.upload(path, [&](const EncodedChunk& chunk) {
        svc.append_pdebuild(project, chunk);
    });
    svc.finish_pdebuild(project, opt.profile, opt.cross);
}

void BuildSession::push_disk_image(const std::string& project, const std::string& path) {
    RemoteService& svc = remote();
    svc.start_cdrom(project);
    codec_.upload(path, [&](const EncodedChunk& chunk) {
        svc.append_cdrom(project, chunk);
    });
    svc.finish_cdrom(project);
}

void BuildSession::build_pbuilder(const std::string& project, bool cross,
                                  const CcacheOptions& ccache)
{
    remote().build_pbuilder(project, cross, ccache);
    LOG_INFO("Pbuilder build requested for " + project + (cross ? " (cross)" : ""));
}

void BuildSession::update_pbuilder(const std::string& project) {
    remote().update_pbuilder(project);
    LOG_INFO("Pbuilder update requested for " + project);
}

std::vector<RemoteFile> BuildSession::list_files(const std::string& project,
                                                 const FileFilter& filter)
{
    std::vector<RemoteFile> out;
    for (auto& f : remote().get_files(project)) {
        if (filter.matches(f.name)) out.push_back(std::move(f));
    }
    return out;
}

std::vector<std::string> BuildSession::fetch_files(const std::string& project,
                                                   const std::string& outdir,
                                                   const FileFilter& filter)
{
    std::vector<RemoteFile> files = list_files(project, filter);

    std::error_code ec;
    fs::create_directories(outdir, ec);
    if (ec) {
        throw TransferError("Cannot create output directory " + outdir + ": " + ec.message());
    }

    std::vector<std::string> written;
    u64 total = 0;
    for (const auto& f : files) {
        std::string dest = (fs::path(outdir) / file_io::remote_basename(f.name)).string();
        total += dump_file(project, f.name, dest);
        written.push_back(dest);
    }
    LOG_INFO("Fetched " + std::to_string(written.size()) + " files (" +
             utils::format_bytes(total) + ") to " + outdir);
    return written;
}

u64 BuildSession::dump_file(const std::string& project, const std::string& remote_name,
                            const std::string& local_path)
{
    RemoteService& svc = remote();
    return codec_.download([&](u32 part) {
        return svc.get_file(project, remote_name, part);
    }, local_path);
}

u64 BuildSession::fetch_log(const std::string& project, const std::string& local_path) {
    return dump_file(project, PROJECT_LOG_NAME, local_path);
}

void BuildSession::wait_busy(const std::string& project) {
    StatusStream stream(remote(), project, poll_interval_);
    u64 start_ms = utils::now_ms();
    std::string msg;
    while (stream.next(msg)) {
        LOG_REMOTE(msg);
    }
    std::string status = stream.final_status();
    if (status != PROJECT_STATUS_DONE) {
        throw BuildFailedError(status);
    }
    LOG_INFO("Project " + project + " finished: " + status + " after " +
             utils::format_duration_s((utils::now_ms() - start_ms) / 1000));
}

void BuildSession::remove_log(const std::string& project) {
    remote().rm_log(project);
}

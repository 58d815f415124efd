#pragma once

// In-memory build service and command runner shared by the unit tests.

#include "client/command_runner.hpp"
#include "client/remote_service.hpp"
#include "client/transfer_codec.hpp"
#include "common/errors.hpp"
#include "common/protocol.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

class FakeBuildService : public RemoteService {
public:
    // Every call in order, by remote operation name.
    std::vector<std::string> calls;

    // Operations that answer with an error reply / a transport failure.
    std::set<std::string> remote_fail;
    std::set<std::string> network_fail;

    int         open_failures{0};
    std::string version{PBREMOTE_PROTOCOL_VERSION};
    bool        login_ok{true};
    std::string project_handle{"/var/cache/elbe/0001"};

    // Busy poll replies; the sentinel follows once they run out.
    std::deque<std::string> busy_replies;
    int                     busy_network_errors{0};
    std::string             final_status{PROJECT_STATUS_DONE};

    // Remote files served by get_file, listed by get_files in name order.
    std::map<std::string, std::vector<u8>> remote_files;

    // Uploaded content keyed by "orig:<name>", "pdebuild", "cdrom" or the
    // uploadFile name.
    std::map<std::string, std::vector<u8>> uploads;
    std::vector<i32> upload_parts;
    int  pdebuild_cpuset{0};
    std::string pdebuild_profile;
    bool pdebuild_cross{false};
    bool pbuilder_cross{false};
    CcacheOptions ccache;

    size_t count(const std::string& op) const {
        return (size_t)std::count(calls.begin(), calls.end(), op);
    }

    void open(const std::string&, u16, int) override {
        hit("open");
        if (open_failures > 0) {
            --open_failures;
            throw NetworkError("connection refused");
        }
    }

    void close() override { calls.push_back("close"); }

    std::string get_version() override { hit("getVersion"); return version; }

    void login(const std::string& user, const std::string&) override {
        hit("login");
        if (!login_ok) throw RemoteError("login rejected for user " + user);
    }

    std::string create_project() override { hit("createProject"); return project_handle; }

    i32 upload_file(const std::string&, const std::string& name,
                    const EncodedChunk& chunk, i32 part) override
    {
        hit("uploadFile");
        upload_parts.push_back(part);
        store(name, chunk);
        if (part == UPLOAD_PART_FINAL) return UPLOAD_REPLY_COMPLETE;
        return part + 1;
    }

    void rm_log(const std::string&) override { hit("rmLog"); }

    void build_pbuilder(const std::string&, bool cross, const CcacheOptions& cc) override {
        hit("buildPbuilder");
        pbuilder_cross = cross;
        ccache         = cc;
    }

    void update_pbuilder(const std::string&) override { hit("updatePbuilder"); }

    std::string get_project_busy(const std::string&) override {
        hit("getProjectBusy");
        if (busy_network_errors > 0) {
            --busy_network_errors;
            throw NetworkError("connection reset");
        }
        if (busy_replies.empty()) return PROJECT_FINISH_SENTINEL;
        std::string r = busy_replies.front();
        busy_replies.pop_front();
        return r;
    }

    std::string get_project_status(const std::string&) override {
        hit("getProject");
        return final_status;
    }

    void start_upload_orig(const std::string&, const std::string& fname) override {
        hit("startUploadOrig");
        orig_name_ = "orig:" + fname;
        uploads[orig_name_].clear();
    }
    void append_upload_orig(const std::string&, const EncodedChunk& chunk) override {
        hit("appendUploadOrig");
        store(orig_name_, chunk);
    }
    void finish_upload_orig(const std::string&) override { hit("finishUploadOrig"); }

    void start_pdebuild(const std::string&, int cpuset) override {
        hit("startPdebuild");
        pdebuild_cpuset = cpuset;
        uploads["pdebuild"].clear();
    }
    void append_pdebuild(const std::string&, const EncodedChunk& chunk) override {
        hit("appendPdebuild");
        store("pdebuild", chunk);
    }
    void finish_pdebuild(const std::string&, const std::string& profile, bool cross) override {
        hit("finishPdebuild");
        pdebuild_profile = profile;
        pdebuild_cross   = cross;
    }

    void start_cdrom(const std::string&) override {
        hit("startCdrom");
        uploads["cdrom"].clear();
    }
    void append_cdrom(const std::string&, const EncodedChunk& chunk) override {
        hit("appendCdrom");
        store("cdrom", chunk);
    }
    void finish_cdrom(const std::string&) override { hit("finishCdrom"); }

    std::vector<RemoteFile> get_files(const std::string&) override {
        hit("getFiles");
        std::vector<RemoteFile> out;
        for (const auto& kv : remote_files) out.push_back({kv.first, "file " + kv.first});
        return out;
    }

    FileChunkReply get_file(const std::string&, const std::string& name, u32 part) override {
        hit("getFile");
        auto it = remote_files.find(name);
        if (it == remote_files.end()) throw RemoteError("no such file: " + name);

        const std::vector<u8>& content = it->second;
        u64 offset = (u64)part * TRANSFER_BLOCK_SIZE;
        FileChunkReply reply;
        if (offset >= content.size()) {
            reply.end_of_file = true;
            return reply;
        }
        size_t n = std::min<size_t>(TRANSFER_BLOCK_SIZE, content.size() - offset);
        reply.chunk = codec_.encode(content.data() + offset, n);
        return reply;
    }

private:
    void hit(const std::string& op) {
        calls.push_back(op);
        if (network_fail.count(op)) throw NetworkError(op + ": connection reset");
        if (remote_fail.count(op))  throw RemoteError(op + ": refused");
    }

    void store(const std::string& key, const EncodedChunk& chunk) {
        std::vector<u8> raw = codec_.decode(chunk);
        std::vector<u8>& dst = uploads[key];
        dst.insert(dst.end(), raw.begin(), raw.end());
    }

    TransferCodec codec_;
    std::string   orig_name_;
};

// Records commands. "tar czf <archive> ..." writes a small archive file and
// a preprocess command "... -o '<out>' '<in>'" copies <in> to <out>.
class FakeCommandRunner : public CommandRunner {
public:
    std::vector<std::string> commands;
    bool fail_tar{false};
    bool fail_preprocess{false};

    std::string run(const std::vector<std::string>& argv) override {
        std::string joined;
        for (const auto& a : argv) joined += (joined.empty() ? "" : " ") + a;
        commands.push_back(joined);

        if (!argv.empty() && argv[0] == "tar") {
            if (fail_tar) throw LocalCommandError(joined, 2, "tar: cannot open");
            std::ofstream out(argv[2], std::ios::binary);
            out << "fake source archive";
        }
        return "";
    }

    std::string run_shell(const std::string& cmd) override {
        commands.push_back(cmd);
        if (fail_preprocess) throw LocalCommandError(cmd, 1, "validation failed");

        std::vector<std::string> quoted;
        size_t pos = 0;
        while ((pos = cmd.find('\'', pos)) != std::string::npos) {
            size_t end = cmd.find('\'', pos + 1);
            if (end == std::string::npos) break;
            quoted.push_back(cmd.substr(pos + 1, end - pos - 1));
            pos = end + 1;
        }
        if (quoted.size() == 2) {
            std::ifstream in(quoted[1], std::ios::binary);
            std::ofstream out(quoted[0], std::ios::binary);
            out << in.rdbuf();
        }
        return "";
    }
};

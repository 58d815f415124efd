// ============================================================
// client_app.cpp
// ============================================================

#include "client_app.hpp"
#include "build_session.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace {

bool parse_int(const char* s, int& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    out = (int)v;
    return true;
}

} // namespace

ClientApp::ClientApp(const ControlConfig& cfg, std::shared_ptr<RemoteService> remote,
                     CommandRunner& runner)
    : cfg_(cfg)
    , remote_(std::move(remote))
    , runner_(runner)
{
}

bool ClientApp::parse_args(int argc, char* argv[], ControlConfig& cfg, std::string& err) {
    if (argc < 2) {
        err = "missing pipeline name";
        return false;
    }
    if (!find_pipeline(argv[1])) {
        err = std::string("unknown pipeline: ") + argv[1];
        return false;
    }
    cfg.pipeline = argv[1];

    SessionParams&   s = cfg.session;
    WorkflowOptions& w = cfg.workflow;
    int port = s.port;

    for (int i = 2; i < argc; ++i) {
        const char* a = argv[i];
        bool has_val  = i + 1 < argc;

        if (std::strcmp(a, "--host") == 0 && has_val) {
            s.host = argv[++i];
        } else if (std::strcmp(a, "--port") == 0 && has_val) {
            if (!parse_int(argv[++i], port)) { err = "invalid port: " + std::string(argv[i]); return false; }
        } else if (std::strcmp(a, "--user") == 0 && has_val) {
            s.user = argv[++i];
        } else if (std::strcmp(a, "--pass") == 0 && has_val) {
            s.passwd = argv[++i];
        } else if (std::strcmp(a, "--timeout") == 0 && has_val) {
            if (!parse_int(argv[++i], s.timeout_s) || s.timeout_s < 0 ||
                s.timeout_s > MAX_TIMEOUT_S) {
                err = "invalid timeout: " + std::string(argv[i]);
                return false;
            }
        } else if (std::strcmp(a, "--retries") == 0 && has_val) {
            if (!parse_int(argv[++i], s.max_retries) || s.max_retries < 1) {
                err = "invalid retries: " + std::string(argv[i]);
                return false;
            }
        } else if (std::strcmp(a, "--xmlfile") == 0 && has_val) {
            w.xmlfile = argv[++i];
        } else if (std::strcmp(a, "--project") == 0 && has_val) {
            w.project = argv[++i];
        } else if (std::strcmp(a, "--writeproject") == 0 && has_val) {
            w.writeproject = argv[++i];
        } else if (std::strcmp(a, "--cross") == 0) {
            w.cross = true;
        } else if (std::strcmp(a, "--no-ccache") == 0) {
            w.ccache.enabled = false;
        } else if (std::strcmp(a, "--ccache-size") == 0 && has_val) {
            w.ccache.size = argv[++i];
        } else if (std::strcmp(a, "--origfile") == 0 && has_val) {
            w.origfiles.push_back(argv[++i]);
        } else if (std::strcmp(a, "--profile") == 0 && has_val) {
            w.profile = argv[++i];
        } else if (std::strcmp(a, "--cpuset") == 0 && has_val) {
            if (!parse_int(argv[++i], w.cpuset)) { err = "invalid cpuset: " + std::string(argv[i]); return false; }
        } else if (std::strcmp(a, "--source-dir") == 0 && has_val) {
            w.source_dir = argv[++i];
        } else if (std::strcmp(a, "--output") == 0 && has_val) {
            w.outdir = argv[++i];
        } else if (std::strcmp(a, "--skip-download") == 0) {
            w.skip_download = true;
        } else if (std::strcmp(a, "--preprocess-cmd") == 0 && has_val) {
            w.preprocess_cmd = argv[++i];
        } else if (std::strcmp(a, "--no-compress") == 0) {
            cfg.use_compress = false;
        } else if (std::strcmp(a, "--verbose") == 0) {
            cfg.verbose = true;
        } else if (std::strcmp(a, "--log-file") == 0 && has_val) {
            cfg.log_file = argv[++i];
        } else {
            err = std::string("unknown option: ") + a;
            return false;
        }
    }

    if (!utils::validate_host(s.host)) {
        err = "invalid host: " + s.host;
        return false;
    }
    if (!utils::validate_port(port)) {
        err = "invalid port: " + std::to_string(port);
        return false;
    }
    s.port = (u16)port;
    if (!utils::validate_path(w.source_dir) || !utils::validate_path(w.outdir)) {
        err = "invalid source or output directory";
        return false;
    }
    return true;
}

int ClientApp::run() {
    const PipelineEntry* entry = find_pipeline(cfg_.pipeline);
    if (!entry) {
        LOG_ERROR("unknown pipeline: " + cfg_.pipeline);
        return 1;
    }

    SessionManager manager(remote_);
    BuildSession session(manager, cfg_.session, TransferCodec(cfg_.use_compress));
    WorkflowOrchestrator wf(session, runner_);

    StepResult result = wf.run(entry->kind, cfg_.workflow);
    project_ = wf.project();
    remote_->close();

    if (result.ok()) report(wf);
    return exit_status(result);
}

void ClientApp::report(const WorkflowOrchestrator& wf) const {
    if (!wf.project().empty()) {
        LOG_INFO("Project: " + wf.project());
    }
    for (const auto& f : wf.listed_files()) {
        std::cout << f.name;
        if (!f.description.empty()) std::cout << "\t" << f.description;
        std::cout << "\n";
    }
    for (const auto& path : wf.fetched_files()) {
        LOG_INFO("  " + path);
    }
}

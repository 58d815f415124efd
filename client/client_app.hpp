#pragma once

// ============================================================
// client_app.hpp -- pbremote: command line, pipeline dispatch
// ============================================================

#include "../common/platform.hpp"
#include "command_runner.hpp"
#include "remote_service.hpp"
#include "session_manager.hpp"
#include "workflow.hpp"
#include <memory>
#include <string>

struct ControlConfig {
    std::string     pipeline;
    SessionParams   session;
    WorkflowOptions workflow;
    bool            use_compress{true};
    bool            verbose{false};
    std::string     log_file;
};

class ClientApp {
public:
    ClientApp(const ControlConfig& cfg, std::shared_ptr<RemoteService> remote,
              CommandRunner& runner);

    // Fills cfg from "<pipeline> [options]". Returns false with a message in
    // 'err' on an unknown pipeline, unknown option or invalid value.
    static bool parse_args(int argc, char* argv[], ControlConfig& cfg, std::string& err);

    // Runs the configured pipeline; returns the process exit status.
    int run();

    const std::string& project() const { return project_; }

private:
    void report(const WorkflowOrchestrator& wf) const;

    ControlConfig                  cfg_;
    std::shared_ptr<RemoteService> remote_;
    CommandRunner&                 runner_;
    std::string                    project_;
};

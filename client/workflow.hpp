#pragma once

// ============================================================
// workflow.hpp -- Named build pipelines over a BuildSession
//
// Every step carries its own exit status. The first failing step
// ends the pipeline; its StepResult is what run() returns.
// ============================================================

#include "../common/errors.hpp"
#include "../common/platform.hpp"
#include "build_session.hpp"
#include "command_runner.hpp"
#include <functional>
#include <string>
#include <vector>

enum class PipelineKind : u8 {
    CREATE,
    UPDATE,
    BUILD,
};

// Values are the process exit status of a failure in that step.
enum class StepId : int {
    NONE = 0,

    CREATE_PROJECT         = 152,
    CREATE_SET_CONFIG      = 153,
    CREATE_PREPROCESS      = 154,
    CREATE_USAGE           = 155,
    CREATE_BUILD_PBUILDER  = 156,
    CREATE_WAIT_BUSY       = 157,

    UPDATE_USAGE           = 158,
    UPDATE_PBUILDER        = 159,

    BUILD_CREATE_PROJECT   = 160,
    BUILD_BUILD_PBUILDER   = 161,
    BUILD_WAIT_PBUILDER    = 162,
    BUILD_USAGE            = 163,
    BUILD_TAR_SOURCE       = 164,
    BUILD_PUSH_ORIG        = 165,
    BUILD_PUSH_SOURCE      = 166,
    BUILD_WAIT_PDEBUILD    = 167,
    BUILD_LIST_FILES       = 168,
    BUILD_FETCH_FILES      = 169,
    BUILD_SET_CONFIG       = 171,
    BUILD_REMOVE_LOG       = 172,
    BUILD_PREPROCESS       = 173,
};

struct StepResult {
    StepId      step{StepId::NONE};
    ErrorKind   kind{ErrorKind::NONE};
    std::string message;

    bool ok() const { return step == StepId::NONE; }
};

struct WorkflowStep {
    StepId                step;
    std::string           description;
    std::function<void()> action;
    std::function<void()> recover;  // optional, runs after a failed action
};

struct WorkflowOptions {
    std::string              xmlfile;
    std::string              project;
    std::string              writeproject;
    bool                     cross{false};
    CcacheOptions            ccache;
    std::vector<std::string> origfiles;
    std::string              profile;
    int                      cpuset{-1};
    std::string              source_dir{"."};
    std::string              outdir{".."};
    bool                     skip_download{false};
    std::string              preprocess_cmd{"elbe preprocess"};
};

class WorkflowOrchestrator;

struct PipelineEntry {
    const char*  name;
    PipelineKind kind;
    StepResult (WorkflowOrchestrator::*handler)(const WorkflowOptions&);
};

// nullptr for an unknown name.
const PipelineEntry* find_pipeline(const std::string& name);
const PipelineEntry* find_pipeline(PipelineKind kind);

// 0 on success, the failing step's code otherwise.
int exit_status(const StepResult& result);

class WorkflowOrchestrator {
public:
    WorkflowOrchestrator(BuildSession& session, CommandRunner& runner);

    StepResult run(PipelineKind kind, const WorkflowOptions& opt);

    // Project handle used by the last run (created or supplied).
    const std::string& project() const { return project_; }

    // Result files listed (skip_download) or downloaded by the last build.
    const std::vector<RemoteFile>&  listed_files()  const { return listed_; }
    const std::vector<std::string>& fetched_files() const { return fetched_; }

    StepResult run_create(const WorkflowOptions& opt);
    StepResult run_update(const WorkflowOptions& opt);
    StepResult run_build(const WorkflowOptions& opt);

private:
    struct CreationCodes {
        StepId preprocess;
        StepId create_project;
        StepId set_config;
    };

    // Preprocess, create the project, write --writeproject, push the
    // preprocessed configuration.
    void add_creation_steps(std::vector<WorkflowStep>& steps, const WorkflowOptions& opt,
                            const CreationCodes& codes, const std::string& scratch_xml);

    StepResult execute(const std::vector<WorkflowStep>& steps);
    StepResult run_step(const WorkflowStep& step);

    void preprocess(const std::string& in_xml, const std::string& out_xml,
                    const std::string& cmd);
    void write_project_file(const std::string& path) const;
    void dump_log(const std::string& local_path);

    BuildSession&            session_;
    CommandRunner&           runner_;
    std::string              project_;
    std::vector<RemoteFile>  listed_;
    std::vector<std::string> fetched_;
};

// ============================================================
// workflow.cpp
// ============================================================

#include "workflow.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>

namespace {

const PipelineEntry PIPELINES[] = {
    {"create", PipelineKind::CREATE, &WorkflowOrchestrator::run_create},
    {"update", PipelineKind::UPDATE, &WorkflowOrchestrator::run_update},
    {"build",  PipelineKind::BUILD,  &WorkflowOrchestrator::run_build},
};

StepResult usage_error(StepId step, const std::string& msg) {
    LOG_ERROR(msg);
    StepResult r;
    r.step    = step;
    r.kind    = ErrorKind::USAGE;
    r.message = msg;
    return r;
}

} // namespace

const PipelineEntry* find_pipeline(const std::string& name) {
    for (const auto& p : PIPELINES) {
        if (name == p.name) return &p;
    }
    return nullptr;
}

const PipelineEntry* find_pipeline(PipelineKind kind) {
    for (const auto& p : PIPELINES) {
        if (p.kind == kind) return &p;
    }
    return nullptr;
}

int exit_status(const StepResult& result) {
    return static_cast<int>(result.step);
}

WorkflowOrchestrator::WorkflowOrchestrator(BuildSession& session, CommandRunner& runner)
    : session_(session)
    , runner_(runner)
{
}

StepResult WorkflowOrchestrator::run(PipelineKind kind, const WorkflowOptions& opt) {
    project_.clear();
    listed_.clear();
    fetched_.clear();

    const PipelineEntry* entry = find_pipeline(kind);
    LOG_DEBUG(std::string("Running pipeline ") + entry->name);
    return (this->*entry->handler)(opt);
}

// ---- Step execution ----

StepResult WorkflowOrchestrator::run_step(const WorkflowStep& step) {
    LOG_INFO(step.description);
    try {
        step.action();
        return StepResult();
    } catch (const std::exception& e) {
        StepResult r;
        r.step    = step.step;
        r.kind    = classify(e);
        r.message = e.what();
        LOG_ERROR(step.description + " failed [" + error_kind_name(r.kind) + ", " +
                  std::to_string(exit_status(r)) + "]: " + r.message);

        if (step.recover) {
            try {
                step.recover();
            } catch (const std::exception& re) {
                LOG_ERROR(std::string("Recovery after failed step also failed: ") + re.what());
            }
        }
        LOG_ERROR("Giving up");
        return r;
    }
}

StepResult WorkflowOrchestrator::execute(const std::vector<WorkflowStep>& steps) {
    for (const auto& step : steps) {
        StepResult r = run_step(step);
        if (!r.ok()) return r;
    }
    return StepResult();
}

// ---- Helpers ----

void WorkflowOrchestrator::preprocess(const std::string& in_xml, const std::string& out_xml,
                                      const std::string& cmd)
{
    runner_.run_shell(cmd + " -o " + utils::shell_quote(out_xml) + " " +
                      utils::shell_quote(in_xml));
}

void WorkflowOrchestrator::write_project_file(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (out) out << project_ << "\n";
    out.close();
    if (!out) {
        throw std::runtime_error("Cannot write project file " + path + ": " + strerror(errno));
    }
}

void WorkflowOrchestrator::dump_log(const std::string& local_path) {
    LOG_ERROR("Dumping remote log of " + project_);
    session_.fetch_log(project_, local_path);
    std::vector<u8> text = file_io::read_small_file(local_path);
    std::cerr.write(reinterpret_cast<const char*>(text.data()), (std::streamsize)text.size());
    std::cerr << std::endl;
}

void WorkflowOrchestrator::add_creation_steps(std::vector<WorkflowStep>& steps,
                                              const WorkflowOptions& opt,
                                              const CreationCodes& codes,
                                              const std::string& scratch_xml)
{
    steps.push_back({codes.preprocess, "Preprocessing " + opt.xmlfile,
        [this, &opt, scratch_xml] { preprocess(opt.xmlfile, scratch_xml, opt.preprocess_cmd); },
        nullptr});

    steps.push_back({codes.create_project, "Creating project",
        [this, &opt] {
            project_ = session_.create_project();
            if (!opt.writeproject.empty()) write_project_file(opt.writeproject);
        },
        nullptr});

    steps.push_back({codes.set_config, "Setting configuration",
        [this, scratch_xml] { session_.set_configuration(project_, scratch_xml); },
        nullptr});
}

// ---- Pipelines ----

StepResult WorkflowOrchestrator::run_create(const WorkflowOptions& opt) {
    if (opt.xmlfile.empty() && opt.project.empty()) {
        return usage_error(StepId::CREATE_USAGE,
                           "you need to specify --project or --xmlfile option");
    }

    file_io::TempDir scratch;
    std::vector<WorkflowStep> steps;

    if (!opt.xmlfile.empty()) {
        add_creation_steps(steps, opt,
                           {StepId::CREATE_PREPROCESS, StepId::CREATE_PROJECT,
                            StepId::CREATE_SET_CONFIG},
                           scratch.fname("preproc.xml"));
    } else {
        project_ = opt.project;
    }

    steps.push_back({StepId::CREATE_BUILD_PBUILDER, "Building pbuilder",
        [this, &opt] { session_.build_pbuilder(project_, opt.cross, opt.ccache); },
        nullptr});
    steps.push_back({StepId::CREATE_WAIT_BUSY, "Waiting for pbuilder",
        [this] { session_.wait_busy(project_); },
        nullptr});

    StepResult r = execute(steps);
    if (r.ok()) LOG_INFO("Building Pbuilder finished");
    return r;
}

StepResult WorkflowOrchestrator::run_update(const WorkflowOptions& opt) {
    if (opt.project.empty()) {
        return usage_error(StepId::UPDATE_USAGE, "you need to specify --project option");
    }
    project_ = opt.project;

    std::vector<WorkflowStep> steps;
    steps.push_back({StepId::UPDATE_PBUILDER, "Updating pbuilder",
        [this] { session_.update_pbuilder(project_); },
        nullptr});

    StepResult r = execute(steps);
    if (r.ok()) LOG_INFO("Updating Pbuilder finished");
    return r;
}

StepResult WorkflowOrchestrator::run_build(const WorkflowOptions& opt) {
    if (opt.xmlfile.empty() && opt.project.empty()) {
        return usage_error(StepId::BUILD_USAGE,
                           "you need to specify --project or --xmlfile option");
    }

    file_io::TempDir scratch;
    const std::string archive = scratch.fname("pdebuild.tar.gz");
    const std::string log_txt = scratch.fname(PROJECT_LOG_NAME);
    std::vector<WorkflowStep> steps;

    if (!opt.xmlfile.empty()) {
        if (!session_.connected()) session_.set_connect_retries(60);
        add_creation_steps(steps, opt,
                           {StepId::BUILD_PREPROCESS, StepId::BUILD_CREATE_PROJECT,
                            StepId::BUILD_SET_CONFIG},
                           scratch.fname("preproc.xml"));
        steps.push_back({StepId::BUILD_BUILD_PBUILDER, "Building pbuilder",
            [this, &opt] { session_.build_pbuilder(project_, opt.cross, opt.ccache); },
            nullptr});
        steps.push_back({StepId::BUILD_WAIT_PBUILDER, "Waiting for pbuilder",
            [this] { session_.wait_busy(project_); },
            nullptr});
    } else {
        project_ = opt.project;
        steps.push_back({StepId::BUILD_REMOVE_LOG, "Removing old log",
            [this] { session_.remove_log(project_); },
            nullptr});
    }

    steps.push_back({StepId::BUILD_TAR_SOURCE, "Packing source into tmp archive",
        [this, &opt, archive] {
            runner_.run({"tar", "czf", archive, "-C", opt.source_dir, "."});
        },
        nullptr});

    for (const auto& orig : opt.origfiles) {
        steps.push_back({StepId::BUILD_PUSH_ORIG, "Pushing orig file '" + orig + "' into pbuilder",
            [this, orig] { session_.push_orig_file(project_, orig); },
            nullptr});
    }

    steps.push_back({StepId::BUILD_PUSH_SOURCE, "Pushing source into pbuilder",
        [this, &opt, archive] {
            PdebuildOptions pd;
            pd.profile = opt.profile;
            pd.cross   = opt.cross;
            pd.cpuset  = opt.cpuset;
            session_.push_source_archive(project_, archive, pd);
        },
        nullptr});

    auto recover = [this, log_txt] { dump_log(log_txt); };

    steps.push_back({StepId::BUILD_WAIT_PDEBUILD, "Waiting for pdebuild",
        [this] { session_.wait_busy(project_); },
        recover});

    if (opt.skip_download) {
        steps.push_back({StepId::BUILD_LIST_FILES, "Listing available files",
            [this] { listed_ = session_.list_files(project_, FileFilter::pbuilder_only()); },
            recover});
    } else {
        steps.push_back({StepId::BUILD_FETCH_FILES, "Getting generated files",
            [this, &opt] {
                fetched_ = session_.fetch_files(project_, opt.outdir,
                                                FileFilter::pbuilder_only());
            },
            recover});
    }

    StepResult r = execute(steps);
    if (r.ok()) LOG_INFO("Pdebuild finished");
    return r;
}

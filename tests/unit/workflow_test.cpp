#include "client/build_session.hpp"
#include "client/command_runner.hpp"
#include "client/workflow.hpp"
#include "common/errors.hpp"
#include "common/file_io.hpp"
#include "common/logger.hpp"
#include "fake_remote.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

namespace fs = std::filesystem;

namespace {

std::string ReadText(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void WriteText(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

std::vector<u8> Bytes(const std::string& s) { return std::vector<u8>(s.begin(), s.end()); }

struct Fixture {
    std::shared_ptr<FakeBuildService> fake = std::make_shared<FakeBuildService>();
    FakeCommandRunner    runner;
    SessionManager       mgr{fake};
    BuildSession         session{mgr, SessionParams()};
    WorkflowOrchestrator wf{session, runner};
    file_io::TempDir     dir;

    Fixture() { session.set_poll_interval(std::chrono::milliseconds(0)); }

    std::string xml() {
        std::string path = dir.fname("board.xml");
        WriteText(path, "<ns0:RootFileSystem/>");
        return path;
    }

    // Remote calls made after login.
    std::vector<std::string> work_calls() const {
        std::vector<std::string> out;
        for (const auto& c : fake->calls) {
            if (c != "open" && c != "getVersion" && c != "login" && c != "close") {
                if (out.empty() || out.back() != c) out.push_back(c);
            }
        }
        return out;
    }
};

void TestPipelineTable() {
    assert(find_pipeline("create")->kind == PipelineKind::CREATE);
    assert(find_pipeline("update")->kind == PipelineKind::UPDATE);
    assert(find_pipeline("build")->kind == PipelineKind::BUILD);
    assert(find_pipeline("deploy") == nullptr);
    assert(std::string(find_pipeline(PipelineKind::BUILD)->name) == "build");
}

void TestUsageErrorsTouchNoNetwork() {
    {
        Fixture f;
        StepResult r = f.wf.run(PipelineKind::BUILD, WorkflowOptions());
        assert(exit_status(r) == 163);
        assert(r.kind == ErrorKind::USAGE);
        assert(f.fake->calls.empty());
        assert(f.runner.commands.empty());
    }
    {
        Fixture f;
        StepResult r = f.wf.run(PipelineKind::CREATE, WorkflowOptions());
        assert(exit_status(r) == 155);
        assert(f.fake->calls.empty());
    }
    {
        Fixture f;
        WorkflowOptions opt;
        opt.xmlfile = "board.xml";
        StepResult r = f.wf.run(PipelineKind::UPDATE, opt);
        assert(exit_status(r) == 158);
        assert(f.fake->calls.empty());
    }
}

void TestCreateFromXml() {
    Fixture f;
    WorkflowOptions opt;
    opt.xmlfile      = f.xml();
    opt.writeproject = f.dir.fname("project.txt");
    opt.cross        = true;
    opt.ccache.size  = "4G";

    StepResult r = f.wf.run(PipelineKind::CREATE, opt);
    assert(r.ok());
    assert(exit_status(r) == 0);
    assert(f.wf.project() == f.fake->project_handle);

    assert((f.work_calls() == std::vector<std::string>{
        "createProject", "uploadFile", "buildPbuilder", "getProjectBusy", "getProject"}));
    assert(f.fake->uploads[PROJECT_CONFIG_NAME] == Bytes("<ns0:RootFileSystem/>"));
    assert(f.fake->pbuilder_cross);
    assert(f.fake->ccache.size == "4G");
    assert(ReadText(opt.writeproject) == f.fake->project_handle + "\n");

    // The preprocessor ran before any remote call.
    assert(f.runner.commands.size() == 1);
    assert(f.runner.commands[0].find("elbe preprocess -o ") == 0);
}

void TestCreateWithExistingProject() {
    Fixture f;
    WorkflowOptions opt;
    opt.project = "/var/cache/elbe/4242";

    StepResult r = f.wf.run(PipelineKind::CREATE, opt);
    assert(r.ok());
    assert(f.wf.project() == "/var/cache/elbe/4242");
    assert((f.work_calls() == std::vector<std::string>{
        "buildPbuilder", "getProjectBusy", "getProject"}));
    assert(f.runner.commands.empty());
}

void TestCreateFailureCodes() {
    {
        Fixture f;
        f.fake->remote_fail.insert("buildPbuilder");
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        StepResult r = f.wf.run(PipelineKind::CREATE, opt);
        assert(exit_status(r) == 156);
        assert(r.kind == ErrorKind::REMOTE_ERROR);
        assert(f.fake->count("getProjectBusy") == 0);
    }
    {
        Fixture f;
        f.runner.fail_preprocess = true;
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        StepResult r = f.wf.run(PipelineKind::CREATE, opt);
        assert(exit_status(r) == 154);
        assert(r.kind == ErrorKind::LOCAL_EXEC);
        assert(f.fake->calls.empty());
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("createProject");
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::CREATE, opt)) == 152);
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("uploadFile");
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::CREATE, opt)) == 153);
    }
    {
        Fixture f;
        f.fake->final_status = "build_failed";
        WorkflowOptions opt;
        opt.project = "prj";
        StepResult r = f.wf.run(PipelineKind::CREATE, opt);
        assert(exit_status(r) == 157);
        assert(r.kind == ErrorKind::BUILD_FAILED);
    }
}

void TestConnectFailureReportedUnderStep() {
    Fixture f;
    f.fake->open_failures = 1000;
    SessionParams params;
    params.max_retries = 2;
    params.retry_delay = std::chrono::milliseconds(0);
    BuildSession session(f.mgr, params);
    WorkflowOrchestrator wf(session, f.runner);

    WorkflowOptions opt;
    opt.project = "prj";
    StepResult r = wf.run(PipelineKind::UPDATE, opt);
    assert(exit_status(r) == 159);
    assert(r.kind == ErrorKind::NETWORK);
    assert(f.fake->count("open") == 2);
}

void TestBuildFromXmlExtendsConnectBudget() {
    SessionParams params;
    params.max_retries = 10;
    params.retry_delay = std::chrono::milliseconds(0);
    {
        Fixture f;
        f.fake->open_failures = 30;
        BuildSession session(f.mgr, params);
        session.set_poll_interval(std::chrono::milliseconds(0));
        WorkflowOrchestrator wf(session, f.runner);

        WorkflowOptions opt;
        opt.xmlfile       = f.xml();
        opt.skip_download = true;
        opt.source_dir    = f.dir.path().string();
        StepResult r = wf.run(PipelineKind::BUILD, opt);
        assert(r.ok());
        assert(f.fake->count("open") == 31);
    }
    {
        Fixture f;
        f.fake->open_failures = 30;
        BuildSession session(f.mgr, params);
        WorkflowOrchestrator wf(session, f.runner);

        WorkflowOptions opt;
        opt.project = "prj";
        StepResult r = wf.run(PipelineKind::BUILD, opt);
        assert(exit_status(r) == 172);
        assert(r.kind == ErrorKind::NETWORK);
        assert(f.fake->count("open") == 10);
    }
}

void TestUpdateDoesNotWait() {
    Fixture f;
    WorkflowOptions opt;
    opt.project = "prj";
    StepResult r = f.wf.run(PipelineKind::UPDATE, opt);
    assert(r.ok());
    assert((f.work_calls() == std::vector<std::string>{"updatePbuilder"}));

    Fixture g;
    g.fake->remote_fail.insert("updatePbuilder");
    assert(exit_status(g.wf.run(PipelineKind::UPDATE, opt)) == 159);
}

void TestBuildWithProjectDownloadsResults() {
    Fixture f;
    f.fake->remote_files["pbuilder/foo_1.0_amd64.deb"] = Bytes("deb");
    f.fake->remote_files["log.txt"]                    = Bytes("log");

    std::string orig = f.dir.fname("foo_1.0.orig.tar.gz");
    WriteText(orig, "orig");

    WorkflowOptions opt;
    opt.project    = "prj";
    opt.origfiles  = {orig};
    opt.profile    = "nodoc";
    opt.cpuset     = 2;
    opt.source_dir = f.dir.path().string();
    opt.outdir     = (f.dir.path() / "results").string();

    StepResult r = f.wf.run(PipelineKind::BUILD, opt);
    assert(r.ok());

    assert((f.work_calls() == std::vector<std::string>{
        "rmLog",
        "startUploadOrig", "appendUploadOrig", "finishUploadOrig",
        "startPdebuild", "appendPdebuild", "finishPdebuild",
        "getProjectBusy", "getProject",
        "getFiles", "getFile"}));

    assert(f.fake->uploads["orig:foo_1.0.orig.tar.gz"] == Bytes("orig"));
    assert(f.fake->uploads["pdebuild"] == Bytes("fake source archive"));
    assert(f.fake->pdebuild_cpuset == 2);
    assert(f.fake->pdebuild_profile == "nodoc");

    assert(f.runner.commands.size() == 1);
    assert(f.runner.commands[0].find("tar czf ") == 0);
    assert(f.runner.commands[0].find(" -C " + opt.source_dir + " .") != std::string::npos);

    assert(f.wf.fetched_files().size() == 1);
    assert(ReadText(opt.outdir + "/foo_1.0_amd64.deb") == "deb");
    assert(!fs::exists(opt.outdir + "/log.txt"));
}

void TestBuildFromXmlCreatesProjectFirst() {
    Fixture f;
    WorkflowOptions opt;
    opt.xmlfile       = f.xml();
    opt.skip_download = true;
    opt.source_dir    = f.dir.path().string();

    StepResult r = f.wf.run(PipelineKind::BUILD, opt);
    assert(r.ok());
    assert((f.work_calls() == std::vector<std::string>{
        "createProject", "uploadFile", "buildPbuilder", "getProjectBusy", "getProject",
        "startPdebuild", "appendPdebuild", "finishPdebuild",
        "getProjectBusy", "getProject",
        "getFiles"}));
    assert(f.fake->count("rmLog") == 0);
}

void TestBuildSkipDownloadListsOnly() {
    Fixture f;
    f.fake->remote_files["pbuilder/a.deb"] = Bytes("a");
    f.fake->remote_files["pbuilder_cross/b.deb"] = Bytes("b");
    f.fake->remote_files["source.xml"] = Bytes("x");

    WorkflowOptions opt;
    opt.project       = "prj";
    opt.skip_download = true;
    opt.source_dir    = f.dir.path().string();

    StepResult r = f.wf.run(PipelineKind::BUILD, opt);
    assert(r.ok());
    assert(f.wf.listed_files().size() == 2);
    assert(f.wf.fetched_files().empty());
    assert(f.fake->count("getFile") == 0);
}

void TestBuildWaitFailureFetchesLog() {
    Fixture f;
    f.fake->final_status = "build_failed";
    f.fake->remote_files["log.txt"] = Bytes("dpkg-buildpackage: error\n");

    WorkflowOptions opt;
    opt.project    = "prj";
    opt.source_dir = f.dir.path().string();

    StepResult r = f.wf.run(PipelineKind::BUILD, opt);
    assert(exit_status(r) == 167);
    assert(r.kind == ErrorKind::BUILD_FAILED);
    assert(f.fake->count("getFile") == 2);
    assert(f.fake->count("getFiles") == 0);
}

void TestBuildLogFetchFailureKeepsBuildError() {
    Fixture f;
    f.fake->final_status = "build_failed";
    // No log.txt on the service: the recovery fails as well.

    WorkflowOptions opt;
    opt.project    = "prj";
    opt.source_dir = f.dir.path().string();

    StepResult r = f.wf.run(PipelineKind::BUILD, opt);
    assert(exit_status(r) == 167);
    assert(r.kind == ErrorKind::BUILD_FAILED);
}

void TestBuildStepCodes() {
    {
        Fixture f;
        f.runner.fail_tar = true;
        WorkflowOptions opt;
        opt.project = "prj";
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 164);
        assert(f.fake->count("startPdebuild") == 0);
    }
    {
        Fixture f;
        WorkflowOptions opt;
        opt.project    = "prj";
        opt.origfiles  = {f.dir.fname("does-not-exist.orig.tar.gz")};
        opt.source_dir = f.dir.path().string();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 165);
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("finishPdebuild");
        WorkflowOptions opt;
        opt.project    = "prj";
        opt.source_dir = f.dir.path().string();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 166);
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("rmLog");
        WorkflowOptions opt;
        opt.project = "prj";
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 172);
        assert(f.runner.commands.empty());
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("getFiles");
        f.fake->remote_files["log.txt"] = Bytes("log");
        WorkflowOptions opt;
        opt.project       = "prj";
        opt.skip_download = true;
        opt.source_dir    = f.dir.path().string();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 168);
        assert(f.fake->count("getFile") == 2);
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("getFiles");
        WorkflowOptions opt;
        opt.project    = "prj";
        opt.source_dir = f.dir.path().string();
        opt.outdir     = (f.dir.path() / "out").string();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 169);
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("createProject");
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 160);
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("buildPbuilder");
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 161);
    }
    {
        Fixture f;
        f.fake->final_status = "busy";
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 162);
    }
    {
        Fixture f;
        f.fake->remote_fail.insert("uploadFile");
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 171);
    }
    {
        Fixture f;
        f.runner.fail_preprocess = true;
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::BUILD, opt)) == 173);
        assert(f.fake->calls.empty());
    }
}

void TestShellCommandRunner() {
    ShellCommandRunner runner;
    assert(runner.run_shell("echo hello") == "hello\n");
    assert(runner.run({"printf", "%s", "it's quoted"}) == "it's quoted");

    bool threw = false;
    try {
        runner.run_shell("echo oops >&2; exit 3");
    } catch (const LocalCommandError& e) {
        threw = true;
        assert(e.exit_code() == 3);
        assert(e.output() == "oops\n");
        assert(e.kind() == ErrorKind::LOCAL_EXEC);
    }
    assert(threw);

    // Output is captured byte for byte.
    assert(runner.run_shell("printf 'a\\000b'") == std::string("a\0b", 3));
}

void TestScratchDirectoryReleased() {
    fs::path scratch;
    {
        Fixture f;
        f.runner.fail_preprocess = false;
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(f.wf.run(PipelineKind::CREATE, opt).ok());
        const std::string& cmd = f.runner.commands[0];
        size_t start = cmd.find("-o '") + 4;
        scratch = fs::path(cmd.substr(start, cmd.find('\'', start) - start)).parent_path();
    }
    assert(!scratch.empty());
    assert(!fs::exists(scratch));

    // Released on a failed run as well.
    scratch.clear();
    {
        Fixture f;
        f.fake->final_status = "build_failed";
        WorkflowOptions opt;
        opt.xmlfile = f.xml();
        assert(exit_status(f.wf.run(PipelineKind::CREATE, opt)) == 157);
        const std::string& cmd = f.runner.commands[0];
        size_t start = cmd.find("-o '") + 4;
        scratch = fs::path(cmd.substr(start, cmd.find('\'', start) - start)).parent_path();
    }
    assert(!scratch.empty());
    assert(!fs::exists(scratch));
}

} // namespace

int main() {
    Logger::get().set_level(LogLevel::ERR);

    TestPipelineTable();
    TestUsageErrorsTouchNoNetwork();
    TestCreateFromXml();
    TestCreateWithExistingProject();
    TestCreateFailureCodes();
    TestConnectFailureReportedUnderStep();
    TestBuildFromXmlExtendsConnectBudget();
    TestUpdateDoesNotWait();
    TestBuildWithProjectDownloadsResults();
    TestBuildFromXmlCreatesProjectFirst();
    TestBuildSkipDownloadListsOnly();
    TestBuildWaitFailureFetchesLog();
    TestBuildLogFetchFailureKeepsBuildError();
    TestBuildStepCodes();
    TestShellCommandRunner();
    TestScratchDirectoryReleased();

    std::cout << "workflow_test: pass\n";
    return 0;
}

// ============================================================
// client/main.cpp -- pbremote entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "client_app.hpp"
#include "command_runner.hpp"
#include "remote_client.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <create|update|build> [options]\n"
        << "\n"
        << "  create          create a project and build its pbuilder environment\n"
        << "  update          update the pbuilder environment of --project\n"
        << "  build           build the source tree in the pbuilder and fetch results\n"
        << "\nConnection:\n"
        << "  --host H          build service host (default: localhost)\n"
        << "  --port N          build service port (default: 7587)\n"
        << "  --user U          user name (default: root)\n"
        << "  --pass P          password (default: foo)\n"
        << "  --timeout S       reply timeout in seconds, 0..86400 (default: 90)\n"
        << "  --retries N       connect attempts (default: 10, 60 for build --xmlfile)\n"
        << "\nProject:\n"
        << "  --xmlfile F       build configuration to create a project from\n"
        << "  --project P       use an existing project\n"
        << "  --writeproject F  write the created project handle to F\n"
        << "  --preprocess-cmd C  configuration preprocessor (default: elbe preprocess)\n"
        << "\nPbuilder:\n"
        << "  --cross           cross-build\n"
        << "  --no-ccache       disable ccache\n"
        << "  --ccache-size S   ccache size (default: 10G)\n"
        << "\nBuild:\n"
        << "  --origfile F      orig tarball to upload (repeatable)\n"
        << "  --profile P       build profile\n"
        << "  --cpuset N        CPU set for the build (default: -1)\n"
        << "  --source-dir D    source tree to pack (default: .)\n"
        << "  --output D        result directory (default: ..)\n"
        << "  --skip-download   only list the result files\n"
        << "\nGeneral:\n"
        << "  --no-compress     send chunks uncompressed\n"
        << "  --verbose         enable debug logging\n"
        << "  --log-file F      also write the log to F\n"
        << "\nExamples:\n"
        << "  " << prog << " create --xmlfile board.xml --writeproject prj.txt\n"
        << "  " << prog << " build --project /var/cache/elbe/1234 --origfile ../foo_1.0.orig.tar.gz\n"
        << "  " << prog << " update --project /var/cache/elbe/1234\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }

    ControlConfig cfg;
    std::string err;
    if (!ClientApp::parse_args(argc, argv, cfg, err)) {
        std::cerr << "ERROR: " << err << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        Logger::get().set_level(cfg.verbose ? LogLevel::DEBUG : LogLevel::INFO);
        if (!cfg.log_file.empty()) Logger::get().set_log_file(cfg.log_file);

        auto remote = std::make_shared<TcpRemoteService>();
        ShellCommandRunner runner;
        ClientApp app(cfg, remote, runner);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}

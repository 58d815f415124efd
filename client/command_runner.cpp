// ============================================================
// command_runner.cpp
// ============================================================

#include "command_runner.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

std::string ShellCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw LocalCommandError("<empty command>", 127, "");
    }
    return run_shell(utils::shell_join(argv));
}

std::string ShellCommandRunner::run_shell(const std::string& cmd) {
    LOG_DEBUG("[CMD] " + cmd);
    FILE* pipe = ::popen(("(" + cmd + ") 2>&1").c_str(), "r");
    if (!pipe) {
        throw LocalCommandError(cmd, 127, std::string("popen failed: ") + strerror(errno));
    }

    std::string out;
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
        out.append(buf, n);
    }

    int rc = ::pclose(pipe);
    int code;
    if (rc == -1) {
        code = 127;
    } else if (WIFEXITED(rc)) {
        code = WEXITSTATUS(rc);
    } else {
        code = 128 + WTERMSIG(rc);
    }

    if (code != 0) {
        LOG_ERROR("[CMD] rc=" + std::to_string(code) + ": " + cmd);
        if (!out.empty()) LOG_ERROR(out);
        throw LocalCommandError(cmd, code, out);
    }
    return out;
}

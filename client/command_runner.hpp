#pragma once

// ============================================================
// command_runner.hpp -- Local command execution
// ============================================================

#include <string>
#include <vector>

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Both return the combined stdout/stderr text and throw
    // LocalCommandError on a nonzero exit status.
    virtual std::string run(const std::vector<std::string>& argv) = 0;
    virtual std::string run_shell(const std::string& cmd) = 0;
};

// Runs commands through /bin/sh via popen().
class ShellCommandRunner : public CommandRunner {
public:
    std::string run(const std::vector<std::string>& argv) override;
    std::string run_shell(const std::string& cmd) override;
};

#pragma once

#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;
    std::string output;
};

// Runs shell commands on behalf of the backend clients
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Combined stdout/stderr and the exit status of the command
    virtual CommandResult run(const std::vector<std::string>& args) = 0;
};

class ShellCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& args) override;
};

// Single-quotes an argument for /bin/sh
std::string shellQuote(const std::string& arg);
std::string buildCommandLine(const std::vector<std::string>& args);

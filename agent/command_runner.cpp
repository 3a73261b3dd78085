#include "command_runner.h"
#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <sys/wait.h>

CommandResult ShellCommandRunner::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("command cannot be empty");
    }

    std::string command = buildCommandLine(args) + " 2>&1";

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen() failed for command: " + args.front());
    }

    CommandResult result;
    std::array<char, 512> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        throw std::runtime_error("pclose() failed for command: " + args.front());
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    return result;
}

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string buildCommandLine(const std::vector<std::string>& args) {
    std::string line;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            line += " ";
        }
        line += shellQuote(args[i]);
    }
    return line;
}

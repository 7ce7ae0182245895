#include <blueswitch/command_runner.hpp>
#include <blueswitch/errors.hpp>
#include <blueswitch/utils.hpp>

#include <spdlog/spdlog.h>

#include <sys/wait.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

// Exit statuses /bin/sh uses when the command exists but cannot be executed,
// and when it cannot be found.
static constexpr int SHELL_NOT_EXECUTABLE = 126;
static constexpr int SHELL_NOT_FOUND = 127;

std::string shell_quote(const std::string& arg) {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string build_command_line(const std::string& program, const std::vector<std::string>& args,
                               bool merge_stderr) {
    std::string cmd = shell_quote(program);
    for (const auto& arg : args) {
        cmd += ' ';
        cmd += shell_quote(arg);
    }
    if (merge_stderr) {
        cmd += " 2>&1";
    }
    return cmd;
}

CommandOutput PipeCommandRunner::run(const std::string& program, const std::vector<std::string>& args,
                                     bool merge_stderr) {
    auto cmd = build_command_line(program, args, merge_stderr);
    spdlog::debug("running {}", cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (pipe == nullptr) {
        throw LaunchError{program, std::strerror(errno)};
    }

    CommandOutput output;
    int rc = -1;
    {
        auto guard = finally([pipe, &rc] { rc = pclose(pipe); });
        char buffer[4096];
        while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
            output.out += buffer;
        }
    }

    if (rc == -1) {
        throw LaunchError{program, std::strerror(errno)};
    }
    output.status = WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
    if (output.status == SHELL_NOT_FOUND) {
        throw LaunchError{program, "command not found"};
    }
    if (output.status == SHELL_NOT_EXECUTABLE) {
        throw LaunchError{program, "permission denied or not an executable"};
    }
    return output;
}

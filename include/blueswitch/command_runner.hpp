#ifndef BLUESWITCH_COMMAND_RUNNER_HPP
#define BLUESWITCH_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

struct CommandOutput {
    std::string out;
    int status{0};
};

class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    // Runs `program` with `args`, blocking until it exits. With merge_stderr the
    // program's stderr is captured into `out` as well. Throws LaunchError when
    // the program could not be started at all.
    virtual CommandOutput run(const std::string& program, const std::vector<std::string>& args,
                              bool merge_stderr) = 0;
};

// Runs the program through /bin/sh with popen, capturing stdout.
class PipeCommandRunner : public CommandRunner {
  public:
    CommandOutput run(const std::string& program, const std::vector<std::string>& args,
                      bool merge_stderr) override;
};

std::string shell_quote(const std::string& arg);
std::string build_command_line(const std::string& program, const std::vector<std::string>& args,
                               bool merge_stderr = false);

#endif

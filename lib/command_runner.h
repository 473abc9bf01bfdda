#ifndef COMMAND_RUNNER_H
#define COMMAND_RUNNER_H

#include <string>

struct CommandResult {
    // -1 when the command could not be started at all
    int exitCode = 0;
    // stdout and stderr of the command, interleaved
    std::string output;

    bool succeeded() const { return exitCode == 0; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::string& command) = 0;
};

// Runs commands through the shell and captures their combined output.
class ShellCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override;
};

// Logs commands instead of running them. Every command "succeeds".
class DryRunCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override;
};

#endif // COMMAND_RUNNER_H

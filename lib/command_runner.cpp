#include "command_runner.h"

#include <cstdio>
#include <sys/wait.h>

#include <glog/logging.h>

CommandResult ShellCommandRunner::run(const std::string& command) {
    CommandResult result;

    VLOG(1) << "Executing command: " << command;

    // fold stderr in so the caller can tell "File exists" from a real failure
    std::string shellCommand = command + " 2>&1";
    FILE* pipe = popen(shellCommand.c_str(), "r");
    if (!pipe) {
        LOG(ERROR) << "Failed to start command: " << command;
        result.exitCode = -1;
        return result;
    }

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = -1;
    }

    VLOG(1) << "Command exited with " << result.exitCode << ": " << command;
    return result;
}

CommandResult DryRunCommandRunner::run(const std::string& command) {
    LOG(INFO) << "[dry run] " << command;
    return CommandResult{};
}

#ifndef TC_BACKEND_H
#define TC_BACKEND_H

#include <initializer_list>
#include <string>

#include "command_runner.h"
#include "shaping_params.h"

enum class BackendStatus {
    Ok,
    // the command failed only because the target state already held
    AlreadyInState,
    Failed,
};

const char* backendStatusName(BackendStatus status);

struct BackendResult {
    BackendStatus status = BackendStatus::Ok;
    // the command that produced `status`
    std::string command;
    // command output when it did not succeed
    std::string detail;

    bool failed() const { return status == BackendStatus::Failed; }
};

// Collapses the outcomes of a multi-command operation: the first failure,
// else the first "already in state", else the first result.
BackendResult mergeResults(std::initializer_list<BackendResult> results);

// Operations the profile controller needs from the host's traffic control.
// Every operation must be safe to repeat.
class TrafficShapingBackend {
public:
    virtual ~TrafficShapingBackend() = default;

    // Create the redirect (IFB) interface and bring it up.
    virtual BackendResult createRedirectInterface(const std::string& ifb) = 0;
    virtual BackendResult destroyRedirectInterface(const std::string& ifb) = 0;

    // Mirror all ingress traffic of `dev` to the egress of `ifb`.
    virtual BackendResult installIngressRedirect(const std::string& dev, const std::string& ifb) = 0;
    virtual BackendResult removeIngressRedirect(const std::string& dev) = 0;

    // Install a netem root qdisc on the egress path of `dev`.
    virtual BackendResult installEgressShaping(const std::string& dev, const ShapingParams& params) = 0;
    virtual BackendResult removeShaping(const std::string& dev) = 0;
};

// Drives `modprobe`, `ip` and `tc` through a CommandRunner.
class TcBackend : public TrafficShapingBackend {
public:
    static constexpr int kRedirectFilterPref = 1;
    static constexpr const char* kRedirectFilterHandle = "800::800";

    explicit TcBackend(CommandRunner& runner);

    BackendResult createRedirectInterface(const std::string& ifb) override;
    BackendResult destroyRedirectInterface(const std::string& ifb) override;
    BackendResult installIngressRedirect(const std::string& dev, const std::string& ifb) override;
    BackendResult removeIngressRedirect(const std::string& dev) override;
    BackendResult installEgressShaping(const std::string& dev, const ShapingParams& params) override;
    BackendResult removeShaping(const std::string& dev) override;

private:
    // Add: "exists" is benign. Delete: "not found" is benign.
    // Replace: sets the target state outright, so any failure is real.
    enum class CommandKind { Add, Delete, Replace };

    BackendResult executeCommand(const std::string& command, CommandKind kind);

    static bool isAlreadyInState(const std::string& output, CommandKind kind);

    CommandRunner& runner_;
};

#endif // TC_BACKEND_H

#include "tc_backend.h"

#include <sstream>

#include <glog/logging.h>

namespace {

// ip/tc messages that mean the object is already there. Only meaningful for
// objects without parameters (the IFB link, the ingress qdisc).
const char* const kAddBenignMessages[] = {
    "File exists",
    "Exclusivity flag on",
};

// ...or already gone
const char* const kDeleteBenignMessages[] = {
    "Cannot find device",
    "No such file or directory",
    "Cannot delete qdisc with handle of zero",
    "Invalid handle",
};

} // namespace

const char* backendStatusName(BackendStatus status) {
    switch (status) {
        case BackendStatus::Ok:
            return "ok";
        case BackendStatus::AlreadyInState:
            return "already in state";
        case BackendStatus::Failed:
            return "failed";
    }
    return "failed";
}

BackendResult mergeResults(std::initializer_list<BackendResult> results) {
    const BackendResult* benign = nullptr;
    for (const BackendResult& result : results) {
        if (result.status == BackendStatus::Failed) {
            return result;
        }
        if (result.status == BackendStatus::AlreadyInState && !benign) {
            benign = &result;
        }
    }
    if (benign) {
        return *benign;
    }
    return results.size() > 0 ? *results.begin() : BackendResult{};
}

TcBackend::TcBackend(CommandRunner& runner) : runner_(runner) {}

BackendResult TcBackend::createRedirectInterface(const std::string& ifb) {
    // ifb may be built in, in which case modprobe is a no-op
    BackendResult loaded = executeCommand("modprobe ifb", CommandKind::Add);
    BackendResult added = executeCommand("ip link add " + ifb + " type ifb", CommandKind::Add);
    BackendResult up = executeCommand("ip link set " + ifb + " up", CommandKind::Replace);
    return mergeResults({loaded, added, up});
}

BackendResult TcBackend::destroyRedirectInterface(const std::string& ifb) {
    return executeCommand("ip link del " + ifb, CommandKind::Delete);
}

BackendResult TcBackend::installIngressRedirect(const std::string& dev, const std::string& ifb) {
    BackendResult qdisc = executeCommand("tc qdisc add dev " + dev + " ingress", CommandKind::Add);

    // a pinned pref/handle makes "replace" overwrite the one redirect filter
    // instead of stacking another copy on every call
    std::ostringstream cmd;
    cmd << "tc filter replace dev " << dev << " parent ffff: protocol ip pref " << kRedirectFilterPref
        << " handle " << kRedirectFilterHandle << " u32"
        << " match u32 0 0 action mirred egress redirect dev " << ifb;
    BackendResult filter = executeCommand(cmd.str(), CommandKind::Replace);

    return mergeResults({qdisc, filter});
}

BackendResult TcBackend::removeIngressRedirect(const std::string& dev) {
    // deleting the ingress qdisc drops its filters with it
    return executeCommand("tc qdisc del dev " + dev + " ingress", CommandKind::Delete);
}

BackendResult TcBackend::installEgressShaping(const std::string& dev, const ShapingParams& params) {
    // "replace" installs exactly these parameters whatever root qdisc was there
    std::ostringstream cmd;
    cmd << "tc qdisc replace dev " << dev << " root netem";
    std::string args = params.toNetemArgs();
    if (!args.empty()) {
        cmd << " " << args;
    }

    std::string error;
    if (!params.isValid(&error)) {
        LOG(ERROR) << "Refusing to shape " << dev << ": " << error;
        BackendResult result;
        result.status = BackendStatus::Failed;
        result.command = cmd.str();
        result.detail = error;
        return result;
    }

    return executeCommand(cmd.str(), CommandKind::Replace);
}

BackendResult TcBackend::removeShaping(const std::string& dev) {
    return executeCommand("tc qdisc del dev " + dev + " root", CommandKind::Delete);
}

BackendResult TcBackend::executeCommand(const std::string& command, CommandKind kind) {
    CommandResult commandResult = runner_.run(command);

    BackendResult result;
    result.command = command;
    if (commandResult.succeeded()) {
        return result;
    }

    result.detail = commandResult.output;
    if (commandResult.exitCode > 0 && isAlreadyInState(commandResult.output, kind)) {
        result.status = BackendStatus::AlreadyInState;
        VLOG(1) << "Already in desired state: " << command;
    } else {
        result.status = BackendStatus::Failed;
        LOG(WARNING) << "Command failed with exit code " << commandResult.exitCode << ": " << command
                     << (commandResult.output.empty() ? "" : " -- ") << commandResult.output;
    }
    return result;
}

bool TcBackend::isAlreadyInState(const std::string& output, CommandKind kind) {
    switch (kind) {
        case CommandKind::Add:
            for (const char* message : kAddBenignMessages) {
                if (output.find(message) != std::string::npos) return true;
            }
            return false;
        case CommandKind::Delete:
            for (const char* message : kDeleteBenignMessages) {
                if (output.find(message) != std::string::npos) return true;
            }
            return false;
        case CommandKind::Replace:
            return false;
    }
    return false;
}

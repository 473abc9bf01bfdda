#ifndef PROFILE_CONTROLLER_H
#define PROFILE_CONTROLLER_H

#include <string>
#include <vector>

#include "controller_config.h"
#include "profile.h"
#include "lib/tc_backend.h"

// One backend call made while applying a profile.
struct StepOutcome {
    std::string step;  // e.g. "remove shaping on ifb0"
    BackendResult result;
};

struct ApplyReport {
    Profile profile = Profile::Disabled;
    std::string statusLine;
    std::vector<StepOutcome> steps;

    bool hasFailures() const;
    size_t failureCount() const;
};

// Maps a profile onto an ordered sequence of backend operations for one
// primary interface and its redirect (IFB) interface.
//
// Backend failures never abort a sequence: "already in state" outcomes are
// the expected result of repeated runs, and real failures are logged and
// recorded in the report so the caller can decide what to do with them.
class ProfileController {
public:
    ProfileController(const ControllerConfig& config, TrafficShapingBackend& backend);

    // Make sure the redirect interface exists and is up, and that the
    // primary interface's ingress traffic is redirected to it.
    void ensureRedirectReady();

    // Remove every qdisc this controller may have installed: the primary's
    // root and ingress qdiscs and the redirect interface's root qdisc.
    void clearShaping();

    ApplyReport applyProfile(Profile profile);

    Profile activeProfile() const { return activeProfile_; }

    const std::string& primaryInterface() const { return primaryInterface_; }
    const std::string& redirectInterface() const { return redirectInterface_; }

private:
    void record(const std::string& step, const BackendResult& result);

    const std::string primaryInterface_;
    const std::string redirectInterface_;
    const ProfileTable profiles_;
    TrafficShapingBackend& backend_;

    Profile activeProfile_ = Profile::Disabled;
    // steps of the profile currently being applied
    std::vector<StepOutcome> steps_;
};

#endif // PROFILE_CONTROLLER_H

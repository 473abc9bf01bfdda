#include "profile_controller.h"

#include <algorithm>

#include <glog/logging.h>

bool ApplyReport::hasFailures() const {
    return failureCount() > 0;
}

size_t ApplyReport::failureCount() const {
    return std::count_if(steps.begin(), steps.end(),
                         [](const StepOutcome& outcome) { return outcome.result.failed(); });
}

ProfileController::ProfileController(const ControllerConfig& config, TrafficShapingBackend& backend)
    : primaryInterface_(config.primaryInterface),
      redirectInterface_(config.redirectInterface),
      profiles_(config.profiles),
      backend_(backend) {
    LOG(INFO) << "Shaping " << primaryInterface_ << " with ingress redirected through " << redirectInterface_;
}

void ProfileController::ensureRedirectReady() {
    record("create redirect interface " + redirectInterface_,
           backend_.createRedirectInterface(redirectInterface_));
    record("redirect ingress of " + primaryInterface_ + " to " + redirectInterface_,
           backend_.installIngressRedirect(primaryInterface_, redirectInterface_));
}

void ProfileController::clearShaping() {
    record("remove shaping on " + primaryInterface_, backend_.removeShaping(primaryInterface_));
    record("remove ingress redirect on " + primaryInterface_, backend_.removeIngressRedirect(primaryInterface_));
    record("remove shaping on " + redirectInterface_, backend_.removeShaping(redirectInterface_));
}

ApplyReport ProfileController::applyProfile(Profile profile) {
    steps_.clear();

    LOG(INFO) << "Applying profile '" << profileName(profile) << "' (previously '"
              << profileName(activeProfile_) << "')";

    clearShaping();

    if (profile == Profile::Disabled) {
        record("destroy redirect interface " + redirectInterface_,
               backend_.destroyRedirectInterface(redirectInterface_));
    } else {
        ensureRedirectReady();

        const ProfileShaping& shaping = profiles_.shaping(profile);
        if (shaping.egress) {
            LOG(INFO) << "Egress of " << primaryInterface_ << ": " << shaping.egress->toNetemArgs();
            record("shape egress of " + primaryInterface_,
                   backend_.installEgressShaping(primaryInterface_, *shaping.egress));
        }
        if (shaping.ingress) {
            LOG(INFO) << "Ingress of " << primaryInterface_ << " (via " << redirectInterface_
                      << "): " << shaping.ingress->toNetemArgs();
            record("shape ingress of " + primaryInterface_,
                   backend_.installEgressShaping(redirectInterface_, *shaping.ingress));
        }
    }

    activeProfile_ = profile;

    ApplyReport report;
    report.profile = profile;
    report.statusLine = profileStatusLine(profile);
    report.steps.swap(steps_);

    if (report.hasFailures()) {
        LOG(WARNING) << report.failureCount() << " of " << report.steps.size()
                     << " steps failed while applying '" << profileName(profile) << "'";
    }
    return report;
}

void ProfileController::record(const std::string& step, const BackendResult& result) {
    if (result.failed()) {
        LOG(WARNING) << "Step '" << step << "' failed";
    } else {
        VLOG(1) << "Step '" << step << "': " << backendStatusName(result.status);
    }
    steps_.push_back(StepOutcome{step, result});
}

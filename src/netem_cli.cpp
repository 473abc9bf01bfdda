#include "netem_cli.h"

#include <ostream>

#include <glog/logging.h>

std::string usageText(const std::string& program) {
    std::string names;
    for (Profile profile : kAllProfiles) {
        if (!names.empty()) names += "|";
        names += profileName(profile);
    }
    return "Usage: " + program + " {" + names + "}";
}

std::optional<Profile> selectProfile(const std::string& program, const std::vector<std::string>& args,
                                     std::ostream& err) {
    std::optional<Profile> profile;
    if (args.size() == 1) {
        profile = profileFromName(args[0]);
    }
    if (!profile) {
        err << usageText(program) << std::endl;
    }
    return profile;
}

int runProfile(ProfileController& controller, Profile profile, bool strict, std::ostream& out) {
    ApplyReport report = controller.applyProfile(profile);

    out << report.statusLine << std::endl;

    if (strict && report.hasFailures()) {
        for (const StepOutcome& outcome : report.steps) {
            if (outcome.result.failed()) {
                LOG(ERROR) << "Failed: " << outcome.step << " (" << outcome.result.command << ")";
            }
        }
        return kExitBackendFailure;
    }
    return kExitOk;
}

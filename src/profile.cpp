#include "profile.h"

#include <stdexcept>

namespace {

ShapingParams normalDelayWithLoss(int mean_ms, int stddev_ms, double loss, double correlation) {
    ShapingParams params;
    params.meanDelayMs = mean_ms;
    params.jitterMs = stddev_ms;
    params.jitterDistribution = JitterDistribution::Normal;
    params.lossPercent = loss;
    params.lossCorrelationPercent = correlation;
    return params;
}

size_t indexOf(Profile profile) {
    return static_cast<size_t>(profile);
}

} // namespace

const char* profileName(Profile profile) {
    switch (profile) {
        case Profile::NoImpairment:
            return "good";
        case Profile::Medium:
            return "medium";
        case Profile::Severe:
            return "bad";
        case Profile::Disabled:
            return "off";
    }
    return "off";
}

std::optional<Profile> profileFromName(const std::string& name) {
    for (Profile profile : kAllProfiles) {
        if (name == profileName(profile)) {
            return profile;
        }
    }
    return std::nullopt;
}

const char* profileGlyph(Profile profile) {
    switch (profile) {
        case Profile::NoImpairment:
            return "\xF0\x9F\x9F\xA2";  // green circle
        case Profile::Medium:
            return "\xF0\x9F\x9F\xA1";  // yellow circle
        case Profile::Severe:
            return "\xF0\x9F\x94\xB4";  // red circle
        case Profile::Disabled:
            return "\xE2\x9A\xAA";      // white circle
    }
    return "";
}

const char* profileLabel(Profile profile) {
    switch (profile) {
        case Profile::NoImpairment:
            return "GOOD signal";
        case Profile::Medium:
            return "MEDIUM signal";
        case Profile::Severe:
            return "BAD signal";
        case Profile::Disabled:
            return "NETEM OFF";
    }
    return "";
}

std::string profileStatusLine(Profile profile) {
    return std::string(profileGlyph(profile)) + " " + profileLabel(profile);
}

ProfileShaping defaultShaping(Profile profile) {
    ProfileShaping shaping;
    switch (profile) {
        case Profile::NoImpairment:
        case Profile::Disabled:
            break;
        case Profile::Medium:
            shaping.egress = normalDelayWithLoss(80, 20, 10, 30);
            shaping.ingress = normalDelayWithLoss(80, 20, 20, 30);
            break;
        case Profile::Severe:
            shaping.egress = normalDelayWithLoss(150, 40, 15, 30);
            shaping.ingress = normalDelayWithLoss(150, 40, 40, 30);
            break;
    }
    return shaping;
}

ProfileTable::ProfileTable() {
    for (Profile profile : kAllProfiles) {
        shapings_[indexOf(profile)] = defaultShaping(profile);
    }
}

const ProfileShaping& ProfileTable::shaping(Profile profile) const {
    return shapings_[indexOf(profile)];
}

void ProfileTable::setShaping(Profile profile, const ProfileShaping& shaping) {
    if (profile == Profile::Disabled) {
        throw std::invalid_argument("profile 'off' cannot carry shaping parameters");
    }
    shapings_[indexOf(profile)] = shaping;
}

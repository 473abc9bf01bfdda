#ifndef PROFILE_H
#define PROFILE_H

#include <array>
#include <optional>
#include <string>

#include "lib/shaping_params.h"

enum class Profile {
    NoImpairment,  // "good"
    Medium,        // "medium"
    Severe,        // "bad"
    Disabled,      // "off"
};

constexpr std::array<Profile, 4> kAllProfiles = {
    Profile::NoImpairment,
    Profile::Medium,
    Profile::Severe,
    Profile::Disabled,
};

// What a profile installs. An empty direction means no qdisc on that path.
struct ProfileShaping {
    // root qdisc of the primary interface
    std::optional<ShapingParams> egress;
    // root qdisc of the redirect interface, i.e. the primary's ingress
    std::optional<ShapingParams> ingress;
};

// name used on the command line
const char* profileName(Profile profile);
std::optional<Profile> profileFromName(const std::string& name);

const char* profileGlyph(Profile profile);
const char* profileLabel(Profile profile);

// "<glyph> <label>", e.g. "🟡 MEDIUM signal"
std::string profileStatusLine(Profile profile);

ProfileShaping defaultShaping(Profile profile);

// Per-profile shaping, starting from the built-in values.
class ProfileTable {
public:
    ProfileTable();

    const ProfileShaping& shaping(Profile profile) const;

    // Disabled always stays empty; overriding it throws std::invalid_argument.
    void setShaping(Profile profile, const ProfileShaping& shaping);

private:
    std::array<ProfileShaping, kAllProfiles.size()> shapings_;
};

#endif // PROFILE_H

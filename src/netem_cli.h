#ifndef NETEM_CLI_H
#define NETEM_CLI_H

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "profile.h"
#include "profile_controller.h"

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 1;
// only with --strict
constexpr int kExitBackendFailure = 2;

std::string usageText(const std::string& program);

// Picks the profile from the positional arguments (program name excluded).
// Prints usage to `err` and returns nullopt unless there is exactly one
// argument naming a known profile.
std::optional<Profile> selectProfile(const std::string& program, const std::vector<std::string>& args,
                                     std::ostream& err);

// Applies `profile`, prints its status line to `out` and returns the exit code.
int runProfile(ProfileController& controller, Profile profile, bool strict, std::ostream& out);

#endif // NETEM_CLI_H

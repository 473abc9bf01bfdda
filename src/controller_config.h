#ifndef CONTROLLER_CONFIG_H
#define CONTROLLER_CONFIG_H

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "profile.h"
#include "lib/shaping_params.h"

class ConfigParseException : public std::runtime_error {
public:
    ConfigParseException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }

    static ConfigParseException invalid(const std::string &field, const std::string &reason)
    {
        return ConfigParseException("'" + field + "': " + reason);
    }
};

// Linux IFNAMSIZ minus the terminating NUL.
constexpr size_t kMaxInterfaceNameLength = 15;

// Interface names end up on a shell command line, so anything beyond plain
// name characters is rejected. '@' is ip(8)'s dev@parent separator and a
// leading '-' would read as an option.
inline bool isValidInterfaceName(const std::string &name)
{
    if (name.empty() || name.size() > kMaxInterfaceNameLength || name == "." || name == "..") {
        return false;
    }
    if (name[0] == '-') {
        return false;
    }
    for (char c : name) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                       c == '-' || c == '_' || c == '.';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

struct ControllerConfig {
    // the device being shaped
    std::string primaryInterface = "wlp2s0";
    // the IFB device carrying the primary's ingress traffic
    std::string redirectInterface = "ifb0";

    ProfileTable profiles;

    template <class T> T parseField(const YAML::Node &parent, const std::string &key, const T &default_value)
    {
        if (!parent[key]) {
            return default_value;
        }

        try {
            return parent[key].as<T>();
        } catch (const YAML::BadConversion &e) {
            throw ConfigParseException("'" + key + "': " + e.msg + ".");
        }
    }

    ShapingParams parseShapingParams(const YAML::Node &node, const std::string &path)
    {
        if (!node.IsMap()) {
            throw ConfigParseException::invalid(path, "expected a map or 'none'");
        }

        ShapingParams params;
        try {
            params.meanDelayMs = parseField<int>(node, "delay_ms", 0);
            params.jitterMs = parseField<int>(node, "jitter_ms", 0);
            params.lossPercent = parseField<double>(node, "loss_percent", 0.0);
            params.lossCorrelationPercent = parseField<double>(node, "loss_correlation_percent", 0.0);

            std::string distribution = parseField<std::string>(node, "distribution", "uniform");
            auto parsed = distributionFromName(distribution);
            if (!parsed) {
                throw ConfigParseException("'distribution': unknown distribution " + distribution + ".");
            }
            params.jitterDistribution = *parsed;
        } catch (const ConfigParseException &e) {
            throw ConfigParseException("Error parsing " + path + " " + std::string(e.what()));
        }

        std::string error;
        if (!params.isValid(&error)) {
            throw ConfigParseException::invalid(path, error);
        }
        return params;
    }

    // A direction is either absent (keep the built-in value), "none" or a
    // parameter map.
    void parseDirection(const YAML::Node &profileNode, const std::string &key, const std::string &path,
                        std::optional<ShapingParams> &direction)
    {
        const YAML::Node node = profileNode[key];
        if (!node) {
            return;
        }
        if (node.IsNull() || (node.IsScalar() && node.Scalar() == "none")) {
            direction.reset();
            return;
        }
        direction = parseShapingParams(node, path + "." + key);
    }

    void parseProfiles(const YAML::Node &root)
    {
        const YAML::Node profilesNode = root["profiles"];
        if (!profilesNode) {
            return;
        }
        if (!profilesNode.IsMap()) {
            throw ConfigParseException::invalid("profiles", "expected a map");
        }

        for (const auto &entry : profilesNode) {
            std::string name = entry.first.as<std::string>();
            std::string path = "profiles." + name;

            auto profile = profileFromName(name);
            if (!profile) {
                throw ConfigParseException::invalid(path, "unknown profile");
            }
            if (*profile == Profile::Disabled) {
                throw ConfigParseException::invalid(path, "profile 'off' cannot be overridden");
            }
            if (!entry.second.IsMap()) {
                throw ConfigParseException::invalid(path, "expected a map");
            }

            ProfileShaping shaping = profiles.shaping(*profile);
            parseDirection(entry.second, "egress", path, shaping.egress);
            parseDirection(entry.second, "ingress", path, shaping.ingress);
            profiles.setShaping(*profile, shaping);
        }
    }

    void parseInterfaces(const YAML::Node &root)
    {
        const YAML::Node interfacesNode = root["interfaces"];
        if (!interfacesNode) {
            return;
        }
        if (!interfacesNode.IsMap()) {
            throw ConfigParseException::invalid("interfaces", "expected a map");
        }

        try {
            primaryInterface = parseField<std::string>(interfacesNode, "primary", primaryInterface);
            redirectInterface = parseField<std::string>(interfacesNode, "redirect", redirectInterface);
        } catch (const ConfigParseException &e) {
            throw ConfigParseException("Error parsing interfaces " + std::string(e.what()));
        }
    }

    void parseNode(const YAML::Node &root)
    {
        if (!root || root.IsNull()) {
            return;
        }
        if (!root.IsMap()) {
            throw ConfigParseException("Config root must be a map.");
        }
        parseInterfaces(root);
        parseProfiles(root);
    }

    void parseDocument(const YAML::Node &root)
    {
        try {
            parseNode(root);
        } catch (const YAML::Exception &e) {
            throw ConfigParseException("Error reading config: " + e.msg + ".");
        }
    }

    void parseConfig(const std::string &configFilename)
    {
        YAML::Node config;

        try {
            config = YAML::LoadFile(configFilename);
        } catch (const YAML::BadFile &e) {
            throw ConfigParseException("Error loading config file:" + e.msg + ".");
        } catch (const YAML::ParserException &e) {
            throw ConfigParseException("Error parsing config file: " + e.msg + ".");
        }

        parseDocument(config);

        LOG(INFO) << "Config parsed successfully";
    }

    void parseConfigString(const std::string &text)
    {
        YAML::Node config;

        try {
            config = YAML::Load(text);
        } catch (const YAML::ParserException &e) {
            throw ConfigParseException("Error parsing config: " + e.msg + ".");
        }

        parseDocument(config);
    }

    // NETEM_DEV / NETEM_IFB, when set and non-empty
    void applyEnvironment()
    {
        const char *dev = std::getenv("NETEM_DEV");
        if (dev && *dev) {
            primaryInterface = dev;
        }
        const char *ifb = std::getenv("NETEM_IFB");
        if (ifb && *ifb) {
            redirectInterface = ifb;
        }
    }

    void applyOverrides(const std::string &dev, const std::string &ifb)
    {
        if (!dev.empty()) {
            primaryInterface = dev;
        }
        if (!ifb.empty()) {
            redirectInterface = ifb;
        }
    }

    void validate() const
    {
        if (!isValidInterfaceName(primaryInterface)) {
            throw ConfigParseException::invalid("primary interface", "invalid name '" + primaryInterface + "'");
        }
        if (!isValidInterfaceName(redirectInterface)) {
            throw ConfigParseException::invalid("redirect interface", "invalid name '" + redirectInterface + "'");
        }
        if (primaryInterface == redirectInterface) {
            throw ConfigParseException("Primary and redirect interface are both '" + primaryInterface + "'.");
        }
    }
};

#endif

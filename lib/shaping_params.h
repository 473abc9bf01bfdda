#ifndef SHAPING_PARAMS_H
#define SHAPING_PARAMS_H

#include <optional>
#include <string>

enum class JitterDistribution {
    Uniform,      // netem default, no "distribution" keyword
    Normal,
    Pareto,
    ParetoNormal,
};

const char* distributionName(JitterDistribution distribution);
std::optional<JitterDistribution> distributionFromName(const std::string& name);

// netem parameters for one traffic direction
struct ShapingParams {
    int meanDelayMs = 0;
    int jitterMs = 0;
    JitterDistribution jitterDistribution = JitterDistribution::Uniform;
    double lossPercent = 0.0;
    double lossCorrelationPercent = 0.0;

    // Returns false and fills `error` (when given) if the parameters can't be
    // expressed as a netem qdisc.
    bool isValid(std::string* error = nullptr) const;

    // Arguments following "netem", e.g. "delay 80ms 20ms distribution normal loss 10% 30%"
    std::string toNetemArgs() const;

    bool operator==(const ShapingParams& other) const;
    bool operator!=(const ShapingParams& other) const { return !(*this == other); }
};

#endif // SHAPING_PARAMS_H

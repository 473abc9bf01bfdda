#include "shaping_params.h"

#include <sstream>

const char* distributionName(JitterDistribution distribution) {
    switch (distribution) {
        case JitterDistribution::Uniform:
            return "uniform";
        case JitterDistribution::Normal:
            return "normal";
        case JitterDistribution::Pareto:
            return "pareto";
        case JitterDistribution::ParetoNormal:
            return "paretonormal";
    }
    return "uniform";
}

std::optional<JitterDistribution> distributionFromName(const std::string& name) {
    if (name == "uniform") return JitterDistribution::Uniform;
    if (name == "normal") return JitterDistribution::Normal;
    if (name == "pareto") return JitterDistribution::Pareto;
    if (name == "paretonormal") return JitterDistribution::ParetoNormal;
    return std::nullopt;
}

bool ShapingParams::isValid(std::string* error) const {
    std::string problem;
    if (meanDelayMs < 0 || jitterMs < 0) {
        problem = "delay and jitter must be non-negative";
    } else if (lossPercent < 0.0 || lossPercent > 100.0) {
        problem = "loss must be between 0 and 100 percent";
    } else if (lossCorrelationPercent < 0.0 || lossCorrelationPercent > 100.0) {
        problem = "loss correlation must be between 0 and 100 percent";
    } else if (jitterDistribution != JitterDistribution::Uniform && jitterMs == 0) {
        problem = std::string("distribution ") + distributionName(jitterDistribution) + " requires a jitter";
    }

    if (problem.empty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

std::string ShapingParams::toNetemArgs() const {
    std::ostringstream args;

    if (meanDelayMs > 0 || jitterMs > 0) {
        args << "delay " << meanDelayMs << "ms";
        if (jitterMs > 0) {
            args << " " << jitterMs << "ms";
            if (jitterDistribution != JitterDistribution::Uniform) {
                args << " distribution " << distributionName(jitterDistribution);
            }
        }
    }

    if (lossPercent > 0.0) {
        if (args.tellp() > 0) args << " ";
        args << "loss " << lossPercent << "%";
        if (lossCorrelationPercent > 0.0) {
            args << " " << lossCorrelationPercent << "%";
        }
    }

    return args.str();
}

bool ShapingParams::operator==(const ShapingParams& other) const {
    return meanDelayMs == other.meanDelayMs && jitterMs == other.jitterMs &&
           jitterDistribution == other.jitterDistribution && lossPercent == other.lossPercent &&
           lossCorrelationPercent == other.lossCorrelationPercent;
}

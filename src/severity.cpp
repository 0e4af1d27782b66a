#include "floodrisk/severity.hpp"

#include "floodrisk/errors.hpp"

namespace floodrisk {

SeverityScheme SeverityScheme::from_config(const SeverityConfig& config) {
    if (!config.moderate || !config.high || !config.very_high) {
        std::string key = !config.moderate ? "severity.moderate"
                          : !config.high   ? "severity.high"
                                           : "severity.very_high";
        throw FusionError(ErrorKind::kMissingConfiguration, Stage::kSeverityClassifier, key,
                          "depth threshold is required");
    }
    SeverityScheme scheme{*config.moderate, *config.high, *config.very_high, config.names};
    if (!(scheme.moderate > 0.0 && scheme.moderate < scheme.high && scheme.high < scheme.very_high)) {
        throw FusionError(ErrorKind::kMissingConfiguration, Stage::kSeverityClassifier, "severity",
                          "thresholds must satisfy 0 < moderate < high < very_high");
    }
    return scheme;
}

int SeverityScheme::classify(double depth) const {
    if (depth <= moderate) {
        return static_cast<int>(SeverityClass::kNoneLow);
    }
    if (depth <= high) {
        return static_cast<int>(SeverityClass::kModerate);
    }
    if (depth <= very_high) {
        return static_cast<int>(SeverityClass::kHigh);
    }
    return static_cast<int>(SeverityClass::kVeryHigh);
}

const std::string& SeverityScheme::name(int severity_class) const {
    return names.at(static_cast<std::size_t>(severity_class));
}

SeverityClassifier::SeverityClassifier(SeverityScheme scheme) : scheme_(std::move(scheme)) {}

ClassRaster SeverityClassifier::classify(const DepthRaster& depth, const std::string& name) const {
    ClassRaster output(name, depth.grid, kClassNoData);
    const long long count = static_cast<long long>(depth.values.size());
#pragma omp parallel for schedule(static)
    for (long long i = 0; i < count; ++i) {
        const double value = depth.values[static_cast<std::size_t>(i)];
        if (!depth.is_nodata(value)) {
            output.values[static_cast<std::size_t>(i)] = scheme_.classify(value);
        }
    }
    return output;
}

std::array<std::size_t, kSeverityLevels> SeverityClassifier::class_counts(const ClassRaster& severity) const {
    std::array<std::size_t, kSeverityLevels> counts{};
    for (int value : severity.values) {
        if (value >= 0 && value < kSeverityLevels) {
            counts[static_cast<std::size_t>(value)] += 1;
        }
    }
    return counts;
}

}  // namespace floodrisk

#ifndef FLOODRISK_SEVERITY_HPP
#define FLOODRISK_SEVERITY_HPP

#include <array>
#include <cstddef>
#include <string>

#include "floodrisk/config.hpp"
#include "floodrisk/raster.hpp"

namespace floodrisk {

enum class SeverityClass : int {
    kNoneLow = 0,
    kModerate = 1,
    kHigh = 2,
    kVeryHigh = 3,
};

struct SeverityScheme {
    double moderate = 0.0;
    double high = 0.0;
    double very_high = 0.0;
    std::array<std::string, kSeverityLevels> names{};

    static SeverityScheme from_config(const SeverityConfig& config);

    int classify(double depth) const;
    const std::string& name(int severity_class) const;
};

class SeverityClassifier {
public:
    explicit SeverityClassifier(SeverityScheme scheme);

    ClassRaster classify(const DepthRaster& depth, const std::string& name = "severity") const;
    std::array<std::size_t, kSeverityLevels> class_counts(const ClassRaster& severity) const;

    const SeverityScheme& scheme() const { return scheme_; }

private:
    SeverityScheme scheme_;
};

}  // namespace floodrisk

#endif  // FLOODRISK_SEVERITY_HPP

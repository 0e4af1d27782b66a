#ifndef FLOODRISK_ALIGNER_HPP
#define FLOODRISK_ALIGNER_HPP

#include <optional>
#include <string>

#include "floodrisk/logging.hpp"
#include "floodrisk/raster.hpp"

namespace floodrisk {

struct AlignmentReport {
    GridSpec target{};
    bool derived = true;
    bool severity_resampled = false;
    bool vulnerability_resampled = false;
    std::string severity_source;
    std::string vulnerability_source;
};

struct AlignedPair {
    ClassRaster severity;
    ScoreRaster vulnerability;
    AlignmentReport report;
};

ClassRaster resample_nearest(const ClassRaster& source, const GridSpec& target);

ScoreRaster resample_bilinear(const ScoreRaster& source, const GridSpec& target);

class GridAligner {
public:
    explicit GridAligner(std::optional<GridSpec> target = std::nullopt,
                         Logger logger = get_logger("GridAligner"));

    AlignedPair align(const ClassRaster& severity, const ScoreRaster& vulnerability) const;

    GridSpec derive_target(const GridSpec& severity, const GridSpec& vulnerability,
                           const std::string& severity_name = "severity",
                           const std::string& vulnerability_name = "vulnerability") const;

private:
    std::optional<GridSpec> target_;
    Logger logger_;
};

}  // namespace floodrisk

#endif  // FLOODRISK_ALIGNER_HPP

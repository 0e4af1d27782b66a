#ifndef FLOODRISK_SUMMARY_HPP
#define FLOODRISK_SUMMARY_HPP

#include <array>
#include <string>
#include <vector>

#include "floodrisk/aligner.hpp"
#include "floodrisk/config.hpp"
#include "floodrisk/errors.hpp"
#include "floodrisk/fusion.hpp"
#include "floodrisk/rating.hpp"

namespace floodrisk {

struct RunningStats {
    double mean = 0.0;
    double max = 0.0;
    std::size_t count = 0;

    void update(double value);
    void merge(const RunningStats& other);
};

struct DepthStats {
    double max_depth = 0.0;
    double mean_depth = 0.0;
    std::size_t painted_pixels = 0;
};

struct SummaryStatistics {
    std::string cycle;
    std::size_t reach_count = 0;
    std::vector<RiskBandStats> bands;
    std::string area_units;
    std::size_t valid_pixels = 0;
    std::size_t nodata_pixels = 0;
    std::array<std::size_t, kSeverityLevels> severity_counts{};
    std::vector<std::string> priority_reaches;
    AlignmentReport alignment{};
    QuantileTiering tiering{};
    DepthStats depth{};
    std::vector<RunWarning> warnings;
};

DepthStats depth_statistics(const DepthRaster& depth);

std::vector<std::string> priority_reaches(const std::vector<ResolvedReach>& reaches, double very_high_threshold);

}  // namespace floodrisk

#endif  // FLOODRISK_SUMMARY_HPP

#ifndef FLOODRISK_FUSION_HPP
#define FLOODRISK_FUSION_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "floodrisk/aligner.hpp"
#include "floodrisk/config.hpp"
#include "floodrisk/errors.hpp"
#include "floodrisk/logging.hpp"
#include "floodrisk/raster.hpp"

namespace floodrisk {

struct QuantileTiering {
    int requested_count = 4;
    std::vector<double> breakpoints;
    std::vector<std::pair<double, double>> tier_ranges;

    int tier(double value) const;
    int tier_count() const { return static_cast<int>(breakpoints.size()) + 1; }
};

QuantileTiering compute_quantile_tiers(std::vector<double> values, int quantile_count);

QuantileTiering compute_quantile_tiers(const ScoreRaster& raster, int quantile_count);

class RiskClassTable {
public:
    RiskClassTable(int severity_levels, int vulnerability_tiers,
                   std::optional<std::vector<std::vector<int>>> collapse = std::nullopt,
                   std::vector<std::string> band_names = {});

    static RiskClassTable from_config(const EngineSettings& settings);

    int combined(int severity, int tier) const;
    int band(int severity, int tier) const;
    int band_count() const { return band_count_; }
    std::string band_name(int band) const;
    int severity_levels() const { return severity_levels_; }
    int vulnerability_tiers() const { return vulnerability_tiers_; }

private:
    int severity_levels_ = 0;
    int vulnerability_tiers_ = 0;
    std::vector<std::vector<int>> table_;
    std::vector<std::string> band_names_;
    int band_count_ = 0;
};

struct RiskRaster {
    ClassRaster bands;
    ClassRaster combined;
    ClassRaster severity_tier;
    ClassRaster vulnerability_tier;
};

struct RiskBandStats {
    int band = 0;
    std::string name;
    std::size_t pixels = 0;
    double area = 0.0;
    double percent = 0.0;
};

struct RiskFusionResult {
    RiskRaster raster;
    QuantileTiering tiering;
    std::vector<RiskBandStats> bands;
    std::string area_units;
    std::size_t valid_pixels = 0;
    std::size_t nodata_pixels = 0;
    std::vector<RunWarning> warnings;
};

class RiskFusionEngine {
public:
    RiskFusionEngine(RiskClassTable table, int quantile_count, Logger logger = get_logger("RiskFusionEngine"));

    RiskFusionResult fuse(const AlignedPair& pair, const std::string& name = "risk") const;

    const RiskClassTable& table() const { return table_; }

private:
    RiskClassTable table_;
    int quantile_count_ = 4;
    Logger logger_;
};

std::vector<RiskBandStats> band_statistics(const ClassRaster& bands, const RiskClassTable& table);

}  // namespace floodrisk

#endif  // FLOODRISK_FUSION_HPP

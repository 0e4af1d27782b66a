#ifndef FLOODRISK_RATING_HPP
#define FLOODRISK_RATING_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "floodrisk/raster.hpp"

namespace floodrisk {

struct RatingBreakpoint {
    double discharge = 0.0;
    double depth = 0.0;
};

enum class DepthFlag {
    kInRange,
    kBelowRange,
    kExtrapolatedHigh,
    kNegativeDischarge,
};

std::string flag_name(DepthFlag flag);

struct DepthResolution {
    double depth = 0.0;
    DepthFlag flag = DepthFlag::kInRange;
};

class RatingTable {
public:
    RatingTable() = default;
    explicit RatingTable(std::vector<RatingBreakpoint> breakpoints);

    void validate(const std::string& reach_id) const;
    DepthResolution evaluate(double discharge) const;

    const std::vector<RatingBreakpoint>& breakpoints() const { return breakpoints_; }

private:
    std::vector<RatingBreakpoint> breakpoints_;
};

struct PixelIndex {
    int col = 0;
    int row = 0;
};

using CatchmentMask = std::vector<PixelIndex>;

struct ReachData {
    RatingTable rating;
    CatchmentMask mask;
};

class ReachCatalog {
public:
    ReachCatalog(GridSpec grid, std::map<std::string, ReachData> reaches);

    const GridSpec& grid() const { return grid_; }
    const ReachData& reach(const std::string& reach_id) const;
    std::size_t size() const { return reaches_.size(); }
    std::vector<std::string> reach_ids() const;

private:
    GridSpec grid_;
    std::map<std::string, ReachData> reaches_;
};

struct ForecastSample {
    std::string reach_id;
    double max_discharge = 0.0;
    std::string valid_start;
    std::string valid_end;
};

struct ForecastCycle {
    std::string id;
    std::vector<ForecastSample> samples;
};

struct ResolvedReach {
    std::string reach_id;
    double discharge = 0.0;
    DepthResolution resolution{};
};

class RatingCurveResolver {
public:
    explicit RatingCurveResolver(std::shared_ptr<const ReachCatalog> catalog);

    DepthResolution resolve(const std::string& reach_id, double discharge) const;

    std::vector<ResolvedReach> resolve_batch(const std::vector<ForecastSample>& samples) const;

private:
    std::shared_ptr<const ReachCatalog> catalog_;
};

}  // namespace floodrisk

#endif  // FLOODRISK_RATING_HPP

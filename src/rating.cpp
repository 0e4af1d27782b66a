#include "floodrisk/rating.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "floodrisk/errors.hpp"

namespace floodrisk {

namespace {

FusionError invalid_table(const std::string& reach_id, const std::string& detail) {
    return FusionError(ErrorKind::kInvalidRatingTable, Stage::kRatingCurve, reach_id, detail);
}

}  // namespace

std::string flag_name(DepthFlag flag) {
    switch (flag) {
        case DepthFlag::kInRange:
            return "in_range";
        case DepthFlag::kBelowRange:
            return "below_range";
        case DepthFlag::kExtrapolatedHigh:
            return "extrapolated_high";
        case DepthFlag::kNegativeDischarge:
            return "negative_discharge";
    }
    return "in_range";
}

RatingTable::RatingTable(std::vector<RatingBreakpoint> breakpoints) : breakpoints_(std::move(breakpoints)) {}

void RatingTable::validate(const std::string& reach_id) const {
    if (breakpoints_.size() < 2) {
        throw invalid_table(reach_id, "at least two breakpoints are required");
    }
    for (std::size_t i = 0; i < breakpoints_.size(); ++i) {
        const auto& point = breakpoints_[i];
        if (!std::isfinite(point.discharge) || !std::isfinite(point.depth)) {
            throw invalid_table(reach_id, "breakpoint " + std::to_string(i) + " is not finite");
        }
        if (point.depth < 0.0) {
            throw invalid_table(reach_id, "breakpoint " + std::to_string(i) + " has negative depth");
        }
        if (i == 0) {
            continue;
        }
        const auto& previous = breakpoints_[i - 1];
        if (point.discharge < previous.discharge) {
            throw invalid_table(reach_id, "discharge decreases at breakpoint " + std::to_string(i));
        }
        if (point.depth < previous.depth) {
            throw invalid_table(reach_id, "depth decreases at breakpoint " + std::to_string(i));
        }
    }
    if (!(breakpoints_.back().discharge > breakpoints_.front().discharge)) {
        throw invalid_table(reach_id, "table spans no discharge range");
    }
}

DepthResolution RatingTable::evaluate(double discharge) const {
    if (discharge < 0.0) {
        return DepthResolution{0.0, DepthFlag::kNegativeDischarge};
    }
    if (discharge < breakpoints_.front().discharge) {
        return DepthResolution{0.0, DepthFlag::kBelowRange};
    }

    const auto& last = breakpoints_.back();
    if (discharge > last.discharge) {
        // Hold the slope of the last segment that has a discharge width.
        std::size_t hi = breakpoints_.size() - 1;
        while (hi > 0 && !(breakpoints_[hi].discharge > breakpoints_[hi - 1].discharge)) {
            --hi;
        }
        const auto& a = breakpoints_[hi - 1];
        const auto& b = breakpoints_[hi];
        const double slope = (b.depth - a.depth) / (b.discharge - a.discharge);
        return DepthResolution{last.depth + slope * (discharge - last.discharge), DepthFlag::kExtrapolatedHigh};
    }

    auto upper = std::upper_bound(breakpoints_.begin(), breakpoints_.end(), discharge,
                                  [](double value, const RatingBreakpoint& point) { return value < point.discharge; });
    if (upper == breakpoints_.end()) {
        return DepthResolution{last.depth, DepthFlag::kInRange};
    }
    const auto& lo = *(upper - 1);
    const auto& hi = *upper;
    const double fraction = (discharge - lo.discharge) / (hi.discharge - lo.discharge);
    return DepthResolution{lo.depth + fraction * (hi.depth - lo.depth), DepthFlag::kInRange};
}

ReachCatalog::ReachCatalog(GridSpec grid, std::map<std::string, ReachData> reaches)
    : grid_(std::move(grid)), reaches_(std::move(reaches)) {
    if (grid_.cols <= 0 || grid_.rows <= 0 || !(grid_.pixel_width > 0.0) || !(grid_.pixel_height > 0.0)) {
        throw FusionError(ErrorKind::kInvalidReachMask, Stage::kDepthRasterizer, "reach_grid",
                          "reach grid must have positive dimensions and pixel size");
    }
    for (auto& [reach_id, data] : reaches_) {
        data.rating.validate(reach_id);
        for (const auto& pixel : data.mask) {
            if (!grid_.contains(pixel.col, pixel.row)) {
                throw FusionError(ErrorKind::kInvalidReachMask, Stage::kDepthRasterizer, reach_id,
                                  "mask pixel (" + std::to_string(pixel.col) + "," + std::to_string(pixel.row) +
                                      ") lies outside the reach grid");
            }
        }
        auto& mask = data.mask;
        std::sort(mask.begin(), mask.end(), [](const PixelIndex& a, const PixelIndex& b) {
            return a.row != b.row ? a.row < b.row : a.col < b.col;
        });
        mask.erase(std::unique(mask.begin(), mask.end(),
                               [](const PixelIndex& a, const PixelIndex& b) { return a.row == b.row && a.col == b.col; }),
                   mask.end());
    }
}

const ReachData& ReachCatalog::reach(const std::string& reach_id) const {
    auto it = reaches_.find(reach_id);
    if (it == reaches_.end()) {
        throw FusionError(ErrorKind::kUnknownReach, Stage::kRatingCurve, reach_id, "no rating table for reach");
    }
    return it->second;
}

std::vector<std::string> ReachCatalog::reach_ids() const {
    std::vector<std::string> ids;
    ids.reserve(reaches_.size());
    for (const auto& [reach_id, data] : reaches_) {
        ids.push_back(reach_id);
    }
    return ids;
}

RatingCurveResolver::RatingCurveResolver(std::shared_ptr<const ReachCatalog> catalog) : catalog_(std::move(catalog)) {
    if (!catalog_) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kRatingCurve, "catalog", "reach catalog is required");
    }
}

DepthResolution RatingCurveResolver::resolve(const std::string& reach_id, double discharge) const {
    const ReachData& data = catalog_->reach(reach_id);
    if (!std::isfinite(discharge)) {
        throw FusionError(ErrorKind::kInvalidInput, Stage::kRatingCurve, reach_id, "discharge is not finite");
    }
    return data.rating.evaluate(discharge);
}

std::vector<ResolvedReach> RatingCurveResolver::resolve_batch(const std::vector<ForecastSample>& samples) const {
    std::set<std::string> seen;
    std::vector<const ReachData*> lookups;
    lookups.reserve(samples.size());
    for (const auto& sample : samples) {
        if (!seen.insert(sample.reach_id).second) {
            throw FusionError(ErrorKind::kDuplicateReachInCycle, Stage::kRatingCurve, sample.reach_id,
                              "reach appears more than once in the forecast cycle");
        }
        if (!std::isfinite(sample.max_discharge)) {
            throw FusionError(ErrorKind::kInvalidInput, Stage::kRatingCurve, sample.reach_id,
                              "discharge is not finite");
        }
        lookups.push_back(&catalog_->reach(sample.reach_id));
    }

    std::vector<ResolvedReach> resolved(samples.size());
    const long long count = static_cast<long long>(samples.size());
#pragma omp parallel for schedule(static)
    for (long long i = 0; i < count; ++i) {
        const auto& sample = samples[static_cast<std::size_t>(i)];
        resolved[static_cast<std::size_t>(i)] =
            ResolvedReach{sample.reach_id, sample.max_discharge, lookups[static_cast<std::size_t>(i)]->rating.evaluate(
                                                                     sample.max_discharge)};
    }
    return resolved;
}

}  // namespace floodrisk

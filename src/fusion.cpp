#include "floodrisk/fusion.hpp"

#include <algorithm>
#include <cmath>

#include "floodrisk/crs.hpp"

namespace floodrisk {

namespace {

const std::vector<std::string> kFourBandNames{"Low Risk", "Moderate Risk", "High Risk", "Very High Risk"};

FusionError bad_table(const std::string& key, const std::string& detail) {
    return FusionError(ErrorKind::kMissingConfiguration, Stage::kRiskFusion, key, detail);
}

}  // namespace

int QuantileTiering::tier(double value) const {
    return static_cast<int>(std::lower_bound(breakpoints.begin(), breakpoints.end(), value) - breakpoints.begin());
}

QuantileTiering compute_quantile_tiers(std::vector<double> values, int quantile_count) {
    if (quantile_count < 2) {
        throw FusionError(ErrorKind::kMissingConfiguration, Stage::kRiskFusion, "vulnerability.quantile_count",
                          "at least two quantiles are required");
    }
    if (values.empty()) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kRiskFusion, "vulnerability",
                          "no valid vulnerability values to tier");
    }
    std::sort(values.begin(), values.end());
    const double high = values.back();
    const double last_index = static_cast<double>(values.size() - 1);

    QuantileTiering tiering;
    tiering.requested_count = quantile_count;
    for (int k = 1; k < quantile_count; ++k) {
        const double position = last_index * static_cast<double>(k) / quantile_count;
        const auto lo = static_cast<std::size_t>(std::floor(position));
        const std::size_t hi = std::min(lo + 1, values.size() - 1);
        const double breakpoint = values[lo] + (position - static_cast<double>(lo)) * (values[hi] - values[lo]);
        // A breakpoint at the maximum would leave an empty top tier.
        if (breakpoint >= high) {
            continue;
        }
        if (tiering.breakpoints.empty() || breakpoint > tiering.breakpoints.back()) {
            tiering.breakpoints.push_back(breakpoint);
        }
    }

    // Observed span of each tier; values are sorted, so every tier is a contiguous run.
    int current = -1;
    for (double value : values) {
        const int tier = tiering.tier(value);
        if (tier != current) {
            tiering.tier_ranges.emplace_back(value, value);
            current = tier;
        } else {
            tiering.tier_ranges.back().second = value;
        }
    }
    return tiering;
}

QuantileTiering compute_quantile_tiers(const ScoreRaster& raster, int quantile_count) {
    std::vector<double> values;
    const long long count = static_cast<long long>(raster.values.size());
#pragma omp parallel
    {
        std::vector<double> local;
#pragma omp for schedule(static) nowait
        for (long long i = 0; i < count; ++i) {
            const double value = raster.values[static_cast<std::size_t>(i)];
            if (!raster.is_nodata(value)) {
                local.push_back(value);
            }
        }
#pragma omp critical(floodrisk_quantile_merge)
        values.insert(values.end(), local.begin(), local.end());
    }
    if (values.empty()) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kRiskFusion, raster.name,
                          "aligned vulnerability raster has no valid values");
    }
    return compute_quantile_tiers(std::move(values), quantile_count);
}

RiskClassTable::RiskClassTable(int severity_levels, int vulnerability_tiers,
                               std::optional<std::vector<std::vector<int>>> collapse,
                               std::vector<std::string> band_names)
    : severity_levels_(severity_levels), vulnerability_tiers_(vulnerability_tiers) {
    if (severity_levels_ < 1 || vulnerability_tiers_ < 1) {
        throw bad_table("collapse", "risk table needs at least one severity level and one tier");
    }
    if (collapse) {
        if (static_cast<int>(collapse->size()) != severity_levels_) {
            throw bad_table("collapse", "collapse table needs one row per severity class");
        }
        for (const auto& row : *collapse) {
            if (static_cast<int>(row.size()) != vulnerability_tiers_) {
                throw bad_table("collapse", "collapse row needs one entry per vulnerability tier");
            }
            for (int band : row) {
                if (band < 0) {
                    throw bad_table("collapse", "bands must be non-negative");
                }
                band_count_ = std::max(band_count_, band + 1);
            }
        }
        if (!is_monotonic_table(*collapse)) {
            throw bad_table("collapse", "bands must be non-decreasing in severity and in vulnerability tier");
        }
        table_ = std::move(*collapse);
    } else {
        table_.assign(static_cast<std::size_t>(severity_levels_),
                      std::vector<int>(static_cast<std::size_t>(vulnerability_tiers_), 0));
        for (int s = 0; s < severity_levels_; ++s) {
            for (int v = 0; v < vulnerability_tiers_; ++v) {
                table_[static_cast<std::size_t>(s)][static_cast<std::size_t>(v)] = combined(s, v);
            }
        }
        band_count_ = severity_levels_ * vulnerability_tiers_;
    }

    if (!band_names.empty() && static_cast<int>(band_names.size()) != band_count_) {
        throw bad_table("collapse.band_names",
                        "expected " + std::to_string(band_count_) + " band names, got " +
                            std::to_string(band_names.size()));
    }
    band_names_ = std::move(band_names);
}

RiskClassTable RiskClassTable::from_config(const EngineSettings& settings) {
    const int tiers = settings.vulnerability.quantile_count;
    if (!settings.collapse.enabled()) {
        std::vector<std::string> names;
        for (int s = 0; s < kSeverityLevels; ++s) {
            for (int v = 0; v < tiers; ++v) {
                names.push_back(settings.severity.names[static_cast<std::size_t>(s)] + " / tier " +
                                std::to_string(v + 1));
            }
        }
        return RiskClassTable(kSeverityLevels, tiers, std::nullopt, std::move(names));
    }

    std::vector<std::vector<int>> rows;
    for (const auto& row : settings.collapse.rows) {
        if (!row) {
            throw bad_table("collapse", "collapse table is missing a severity row");
        }
        rows.push_back(*row);
    }
    std::vector<std::string> names = settings.collapse.band_names;
    RiskClassTable table(kSeverityLevels, tiers, std::move(rows), {});
    if (names.empty() && table.band_count() == static_cast<int>(kFourBandNames.size())) {
        names = kFourBandNames;
    }
    if (!names.empty()) {
        return RiskClassTable(kSeverityLevels, tiers, table.table_, std::move(names));
    }
    return table;
}

int RiskClassTable::combined(int severity, int tier) const {
    return severity * vulnerability_tiers_ + tier;
}

int RiskClassTable::band(int severity, int tier) const {
    return table_[static_cast<std::size_t>(severity)][static_cast<std::size_t>(tier)];
}

std::string RiskClassTable::band_name(int band) const {
    if (band >= 0 && band < static_cast<int>(band_names_.size())) {
        return band_names_[static_cast<std::size_t>(band)];
    }
    return "Band " + std::to_string(band);
}

std::vector<RiskBandStats> band_statistics(const ClassRaster& bands, const RiskClassTable& table) {
    const int band_count = table.band_count();
    std::vector<std::size_t> counts(static_cast<std::size_t>(band_count), 0);
    const long long count = static_cast<long long>(bands.values.size());
#pragma omp parallel
    {
        std::vector<std::size_t> local(static_cast<std::size_t>(band_count), 0);
#pragma omp for schedule(static) nowait
        for (long long i = 0; i < count; ++i) {
            const int band = bands.values[static_cast<std::size_t>(i)];
            if (band >= 0 && band < band_count) {
                local[static_cast<std::size_t>(band)] += 1;
            }
        }
#pragma omp critical(floodrisk_band_merge)
        for (std::size_t b = 0; b < counts.size(); ++b) {
            counts[b] += local[b];
        }
    }

    std::size_t valid = 0;
    for (std::size_t value : counts) {
        valid += value;
    }
    const double pixel_area = bands.grid.pixel_area();
    std::vector<RiskBandStats> output;
    output.reserve(counts.size());
    for (int b = 0; b < band_count; ++b) {
        const std::size_t pixels = counts[static_cast<std::size_t>(b)];
        const double percent = valid > 0 ? 100.0 * static_cast<double>(pixels) / static_cast<double>(valid) : 0.0;
        output.push_back(RiskBandStats{b, table.band_name(b), pixels, pixel_area * static_cast<double>(pixels), percent});
    }
    return output;
}

RiskFusionEngine::RiskFusionEngine(RiskClassTable table, int quantile_count, Logger logger)
    : table_(std::move(table)), quantile_count_(quantile_count), logger_(std::move(logger)) {
    if (quantile_count_ != table_.vulnerability_tiers()) {
        throw bad_table("vulnerability.quantile_count", "risk table tier count does not match quantile count");
    }
}

RiskFusionResult RiskFusionEngine::fuse(const AlignedPair& pair, const std::string& name) const {
    const GridSpec& grid = pair.severity.grid;
    if (!grid.same_grid(pair.vulnerability.grid)) {
        throw FusionError(ErrorKind::kInvalidInput, Stage::kRiskFusion, pair.vulnerability.name,
                          "severity and vulnerability rasters are not on one grid");
    }

    RiskFusionResult result;
    result.tiering = compute_quantile_tiers(pair.vulnerability, quantile_count_);
    result.raster.bands = ClassRaster(name, grid, kClassNoData);
    result.raster.combined = ClassRaster(name + "_combined", grid, kClassNoData);
    result.raster.severity_tier = ClassRaster(name + "_severity_tier", grid, kClassNoData);
    result.raster.vulnerability_tier = ClassRaster(name + "_vulnerability_tier", grid, kClassNoData);

    const int severity_levels = table_.severity_levels();
    const QuantileTiering& tiering = result.tiering;
    std::size_t valid = 0;
    std::size_t propagated = 0;
    std::size_t invalid_severity = 0;
    const long long count = static_cast<long long>(grid.size());

#pragma omp parallel for schedule(static) reduction(+ : valid, propagated, invalid_severity)
    for (long long i = 0; i < count; ++i) {
        const auto index = static_cast<std::size_t>(i);
        const int severity = pair.severity.values[index];
        const double score = pair.vulnerability.values[index];
        const bool severity_missing = pair.severity.is_nodata(severity);
        const bool score_missing = pair.vulnerability.is_nodata(score);
        if (severity_missing || score_missing) {
            if (severity_missing != score_missing) {
                ++propagated;
            }
            continue;
        }
        if (severity < 0 || severity >= severity_levels) {
            ++invalid_severity;
            continue;
        }
        const int tier = tiering.tier(score);
        result.raster.severity_tier.values[index] = severity;
        result.raster.vulnerability_tier.values[index] = tier;
        result.raster.combined.values[index] = table_.combined(severity, tier);
        result.raster.bands.values[index] = table_.band(severity, tier);
        ++valid;
    }

    if (valid == 0) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kRiskFusion, name,
                          "no pixel has both a severity class and a vulnerability score");
    }

    result.valid_pixels = valid;
    result.nodata_pixels = grid.size() - valid;
    result.area_units = area_units(grid.crs);
    result.bands = band_statistics(result.raster.bands, table_);

    if (propagated > 0) {
        result.warnings.push_back(RunWarning{"nodata_propagated", Stage::kRiskFusion, name,
                                             "pixels with only one valid input set to no-data", propagated});
    }
    if (invalid_severity > 0) {
        result.warnings.push_back(RunWarning{"invalid_severity_class", Stage::kRiskFusion, pair.severity.name,
                                             "severity labels outside the class range set to no-data",
                                             invalid_severity});
    }
    if (tiering.tier_count() < quantile_count_) {
        result.warnings.push_back(RunWarning{"quantile_ties", Stage::kRiskFusion, pair.vulnerability.name,
                                             "tied vulnerability values merged quantile breakpoints",
                                             static_cast<std::size_t>(quantile_count_ - tiering.tier_count())});
    }

    logger_.info("risk_fusion_complete", {{"raster", name},
                                          {"valid_pixels", std::to_string(valid)},
                                          {"nodata_pixels", std::to_string(result.nodata_pixels)},
                                          {"tiers", std::to_string(tiering.tier_count())},
                                          {"bands", std::to_string(table_.band_count())}});
    return result;
}

}  // namespace floodrisk

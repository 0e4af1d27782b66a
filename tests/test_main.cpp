#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "floodrisk/aligner.hpp"
#include "floodrisk/api.hpp"
#include "floodrisk/config.hpp"
#include "floodrisk/crs.hpp"
#include "floodrisk/depth_rasterizer.hpp"
#include "floodrisk/engine.hpp"
#include "floodrisk/errors.hpp"
#include "floodrisk/fusion.hpp"
#include "floodrisk/io.hpp"
#include "floodrisk/rating.hpp"
#include "floodrisk/severity.hpp"
#include "floodrisk/summary.hpp"

namespace {

int failures = 0;

void expect_true(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        failures += 1;
    }
}

void expect_near(double value, double expected, double tolerance, const std::string& message) {
    if (std::fabs(value - expected) > tolerance) {
        std::cerr << "FAIL: " << message << " (got " << value << ", expected " << expected << ")\n";
        failures += 1;
    }
}

template <typename Fn>
void expect_throws_kind(Fn&& fn, floodrisk::ErrorKind kind, const std::string& message) {
    try {
        fn();
    } catch (const floodrisk::FusionError& err) {
        if (err.kind() != kind) {
            std::cerr << "FAIL: " << message << " (got " << floodrisk::kind_name(err.kind()) << ", expected "
                      << floodrisk::kind_name(kind) << ")\n";
            failures += 1;
        }
        return;
    }
    std::cerr << "FAIL: " << message << " (no exception)\n";
    failures += 1;
}

floodrisk::GridSpec geo_grid(double origin_x, double origin_y, double pixel, int cols, int rows) {
    return floodrisk::GridSpec{"EPSG:4326", origin_x, origin_y, pixel, pixel, cols, rows};
}

floodrisk::RatingTable make_table(std::vector<floodrisk::RatingBreakpoint> points) {
    return floodrisk::RatingTable(std::move(points));
}

floodrisk::RatingTable sample_rating() {
    return make_table({{0.0, 0.0}, {100.0, 1.0}, {200.0, 3.0}});
}

floodrisk::EngineSettings fema_settings() {
    floodrisk::EngineSettings settings;
    settings.severity.moderate = 0.4;
    settings.severity.high = 0.8;
    settings.severity.very_high = 1.8;
    settings.vulnerability.quantile_count = 4;
    return settings;
}

// Two reaches on a 4x4 geographic grid: 101 covers the top-left block, 102 the bottom-right block.
std::shared_ptr<const floodrisk::ReachCatalog> sample_catalog() {
    std::map<std::string, floodrisk::ReachData> reaches;
    reaches["101"] = floodrisk::ReachData{sample_rating(), {{0, 0}, {1, 0}, {0, 1}, {1, 1}}};
    reaches["102"] = floodrisk::ReachData{sample_rating(), {{2, 2}, {3, 2}, {2, 3}, {3, 3}}};
    return std::make_shared<const floodrisk::ReachCatalog>(geo_grid(0.0, 4.0, 1.0, 4, 4), std::move(reaches));
}

floodrisk::ScoreRaster sample_vulnerability() {
    floodrisk::ScoreRaster raster("vulnerability", geo_grid(0.0, 4.0, 1.0, 4, 4), floodrisk::kDepthNoData);
    for (std::size_t i = 0; i < raster.values.size(); ++i) {
        raster.values[i] = static_cast<double>(i + 1);
    }
    return raster;
}

floodrisk::ForecastCycle sample_cycle() {
    floodrisk::ForecastCycle cycle;
    cycle.id = "2024010100";
    cycle.samples = {{"101", 50.0, "", ""}, {"102", 250.0, "", ""}};
    return cycle;
}

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

void test_rating_curve() {
    const auto table = sample_rating();
    table.validate("101");

    auto mid = table.evaluate(150.0);
    expect_near(mid.depth, 2.0, 1e-12, "rating interpolates inside the table");
    expect_true(mid.flag == floodrisk::DepthFlag::kInRange, "interior discharge is in range");

    auto high = table.evaluate(250.0);
    expect_near(high.depth, 4.0, 1e-12, "rating holds the last segment slope above the table");
    expect_true(high.flag == floodrisk::DepthFlag::kExtrapolatedHigh, "extrapolated discharge is flagged");
    expect_near(table.evaluate(300.0).depth, 5.0, 1e-12, "extrapolation two segments past the table end");

    auto negative = table.evaluate(-10.0);
    expect_near(negative.depth, 0.0, 1e-12, "negative discharge resolves to zero depth");
    expect_true(negative.flag == floodrisk::DepthFlag::kNegativeDischarge, "negative discharge is flagged");

    auto offset = make_table({{20.0, 0.5}, {80.0, 1.5}});
    auto below = offset.evaluate(10.0);
    expect_near(below.depth, 0.0, 1e-12, "discharge below the table resolves to zero depth");
    expect_true(below.flag == floodrisk::DepthFlag::kBelowRange, "below-range discharge is flagged");
    expect_near(offset.evaluate(80.0).depth, 1.5, 1e-12, "table end is inclusive");

    // A vertical final step still extrapolates from the last sloped segment.
    auto stepped = make_table({{0.0, 0.0}, {100.0, 1.0}, {100.0, 2.0}});
    stepped.validate("stepped");
    expect_near(stepped.evaluate(150.0).depth, 2.5, 1e-12, "extrapolation skips zero-width segments");

    expect_throws_kind([] { make_table({{0.0, 0.0}}).validate("short"); },
                       floodrisk::ErrorKind::kInvalidRatingTable, "single breakpoint rejected");
    expect_throws_kind([] { make_table({{0.0, 1.0}, {100.0, 0.5}}).validate("falling"); },
                       floodrisk::ErrorKind::kInvalidRatingTable, "decreasing depth rejected");
    expect_throws_kind([] { make_table({{100.0, 0.0}, {50.0, 1.0}}).validate("reversed"); },
                       floodrisk::ErrorKind::kInvalidRatingTable, "decreasing discharge rejected");
}

void test_resolver() {
    floodrisk::RatingCurveResolver resolver(sample_catalog());
    auto resolved = resolver.resolve_batch(sample_cycle().samples);
    expect_true(resolved.size() == 2, "resolver returns one record per sample");
    expect_true(resolved[0].reach_id == "101", "resolver keeps batch order");
    expect_near(resolved[0].resolution.depth, 0.5, 1e-12, "reach 101 depth");
    expect_near(resolved[1].resolution.depth, 4.0, 1e-12, "reach 102 depth");

    expect_throws_kind([&] { resolver.resolve("999", 10.0); }, floodrisk::ErrorKind::kUnknownReach,
                       "unknown reach rejected");
    expect_throws_kind(
        [&] {
            resolver.resolve_batch({{"101", 10.0, "", ""}, {"101", 20.0, "", ""}});
        },
        floodrisk::ErrorKind::kDuplicateReachInCycle, "duplicate reach in cycle rejected");
    expect_throws_kind([&] { resolver.resolve_batch({{"101", 10.0, "", ""}, {"404", 20.0, "", ""}}); },
                       floodrisk::ErrorKind::kUnknownReach, "unknown reach in batch rejected");
    expect_throws_kind([&] { resolver.resolve("101", std::nan("")); }, floodrisk::ErrorKind::kInvalidInput,
                       "non-finite discharge rejected");

    expect_throws_kind(
        [] {
            std::map<std::string, floodrisk::ReachData> reaches;
            reaches["7"] = floodrisk::ReachData{sample_rating(), {{5, 0}}};
            floodrisk::ReachCatalog catalog(geo_grid(0.0, 4.0, 1.0, 4, 4), std::move(reaches));
        },
        floodrisk::ErrorKind::kInvalidReachMask, "mask outside the reach grid rejected");
}

void test_depth_rasterizer() {
    std::map<std::string, floodrisk::ReachData> reaches;
    reaches["a"] = floodrisk::ReachData{sample_rating(), {{0, 0}, {1, 0}}};
    reaches["b"] = floodrisk::ReachData{sample_rating(), {{1, 0}, {2, 0}}};
    auto catalog = std::make_shared<const floodrisk::ReachCatalog>(geo_grid(0.0, 3.0, 1.0, 3, 3), std::move(reaches));

    std::vector<floodrisk::ResolvedReach> resolved = {
        {"a", 0.0, {1.2, floodrisk::DepthFlag::kInRange}},
        {"b", 0.0, {0.8, floodrisk::DepthFlag::kInRange}},
    };
    floodrisk::DepthRasterizer rasterizer(1);
    auto result = rasterizer.rasterize(resolved, *catalog);
    expect_near(result.raster.at(1, 0), 1.2, 1e-12, "overlapping pixel takes the maximum depth");
    expect_near(result.raster.at(2, 0), 0.8, 1e-12, "single-claim pixel keeps its depth");
    expect_true(result.raster.is_nodata(result.raster.at(1, 1)), "pixel outside every mask stays no-data");
    expect_true(result.metadata.painted_pixels == 3, "painted pixel count");
    expect_true(result.metadata.overlapping_pixels == 1, "overlapping pixel count");
    expect_true(!result.warnings.empty() && result.warnings.front().code == "overlapping_masks",
                "overlap recorded as a warning");

    std::reverse(resolved.begin(), resolved.end());
    auto reversed = floodrisk::DepthRasterizer(64).rasterize(resolved, *catalog);
    expect_true(reversed.raster.values == result.raster.values, "painting order does not change the raster");
}

void test_severity() {
    auto scheme = floodrisk::SeverityScheme::from_config(fema_settings().severity);
    expect_true(scheme.classify(0.4) == 0, "moderate threshold is upper-inclusive");
    expect_true(scheme.classify(0.41) == 1, "just above moderate");
    expect_true(scheme.classify(0.8) == 1, "high threshold is upper-inclusive");
    expect_true(scheme.classify(1.8) == 2, "very high threshold is upper-inclusive");
    expect_true(scheme.classify(1.81) == 3, "above very high");
    expect_true(scheme.name(3) == "Very High", "default class name");

    floodrisk::DepthRaster depth("depth", geo_grid(0.0, 1.0, 1.0, 3, 1), floodrisk::kDepthNoData);
    depth.values = {0.2, floodrisk::kDepthNoData, 2.5};
    floodrisk::SeverityClassifier classifier(scheme);
    auto classes = classifier.classify(depth);
    expect_true(classes.values[0] == 0 && classes.values[2] == 3, "raster classification");
    expect_true(classes.values[1] == floodrisk::kClassNoData, "no-data depth stays no-data");
    auto counts = classifier.class_counts(classes);
    expect_true(counts[0] == 1 && counts[3] == 1 && counts[1] == 0, "class counts");

    floodrisk::SeverityConfig partial;
    partial.moderate = 0.4;
    partial.high = 0.8;
    expect_throws_kind([&] { floodrisk::SeverityScheme::from_config(partial); },
                       floodrisk::ErrorKind::kMissingConfiguration, "missing very_high threshold rejected");
}

void test_crs() {
    auto to_albers = floodrisk::make_transform("EPSG:4269", "EPSG:5070");
    expect_true(!to_albers.is_identity(), "distinct crs pair builds a transformation");
    auto origin = to_albers.apply(-96.0, 23.0);
    expect_near(origin.first, 0.0, 1e-6, "albers false origin x");
    expect_near(origin.second, 0.0, 1e-6, "albers false origin y");

    auto projected = floodrisk::make_transform("EPSG:4326", "EPSG:5070").apply(-90.25, 38.6);
    auto back = floodrisk::make_transform("EPSG:5070", "EPSG:4326").apply(projected.first, projected.second);
    expect_near(back.first, -90.25, 1e-7, "albers round trip longitude");
    expect_near(back.second, 38.6, 1e-7, "albers round trip latitude");

    auto mercator = floodrisk::make_transform("EPSG:4326", "EPSG:3857").apply(180.0, 0.0);
    expect_near(mercator.first, 20037508.342789244, 1e-3, "web mercator half circumference");

    auto utm = floodrisk::make_transform("EPSG:26915", "EPSG:4269").apply(500000.0, 0.0);
    expect_near(utm.first, -93.0, 1e-9, "utm zone 15 central meridian");
    expect_near(utm.second, 0.0, 1e-9, "utm zone 15 equator");

    std::vector<double> xs{-96.0, -90.25};
    std::vector<double> ys{23.0, 38.6};
    to_albers.apply(xs, ys);
    expect_near(xs[0], 0.0, 1e-6, "batch transform matches point transform");
    expect_true(std::isfinite(xs[1]) && std::isfinite(ys[1]), "batch transform fills every point");

    auto extent = floodrisk::transform_extent(floodrisk::Extent{-91.0, 37.0, -89.0, 39.0},
                                              floodrisk::make_transform("EPSG:4326", "EPSG:5070"));
    expect_true(!extent.empty() && extent.width() > 150000.0 && extent.width() < 250000.0,
                "densified extent spans two degrees of longitude");

    expect_true(floodrisk::make_transform("epsg:4326", "EPSG:4326").is_identity(), "crs match ignores case");
    expect_true(floodrisk::area_units("EPSG:5070") == "m^2", "projected area units");
    expect_true(floodrisk::area_units("EPSG:4326") == "deg^2", "geographic area units");
    expect_throws_kind([] { floodrisk::make_transform("NOT-A-CRS", "EPSG:4326"); },
                       floodrisk::ErrorKind::kIncompatibleCrs, "unresolvable source crs rejected");
    expect_throws_kind([] { floodrisk::make_transform("EPSG:4326", "EPSG:999999"); },
                       floodrisk::ErrorKind::kIncompatibleCrs, "unknown epsg code rejected");
}

void test_alignment() {
    floodrisk::ClassRaster severity("severity", geo_grid(0.0, 4.0, 2.0, 2, 2), floodrisk::kClassNoData);
    severity.values = {0, 1, 2, 3};
    floodrisk::ScoreRaster vulnerability("vulnerability", geo_grid(0.0, 4.0, 1.0, 4, 4), floodrisk::kDepthNoData);
    for (std::size_t i = 0; i < vulnerability.values.size(); ++i) {
        vulnerability.values[i] = 0.1 * static_cast<double>(i);
    }

    floodrisk::GridAligner aligner;
    auto pair = aligner.align(severity, vulnerability);
    expect_true(pair.report.target.same_grid(vulnerability.grid), "derived grid takes the finer resolution");
    expect_true(pair.report.severity_resampled && !pair.report.vulnerability_resampled,
                "only the coarse raster is resampled");
    expect_true(pair.severity.grid.same_grid(pair.vulnerability.grid), "aligned rasters share one grid");
    expect_true(pair.severity.at(0, 0) == 0 && pair.severity.at(3, 3) == 3, "nearest-neighbour labels preserved");
    expect_true(pair.severity.at(1, 2) == 2, "nearest-neighbour lower-left block");
    expect_true(pair.vulnerability.values == vulnerability.values, "on-grid raster copied unchanged");

    auto again = aligner.align(pair.severity, pair.vulnerability);
    expect_true(!again.report.severity_resampled && !again.report.vulnerability_resampled,
                "aligning an aligned pair resamples nothing");
    expect_true(again.severity.values == pair.severity.values, "alignment is idempotent for severity");
    expect_true(again.vulnerability.values == pair.vulnerability.values, "alignment is idempotent for vulnerability");

    floodrisk::ScoreRaster far("far", geo_grid(100.0, 104.0, 1.0, 4, 4), floodrisk::kDepthNoData);
    expect_throws_kind([&] { aligner.align(severity, far); }, floodrisk::ErrorKind::kDisjointExtents,
                       "disjoint extents rejected");

    floodrisk::ScoreRaster unknown("unknown", floodrisk::GridSpec{"NOT-A-CRS", 0.0, 4.0, 1.0, 1.0, 4, 4},
                                   floodrisk::kDepthNoData);
    expect_throws_kind([&] { aligner.align(severity, unknown); }, floodrisk::ErrorKind::kIncompatibleCrs,
                       "unresolvable crs rejected");

    floodrisk::GridAligner explicit_aligner(geo_grid(0.0, 4.0, 2.0, 2, 2));
    auto coarse = explicit_aligner.align(severity, vulnerability);
    expect_true(coarse.report.target.cols == 2 && !coarse.report.derived, "explicit grid is honoured");
    expect_true(!coarse.report.severity_resampled && coarse.report.vulnerability_resampled,
                "explicit grid resamples the off-grid raster");
}

void test_alignment_across_crs() {
    auto center = floodrisk::make_transform("EPSG:4326", "EPSG:5070").apply(-90.0, 38.0);
    const double origin_x = std::round(center.first) - 1500.0;
    const double origin_y = std::round(center.second) + 1500.0;
    floodrisk::ClassRaster severity("severity",
                                    floodrisk::GridSpec{"EPSG:5070", origin_x, origin_y, 30.0, 30.0, 100, 100},
                                    floodrisk::kClassNoData);
    for (int row = 0; row < 100; ++row) {
        for (int col = 0; col < 100; ++col) {
            severity.at(col, row) = col / 25;
        }
    }

    floodrisk::ScoreRaster vulnerability("vulnerability", geo_grid(-91.0, 39.0, 0.01, 200, 200),
                                         floodrisk::kDepthNoData);
    for (int row = 0; row < 200; ++row) {
        for (int col = 0; col < 200; ++col) {
            vulnerability.at(col, row) = vulnerability.grid.pixel_center(col, row).first;
        }
    }

    floodrisk::GridAligner aligner;
    auto pair = aligner.align(severity, vulnerability);
    const auto& target = pair.report.target;
    expect_true(target.crs == "EPSG:5070", "derived grid uses the severity crs");
    expect_near(target.pixel_width, 30.0, 1e-9, "derived grid keeps the finer 30 m pixels");
    expect_near(target.pixel_height, 30.0, 1e-9, "derived grid keeps the finer 30 m rows");

    const auto bounds = target.extent();
    const auto severity_bounds = severity.grid.extent();
    const auto vulnerability_bounds = floodrisk::transform_extent(
        vulnerability.grid.extent(), floodrisk::make_transform("EPSG:4326", "EPSG:5070"));
    expect_true(bounds.min_x >= severity_bounds.min_x - 1e-6 && bounds.max_x <= severity_bounds.max_x + 1e-6 &&
                    bounds.min_y >= severity_bounds.min_y - 1e-6 && bounds.max_y <= severity_bounds.max_y + 1e-6,
                "target inside the severity extent");
    expect_true(bounds.min_x >= vulnerability_bounds.min_x && bounds.max_x <= vulnerability_bounds.max_x &&
                    bounds.min_y >= vulnerability_bounds.min_y && bounds.max_y <= vulnerability_bounds.max_y,
                "target inside the projected vulnerability extent");
    expect_true(pair.vulnerability.valid_count() == pair.vulnerability.values.size(),
                "projected vulnerability has no missing pixels");
    expect_true(pair.severity.valid_count() == pair.severity.values.size(), "severity has no missing pixels");

    auto to_geographic = floodrisk::make_transform("EPSG:5070", "EPSG:4326");
    double worst = 0.0;
    for (int row = 0; row < target.rows; ++row) {
        for (int col = 0; col < target.cols; ++col) {
            auto xy = target.pixel_center(col, row);
            auto lonlat = to_geographic.apply(xy.first, xy.second);
            worst = std::max(worst, std::fabs(pair.vulnerability.at(col, row) - lonlat.first));
        }
    }
    expect_near(worst, 0.0, 1e-6, "vulnerability carries the longitude of each projected pixel");

    floodrisk::GridAligner geographic(geo_grid(-90.008, 38.008, 0.0008, 20, 20));
    auto onto_geographic = geographic.align(severity, vulnerability);
    expect_true(onto_geographic.report.severity_resampled, "severity reprojected onto the geographic grid");
    expect_true(onto_geographic.severity.valid_count() == onto_geographic.severity.values.size(),
                "reprojected severity has no missing pixels");
    bool ordered = true;
    for (int row = 0; row < 20; ++row) {
        for (int col = 0; col < 20; ++col) {
            const int value = onto_geographic.severity.at(col, row);
            if (value < 0 || value > 3 || (col > 0 && value < onto_geographic.severity.at(col - 1, row))) {
                ordered = false;
            }
        }
    }
    expect_true(ordered, "reprojected classes stay within range and increase eastward");
}

void test_bilinear() {
    floodrisk::ScoreRaster source("score", geo_grid(0.0, 1.0, 1.0, 2, 1), floodrisk::kDepthNoData);
    source.values = {0.0, 10.0};
    auto fine = floodrisk::resample_bilinear(source, geo_grid(0.0, 1.0, 0.5, 4, 1));
    expect_near(fine.at(0, 0), 0.0, 1e-12, "bilinear edge pixel");
    expect_near(fine.at(1, 0), 2.5, 1e-12, "bilinear blends neighbour centres");
    expect_near(fine.at(2, 0), 7.5, 1e-12, "bilinear blends toward the second centre");

    source.values = {0.0, floodrisk::kDepthNoData};
    auto masked = floodrisk::resample_bilinear(source, geo_grid(0.0, 1.0, 0.5, 4, 1));
    expect_near(masked.at(1, 0), 0.0, 1e-12, "bilinear renormalises over valid neighbours");
    expect_true(masked.is_nodata(masked.at(2, 0)), "no-data source pixel stays no-data");
}

void test_quantiles() {
    auto tiering = floodrisk::compute_quantile_tiers(std::vector<double>{0.9, 0.1, 0.3, 0.2, 0.4}, 4);
    expect_true(tiering.breakpoints.size() == 3, "four tiers from five values");
    expect_near(tiering.breakpoints[0], 0.2, 1e-12, "first breakpoint");
    expect_near(tiering.breakpoints[1], 0.3, 1e-12, "second breakpoint");
    expect_near(tiering.breakpoints[2], 0.4, 1e-12, "third breakpoint");
    expect_true(tiering.tier(0.2) == 0, "value on a breakpoint falls in the lower tier");
    expect_true(tiering.tier(0.25) == 1, "value between breakpoints");
    expect_true(tiering.tier(0.9) == 3, "maximum falls in the top tier");
    expect_true(tiering.tier_ranges.size() == 4, "one observed range per tier");
    expect_near(tiering.tier_ranges[0].second, 0.2, 1e-12, "lowest tier spans up to its breakpoint");
    expect_near(tiering.tier_ranges[3].first, 0.9, 1e-12, "top tier holds only the maximum");

    auto tied = floodrisk::compute_quantile_tiers(std::vector<double>{1.0, 1.0, 1.0, 1.0, 2.0}, 4);
    expect_true(tied.tier_count() < 4, "ties merge breakpoints");
    expect_true(tied.tier(1.0) == 0 && tied.tier(2.0) == tied.tier_count() - 1, "tied tiers stay ordered");

    expect_throws_kind([] { floodrisk::compute_quantile_tiers(std::vector<double>{}, 4); },
                       floodrisk::ErrorKind::kEmptyInput, "empty vulnerability rejected");
}

void test_risk_table() {
    floodrisk::RiskClassTable identity(4, 4);
    expect_true(identity.band_count() == 16, "identity table has one band per pair");
    bool monotonic = true;
    for (int s = 0; s < 4; ++s) {
        for (int v = 0; v < 4; ++v) {
            if (s + 1 < 4 && identity.band(s + 1, v) < identity.band(s, v)) {
                monotonic = false;
            }
            if (v + 1 < 4 && identity.band(s, v + 1) < identity.band(s, v)) {
                monotonic = false;
            }
        }
    }
    expect_true(monotonic, "identity bands are monotonic in both inputs");
    expect_true(identity.combined(2, 3) == 11, "combined class encoding");

    auto settings = fema_settings();
    settings.collapse.rows[0] = std::vector<int>{0, 0, 0, 1};
    settings.collapse.rows[1] = std::vector<int>{0, 1, 1, 2};
    settings.collapse.rows[2] = std::vector<int>{1, 2, 2, 3};
    settings.collapse.rows[3] = std::vector<int>{2, 3, 3, 3};
    settings.validate();
    auto collapsed = floodrisk::RiskClassTable::from_config(settings);
    expect_true(collapsed.band_count() == 4, "collapse table band count");
    expect_true(collapsed.band(3, 3) == 3 && collapsed.band(0, 0) == 0, "collapse lookup");
    expect_true(collapsed.band_name(3) == "Very High Risk", "four-band collapse names");

    settings.collapse.rows[3] = std::vector<int>{2, 3, 1, 3};
    expect_throws_kind([&] { settings.validate(); }, floodrisk::ErrorKind::kMissingConfiguration,
                       "non-monotonic collapse table rejected");
}

void test_fusion() {
    floodrisk::ClassRaster severity("severity", geo_grid(0.0, 1.0, 1.0, 5, 1), floodrisk::kClassNoData);
    severity.values = {0, 1, 2, 3, floodrisk::kClassNoData};
    floodrisk::ScoreRaster vulnerability("vulnerability", severity.grid, floodrisk::kDepthNoData);
    vulnerability.values = {0.1, 0.2, floodrisk::kDepthNoData, 0.4, 0.9};

    floodrisk::AlignedPair pair{severity, vulnerability, {}};
    floodrisk::RiskFusionEngine engine(floodrisk::RiskClassTable(4, 4), 4);
    auto result = engine.fuse(pair);
    expect_true(result.valid_pixels == 3, "only pixels with both inputs are fused");
    expect_true(result.raster.bands.values[2] == floodrisk::kClassNoData, "missing vulnerability propagates");
    expect_true(result.raster.bands.values[4] == floodrisk::kClassNoData, "missing severity propagates");
    expect_true(result.raster.severity_tier.values[3] == 3, "severity tier recorded");

    std::size_t pixels = 0;
    double percent = 0.0;
    for (const auto& band : result.bands) {
        pixels += band.pixels;
        percent += band.percent;
    }
    expect_true(pixels == result.valid_pixels, "band pixels sum to the valid pixel count");
    expect_near(percent, 100.0, 1e-9, "band percentages sum to 100");
    expect_true(result.area_units == "deg^2", "geographic area units");

    bool propagated = false;
    for (const auto& warning : result.warnings) {
        propagated = propagated || (warning.code == "nodata_propagated" && warning.count == 2);
    }
    expect_true(propagated, "no-data propagation reported");

    floodrisk::AlignedPair empty{severity, vulnerability, {}};
    std::fill(empty.severity.values.begin(), empty.severity.values.end(), floodrisk::kClassNoData);
    expect_throws_kind([&] { engine.fuse(empty); }, floodrisk::ErrorKind::kEmptyInput,
                       "fusion with no valid pixel rejected");
}

void test_config() {
    std::istringstream input(
        "cycle = \"2024010100\"\n"
        "[logging]\n"
        "level = \"warn\"\n"
        "json = false\n"
        "[severity]\n"
        "moderate = 0.4  # FEMA\n"
        "high = 0.8\n"
        "very_high = 1.8\n"
        "[vulnerability]\n"
        "quantile_count = 5\n"
        "crs = \"EPSG:4269\"\n"
        "[grid]\n"
        "mode = \"explicit\"\n"
        "crs = \"EPSG:5070\"\n"
        "origin_x = -100000\n"
        "origin_y = 200000\n"
        "pixel_width = 30\n"
        "pixel_height = 30\n"
        "cols = 100\n"
        "rows = 50\n"
        "[inputs]\n"
        "forecast = \"forecast.csv\"\n");
    auto settings = floodrisk::EngineSettings::parse(input);
    settings.validate();
    expect_true(settings.cycle == "2024010100", "top-level cycle");
    expect_true(settings.logging.level == "WARN" && !settings.logging.json, "logging section");
    expect_near(*settings.severity.very_high, 1.8, 1e-12, "severity threshold parsed");
    expect_true(settings.vulnerability.quantile_count == 5, "quantile count parsed");
    expect_true(settings.grid.target().has_value() && settings.grid.target()->cols == 100, "explicit grid parsed");
    expect_true(settings.inputs.forecast && *settings.inputs.forecast == "forecast.csv", "input path parsed");

    std::istringstream missing_threshold("[severity]\nmoderate = 0.4\nhigh = 0.8\n");
    auto incomplete = floodrisk::EngineSettings::parse(missing_threshold);
    expect_throws_kind([&] { incomplete.validate(); }, floodrisk::ErrorKind::kMissingConfiguration,
                       "missing threshold rejected");
    expect_throws_kind([&] { floodrisk::FloodRiskEngine engine(incomplete); },
                       floodrisk::ErrorKind::kMissingConfiguration, "engine refuses incomplete settings");

    std::istringstream bad_number("[severity]\nmoderate = shallow\n");
    expect_throws_kind([&] { floodrisk::EngineSettings::parse(bad_number); }, floodrisk::ErrorKind::kInvalidInput,
                       "malformed number rejected");
    expect_throws_kind([] { floodrisk::EngineSettings::from_toml("/nonexistent/floodrisk.toml"); },
                       floodrisk::ErrorKind::kMissingConfiguration, "missing config file rejected");
}

void test_engine() {
    floodrisk::FloodRiskEngine engine(fema_settings());
    auto result = engine.run(sample_cycle(), sample_catalog(), sample_vulnerability());
    const auto& summary = result.summary;

    expect_true(summary.reach_count == 2, "summary reach count");
    expect_true(summary.valid_pixels == 8, "fused pixels cover both catchments");
    expect_true(summary.nodata_pixels == 8, "unpainted pixels are no-data");
    expect_near(result.depth.raster.at(0, 0), 0.5, 1e-12, "depth painted for reach 101");
    expect_near(result.depth.raster.at(3, 3), 4.0, 1e-12, "depth painted for reach 102");
    expect_true(result.severity.at(0, 0) == 1 && result.severity.at(3, 3) == 3, "severity classes");
    expect_true(result.risk.combined.at(0, 0) == 4, "lowest vulnerability tier at moderate severity");
    expect_true(result.risk.combined.at(3, 3) == 15, "highest tier at very high severity");
    expect_true(result.risk.bands.is_nodata(result.risk.bands.at(3, 0)), "unpainted pixel has no risk band");
    expect_true(summary.priority_reaches.size() == 1 && summary.priority_reaches[0] == "102", "priority reaches");
    expect_true(summary.severity_counts[1] == 4 && summary.severity_counts[3] == 4, "severity histogram");
    expect_near(summary.depth.max_depth, 4.0, 1e-12, "maximum depth");

    bool extrapolated = false;
    for (const auto& warning : summary.warnings) {
        extrapolated = extrapolated || (warning.code == "extrapolated_high" && warning.key == "102");
    }
    expect_true(extrapolated, "extrapolated reach reported");

    auto rerun = engine.run(sample_cycle(), sample_catalog(), sample_vulnerability());
    expect_true(rerun.risk.bands.values == result.risk.bands.values, "runs are deterministic");

    floodrisk::ForecastCycle empty;
    empty.id = "empty";
    expect_throws_kind([&] { engine.run(empty, sample_catalog(), sample_vulnerability()); },
                       floodrisk::ErrorKind::kEmptyInput, "empty forecast cycle rejected");
}

void test_io() {
    const auto dir = std::filesystem::temp_directory_path() / "floodrisk_tests";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    write_text(dir / "catchments.asc",
               "ncols 4\nnrows 4\nxllcorner 0\nyllcorner 0\ncellsize 1\nNODATA_value -9999\n"
               "101 101 -9999 -9999\n101 101 -9999 -9999\n-9999 -9999 102 102\n-9999 -9999 102 102\n");
    write_text(dir / "ratings.csv",
               "feature_id,discharge,depth\n101,0,0\n101,100,1\n101,200,3\n102,0,0\n102,100,1\n102,200,3\n");
    write_text(dir / "forecast.csv", "feature_id,streamflow\n101,50\n102,250\n");
    std::ostringstream vulnerability;
    vulnerability << "ncols 4\nnrows 4\nxllcenter 0.5\nyllcenter 0.5\ncellsize 1\nNODATA_value -9999\n";
    for (int i = 1; i <= 16; ++i) {
        vulnerability << i << ((i % 4 == 0) ? "\n" : " ");
    }
    write_text(dir / "vulnerability.asc", vulnerability.str());

    auto grid = floodrisk::read_ascii_grid((dir / "vulnerability.asc").string(), "EPSG:4326", "vulnerability");
    expect_true(grid.grid.same_grid(sample_vulnerability().grid), "ascii grid header resolves to the same grid");
    expect_near(grid.at(3, 3), 16.0, 1e-12, "ascii grid cell order");

    auto catalog = floodrisk::load_reach_catalog((dir / "catchments.asc").string(), (dir / "ratings.csv").string(),
                                                 std::nullopt, "EPSG:4326");
    expect_true(catalog->size() == 2, "catalog loads every rated reach");
    expect_true(catalog->reach("102").mask.size() == 4, "catchment grid builds reach masks");

    auto cycle = floodrisk::read_forecast_csv((dir / "forecast.csv").string(), "2024010100");
    expect_true(cycle.samples.size() == 2 && cycle.samples[1].max_discharge == 250.0, "forecast csv parsed");

    write_text(dir / "bad.csv", "feature_id,discharge\n101,fifty\n");
    try {
        floodrisk::read_forecast_csv((dir / "bad.csv").string(), "bad");
        expect_true(false, "malformed forecast row rejected");
    } catch (const floodrisk::FusionError& err) {
        expect_true(err.kind() == floodrisk::ErrorKind::kInvalidInput, "malformed row raises invalid input");
        expect_true(err.key().find(":2") != std::string::npos, "malformed row error names the line");
    }

    write_text(dir / "duplicate.csv", "feature_id,streamflow,streamflow\n101,50\n");
    expect_throws_kind([&] { floodrisk::read_forecast_csv((dir / "duplicate.csv").string(), "dup"); },
                       floodrisk::ErrorKind::kInvalidInput, "duplicate csv column rejected");
    write_text(dir / "short.csv", "feature_id,streamflow,member\n101,50\n");
    expect_throws_kind([&] { floodrisk::read_forecast_csv((dir / "short.csv").string(), "short"); },
                       floodrisk::ErrorKind::kInvalidInput, "row shorter than the header rejected");

    write_text(dir / "fractional.asc", "ncols 2.5\nnrows 2\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 2\n3 4\n");
    expect_throws_kind([&] { floodrisk::read_ascii_grid((dir / "fractional.asc").string(), "EPSG:4326", "f"); },
                       floodrisk::ErrorKind::kInvalidInput, "fractional ncols rejected");
    write_text(dir / "huge.asc", "ncols 1e12\nnrows 2\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 2\n3 4\n");
    expect_throws_kind([&] { floodrisk::read_ascii_grid((dir / "huge.asc").string(), "EPSG:4326", "h"); },
                       floodrisk::ErrorKind::kInvalidInput, "ncols beyond int range rejected");
    write_text(dir / "oversized.asc", "ncols 50000\nnrows 50000\nxllcorner 0\nyllcorner 0\ncellsize 1\n1 2\n");
    expect_throws_kind([&] { floodrisk::read_ascii_grid((dir / "oversized.asc").string(), "EPSG:4326", "o"); },
                       floodrisk::ErrorKind::kInvalidInput, "header larger than the file rejected");

    auto settings = fema_settings();
    settings.cycle = "2024010100";
    settings.inputs.reach_crs = "EPSG:4326";
    settings.vulnerability.crs = "EPSG:4326";
    settings.inputs.catchment_grid = (dir / "catchments.asc").string();
    settings.inputs.rating_table = (dir / "ratings.csv").string();
    settings.inputs.forecast = (dir / "forecast.csv").string();
    settings.inputs.vulnerability_grid = (dir / "vulnerability.asc").string();
    settings.logging.level = "ERROR";

    floodrisk::FloodRiskEngine engine(settings);
    auto inputs = floodrisk::load_cycle_inputs(engine.settings());
    auto result = engine.run(inputs.cycle, inputs.catalog, inputs.vulnerability);
    auto outputs = floodrisk::write_cycle_outputs(result, engine, (dir / "out").string());

    expect_true(std::filesystem::exists(outputs.depth_grid), "depth grid written");
    expect_true(std::filesystem::exists(outputs.risk_grid), "risk grid written");
    auto depths = read_text(outputs.reach_depths);
    expect_true(depths.find("102,250,4,3,Very High,extrapolated_high") != std::string::npos, "reach depth record");
    auto json = read_text(outputs.summary);
    expect_true(json.find("\"cycle\": \"2024010100\"") != std::string::npos, "summary json names the cycle");
    expect_true(json.find("\"priority_reaches\": [\"102\"]") != std::string::npos, "summary json priority reaches");

    auto risk = floodrisk::read_ascii_grid(outputs.risk_grid, "EPSG:4326", "risk");
    expect_near(risk.at(3, 3), 15.0, 1e-12, "risk grid round trip");
    expect_true(risk.is_nodata(risk.at(3, 0)), "risk grid keeps no-data");

    settings.inputs.forecast.reset();
    expect_throws_kind([&] { floodrisk::load_cycle_inputs(settings); }, floodrisk::ErrorKind::kMissingConfiguration,
                       "missing input path rejected");

    std::filesystem::remove_all(dir);
}

}  // namespace

int main() {
    floodrisk::LoggingConfig quiet;
    quiet.level = "ERROR";
    quiet.json = false;
    floodrisk::configure_logging(quiet);

    try {
        test_rating_curve();
        test_resolver();
        test_depth_rasterizer();
        test_severity();
        test_crs();
        test_alignment();
        test_alignment_across_crs();
        test_bilinear();
        test_quantiles();
        test_risk_table();
        test_fusion();
        test_config();
        test_engine();
        test_io();
    } catch (const std::exception& exc) {
        std::cerr << "Unhandled exception: " << exc.what() << "\n";
        return 1;
    }

    if (failures > 0) {
        std::cerr << failures << " test(s) failed.\n";
        return 1;
    }

    std::cout << "All tests passed.\n";
    return 0;
}

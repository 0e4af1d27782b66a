#include "floodrisk/aligner.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

#include "floodrisk/crs.hpp"
#include "floodrisk/errors.hpp"

namespace floodrisk {

namespace {

std::string format_double(double value) {
    std::ostringstream out;
    out.precision(12);
    out << value;
    return out.str();
}

double finer(double a, double b) {
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    if (std::fabs(a - b) <= 1e-9 * scale) {
        return a;
    }
    return std::min(a, b);
}

int fit_count(double span, double step) {
    return std::max(1, static_cast<int>(std::floor(span / step + 1e-6)));
}

// Fractional source column and row of every target pixel centre, in target row-major order.
struct SourcePoints {
    std::vector<double> fc;
    std::vector<double> fr;
};

SourcePoints source_points(const GridSpec& source, const GridSpec& target) {
    const CoordinateTransform transform = make_transform(target.crs, source.crs);
    SourcePoints points;
    points.fc.resize(target.size());
    points.fr.resize(target.size());
    for (int row = 0; row < target.rows; ++row) {
        for (int col = 0; col < target.cols; ++col) {
            auto [x, y] = target.pixel_center(col, row);
            points.fc[target.index(col, row)] = x;
            points.fr[target.index(col, row)] = y;
        }
    }
    transform.apply(points.fc, points.fr);
    for (std::size_t i = 0; i < points.fc.size(); ++i) {
        points.fc[i] = (points.fc[i] - source.origin_x) / source.pixel_width;
        points.fr[i] = (source.origin_y - points.fr[i]) / source.pixel_height;
    }
    return points;
}

bool source_cell(const GridSpec& source, double fc, double fr, int& col, int& row) {
    if (!(fc >= 0.0 && fc < source.cols && fr >= 0.0 && fr < source.rows)) {
        return false;
    }
    col = static_cast<int>(fc);
    row = static_cast<int>(fr);
    return source.contains(col, row);
}

void require_grid(const GridSpec& grid, const std::string& name) {
    if (grid.cols <= 0 || grid.rows <= 0) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kGridAligner, name, "raster has no pixels");
    }
    if (!(grid.pixel_width > 0.0) || !(grid.pixel_height > 0.0)) {
        throw FusionError(ErrorKind::kInvalidInput, Stage::kGridAligner, name, "pixel size must be positive");
    }
}

}  // namespace

ClassRaster resample_nearest(const ClassRaster& source, const GridSpec& target) {
    const SourcePoints points = source_points(source.grid, target);
    ClassRaster output(source.name, target, source.nodata);
    const GridSpec& src = source.grid;
    const long long count = static_cast<long long>(target.size());

#pragma omp parallel for schedule(static)
    for (long long i = 0; i < count; ++i) {
        const auto index = static_cast<std::size_t>(i);
        int src_col = 0;
        int src_row = 0;
        if (source_cell(src, points.fc[index], points.fr[index], src_col, src_row)) {
            output.values[index] = source.at(src_col, src_row);
        }
    }
    return output;
}

ScoreRaster resample_bilinear(const ScoreRaster& source, const GridSpec& target) {
    const SourcePoints points = source_points(source.grid, target);
    ScoreRaster output(source.name, target, source.nodata);
    const GridSpec& src = source.grid;
    const long long count = static_cast<long long>(target.size());

#pragma omp parallel for schedule(static)
    for (long long i = 0; i < count; ++i) {
        const auto index = static_cast<std::size_t>(i);
        const double fc = points.fc[index];
        const double fr = points.fr[index];
        int near_col = 0;
        int near_row = 0;
        if (!source_cell(src, fc, fr, near_col, near_row)) {
            continue;
        }
        const double nearest = source.at(near_col, near_row);
        if (source.is_nodata(nearest)) {
            continue;
        }

        // Neighbour weights are taken between pixel centres.
        const double gx = fc - 0.5;
        const double gy = fr - 0.5;
        const int c0 = static_cast<int>(std::floor(gx));
        const int r0 = static_cast<int>(std::floor(gy));
        const double tx = gx - c0;
        const double ty = gy - r0;
        double weighted = 0.0;
        double weight_total = 0.0;
        for (int dr = 0; dr <= 1; ++dr) {
            for (int dc = 0; dc <= 1; ++dc) {
                const int c = c0 + dc;
                const int r = r0 + dr;
                if (!src.contains(c, r)) {
                    continue;
                }
                const double value = source.at(c, r);
                if (source.is_nodata(value)) {
                    continue;
                }
                const double weight = (dc == 0 ? 1.0 - tx : tx) * (dr == 0 ? 1.0 - ty : ty);
                weighted += weight * value;
                weight_total += weight;
            }
        }
        output.values[index] = weight_total > 0.0 ? weighted / weight_total : nearest;
    }
    return output;
}

GridAligner::GridAligner(std::optional<GridSpec> target, Logger logger)
    : target_(std::move(target)), logger_(std::move(logger)) {}

GridSpec GridAligner::derive_target(const GridSpec& severity, const GridSpec& vulnerability,
                                    const std::string& severity_name,
                                    const std::string& vulnerability_name) const {
    require_grid(severity, severity_name);
    require_grid(vulnerability, vulnerability_name);

    const CoordinateTransform to_target = make_transform(vulnerability.crs, severity.crs);
    const Extent vulnerability_extent = transform_extent(vulnerability.extent(), to_target);
    const Extent overlap = severity.extent().intersect(vulnerability_extent);
    if (overlap.empty()) {
        throw FusionError(ErrorKind::kDisjointExtents, Stage::kGridAligner, severity_name + "/" + vulnerability_name,
                          "raster extents do not overlap");
    }

    const double vulnerability_width = vulnerability_extent.width() / vulnerability.cols;
    const double vulnerability_height = vulnerability_extent.height() / vulnerability.rows;
    const double pixel_width = finer(severity.pixel_width, vulnerability_width);
    const double pixel_height = finer(severity.pixel_height, vulnerability_height);

    return GridSpec{severity.crs,
                    overlap.min_x,
                    overlap.max_y,
                    pixel_width,
                    pixel_height,
                    fit_count(overlap.width(), pixel_width),
                    fit_count(overlap.height(), pixel_height)};
}

AlignedPair GridAligner::align(const ClassRaster& severity, const ScoreRaster& vulnerability) const {
    // Overlap is checked in both modes; an explicit grid cannot rescue disjoint inputs.
    const GridSpec derived = derive_target(severity.grid, vulnerability.grid, severity.name, vulnerability.name);
    const GridSpec target = target_ ? *target_ : derived;
    require_grid(target, "target_grid");

    AlignmentReport report;
    report.target = target;
    report.derived = !target_.has_value();
    report.severity_source = severity.grid.describe();
    report.vulnerability_source = vulnerability.grid.describe();

    ClassRaster aligned_severity;
    if (severity.grid.same_grid(target)) {
        aligned_severity = severity;
    } else {
        aligned_severity = resample_nearest(severity, target);
        report.severity_resampled = true;
    }

    ScoreRaster aligned_vulnerability;
    if (vulnerability.grid.same_grid(target)) {
        aligned_vulnerability = vulnerability;
    } else {
        aligned_vulnerability = resample_bilinear(vulnerability, target);
        report.vulnerability_resampled = true;
    }

    logger_.info("alignment_grid_selected",
                 {{"mode", report.derived ? "intersection" : "explicit"},
                  {"crs", target.crs},
                  {"origin_x", format_double(target.origin_x)},
                  {"origin_y", format_double(target.origin_y)},
                  {"pixel_width", format_double(target.pixel_width)},
                  {"pixel_height", format_double(target.pixel_height)},
                  {"cols", std::to_string(target.cols)},
                  {"rows", std::to_string(target.rows)},
                  {"severity_source", report.severity_source},
                  {"vulnerability_source", report.vulnerability_source},
                  {"severity_resampled", report.severity_resampled ? "true" : "false"},
                  {"vulnerability_resampled", report.vulnerability_resampled ? "true" : "false"}});

    return AlignedPair{std::move(aligned_severity), std::move(aligned_vulnerability), report};
}

}  // namespace floodrisk

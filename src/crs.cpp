#include "floodrisk/crs.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <cpl_error.h>
#include <ogr_spatialref.h>

#include "floodrisk/common.hpp"
#include "floodrisk/errors.hpp"

namespace floodrisk {

namespace {

class QuietGdalErrors {
public:
    QuietGdalErrors() { CPLPushErrorHandler(CPLQuietErrorHandler); }
    ~QuietGdalErrors() { CPLPopErrorHandler(); }
    QuietGdalErrors(const QuietGdalErrors&) = delete;
    QuietGdalErrors& operator=(const QuietGdalErrors&) = delete;
};

bool import_crs(const std::string& crs, OGRSpatialReference& reference) {
    if (trim(crs).empty()) {
        return false;
    }
    QuietGdalErrors quiet;
    if (reference.SetFromUserInput(trim(crs).c_str()) != OGRERR_NONE) {
        return false;
    }
    reference.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return true;
}

void destroy_transformation(OGRCoordinateTransformation* transformation) {
    OGRCoordinateTransformation::DestroyCT(transformation);
}

}  // namespace

std::string normalize_crs(const std::string& crs) {
    return to_upper(trim(crs));
}

std::string area_units(const std::string& crs) {
    OGRSpatialReference reference;
    if (!import_crs(crs, reference)) {
        return "units^2";
    }
    if (reference.IsGeographic()) {
        return "deg^2";
    }
    if (reference.IsProjected()) {
        const char* unit_name = nullptr;
        const double to_metre = reference.GetLinearUnits(&unit_name);
        if (std::fabs(to_metre - 1.0) < 1e-12) {
            return "m^2";
        }
        if (unit_name != nullptr) {
            return std::string(unit_name) + "^2";
        }
    }
    return "units^2";
}

CoordinateTransform::CoordinateTransform(std::shared_ptr<OGRCoordinateTransformation> transformation)
    : transformation_(std::move(transformation)) {}

std::pair<double, double> CoordinateTransform::apply(double x, double y) const {
    if (!transformation_) {
        return {x, y};
    }
    int success = 0;
    if (!transformation_->Transform(1, &x, &y, nullptr, &success) || !success) {
        return {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN()};
    }
    return {x, y};
}

void CoordinateTransform::apply(std::vector<double>& xs, std::vector<double>& ys) const {
    if (!transformation_ || xs.empty()) {
        return;
    }
    const std::size_t count = std::min(xs.size(), ys.size());
    std::vector<int> success(count, 0);
    transformation_->Transform(static_cast<int>(count), xs.data(), ys.data(), nullptr, success.data());
    for (std::size_t i = 0; i < count; ++i) {
        if (!success[i]) {
            xs[i] = std::numeric_limits<double>::quiet_NaN();
            ys[i] = std::numeric_limits<double>::quiet_NaN();
        }
    }
}

CoordinateTransform make_transform(const std::string& source, const std::string& target) {
    if (normalize_crs(source) == normalize_crs(target)) {
        return CoordinateTransform{};
    }
    OGRSpatialReference source_ref;
    if (!import_crs(source, source_ref)) {
        throw FusionError(ErrorKind::kIncompatibleCrs, Stage::kGridAligner, source.empty() ? "<empty>" : source,
                          "spatial reference cannot be resolved");
    }
    OGRSpatialReference target_ref;
    if (!import_crs(target, target_ref)) {
        throw FusionError(ErrorKind::kIncompatibleCrs, Stage::kGridAligner, target.empty() ? "<empty>" : target,
                          "spatial reference cannot be resolved");
    }
    QuietGdalErrors quiet;
    std::shared_ptr<OGRCoordinateTransformation> transformation(
        OGRCreateCoordinateTransformation(&source_ref, &target_ref), destroy_transformation);
    if (!transformation) {
        throw FusionError(ErrorKind::kIncompatibleCrs, Stage::kGridAligner, source + "/" + target,
                          "no coordinate operation between the two references");
    }
    return CoordinateTransform(std::move(transformation));
}

Extent transform_extent(const Extent& extent, const CoordinateTransform& transform, int samples_per_edge) {
    if (transform.is_identity()) {
        return extent;
    }
    const int steps = std::max(2, samples_per_edge);
    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(static_cast<std::size_t>(steps) * 4);
    ys.reserve(static_cast<std::size_t>(steps) * 4);
    for (int i = 0; i < steps; ++i) {
        const double t = static_cast<double>(i) / (steps - 1);
        const double x = extent.min_x + t * extent.width();
        const double y = extent.min_y + t * extent.height();
        xs.insert(xs.end(), {x, x, extent.min_x, extent.max_x});
        ys.insert(ys.end(), {extent.min_y, extent.max_y, y, y});
    }
    transform.apply(xs, ys);

    Extent out{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
               std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
    for (std::size_t i = 0; i < xs.size(); ++i) {
        if (!std::isfinite(xs[i]) || !std::isfinite(ys[i])) {
            continue;
        }
        out.min_x = std::min(out.min_x, xs[i]);
        out.min_y = std::min(out.min_y, ys[i]);
        out.max_x = std::max(out.max_x, xs[i]);
        out.max_y = std::max(out.max_y, ys[i]);
    }
    return out;
}

}  // namespace floodrisk

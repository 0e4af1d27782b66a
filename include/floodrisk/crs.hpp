#ifndef FLOODRISK_CRS_HPP
#define FLOODRISK_CRS_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "floodrisk/raster.hpp"

class OGRCoordinateTransformation;

namespace floodrisk {

std::string normalize_crs(const std::string& crs);
std::string area_units(const std::string& crs);

class CoordinateTransform {
public:
    CoordinateTransform() = default;
    explicit CoordinateTransform(std::shared_ptr<OGRCoordinateTransformation> transformation);

    bool is_identity() const { return !transformation_; }
    std::pair<double, double> apply(double x, double y) const;
    void apply(std::vector<double>& xs, std::vector<double>& ys) const;

private:
    std::shared_ptr<OGRCoordinateTransformation> transformation_;
};

CoordinateTransform make_transform(const std::string& source, const std::string& target);

Extent transform_extent(const Extent& extent, const CoordinateTransform& transform, int samples_per_edge = 21);

}  // namespace floodrisk

#endif  // FLOODRISK_CRS_HPP

#include "floodrisk/raster.hpp"

#include <algorithm>
#include <sstream>

namespace floodrisk {

namespace {

bool nearly_equal(double a, double b) {
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= 1e-9 * scale;
}

}  // namespace

bool Extent::empty() const {
    return !(max_x > min_x) || !(max_y > min_y);
}

Extent Extent::intersect(const Extent& other) const {
    return Extent{std::max(min_x, other.min_x), std::max(min_y, other.min_y),
                  std::min(max_x, other.max_x), std::min(max_y, other.max_y)};
}

Extent GridSpec::extent() const {
    return Extent{origin_x, origin_y - pixel_height * rows, origin_x + pixel_width * cols, origin_y};
}

std::pair<double, double> GridSpec::pixel_center(int col, int row) const {
    return {origin_x + (col + 0.5) * pixel_width, origin_y - (row + 0.5) * pixel_height};
}

double GridSpec::pixel_area() const {
    return std::fabs(pixel_width * pixel_height);
}

std::size_t GridSpec::size() const {
    if (cols <= 0 || rows <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(cols) * static_cast<std::size_t>(rows);
}

bool GridSpec::contains(int col, int row) const {
    return col >= 0 && row >= 0 && col < cols && row < rows;
}

std::size_t GridSpec::index(int col, int row) const {
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(cols) + static_cast<std::size_t>(col);
}

bool GridSpec::same_grid(const GridSpec& other) const {
    return crs == other.crs && cols == other.cols && rows == other.rows &&
           nearly_equal(origin_x, other.origin_x) && nearly_equal(origin_y, other.origin_y) &&
           nearly_equal(pixel_width, other.pixel_width) && nearly_equal(pixel_height, other.pixel_height);
}

std::string GridSpec::describe() const {
    std::ostringstream out;
    out.precision(12);
    out << crs << " origin=(" << origin_x << "," << origin_y << ") pixel=(" << pixel_width << "x"
        << pixel_height << ") dims=" << cols << "x" << rows;
    return out.str();
}

}  // namespace floodrisk

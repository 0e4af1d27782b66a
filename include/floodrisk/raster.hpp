#ifndef FLOODRISK_RASTER_HPP
#define FLOODRISK_RASTER_HPP

#include <cmath>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace floodrisk {

constexpr double kDepthNoData = -9999.0;
constexpr int kClassNoData = -1;

struct Extent {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    bool empty() const;
    Extent intersect(const Extent& other) const;
};

struct GridSpec {
    std::string crs;
    double origin_x = 0.0;
    double origin_y = 0.0;
    double pixel_width = 1.0;
    double pixel_height = 1.0;
    int cols = 0;
    int rows = 0;

    Extent extent() const;
    std::pair<double, double> pixel_center(int col, int row) const;
    double pixel_area() const;
    std::size_t size() const;
    bool contains(int col, int row) const;
    std::size_t index(int col, int row) const;
    bool same_grid(const GridSpec& other) const;
    std::string describe() const;
};

template <typename T>
struct Raster {
    std::string name;
    GridSpec grid{};
    T nodata{};
    std::vector<T> values;

    Raster() = default;
    Raster(std::string raster_name, GridSpec raster_grid, T nodata_value)
        : name(std::move(raster_name)),
          grid(std::move(raster_grid)),
          nodata(nodata_value),
          values(grid.size(), nodata_value) {}

    bool is_nodata(T value) const {
        if constexpr (std::is_floating_point_v<T>) {
            return value == nodata || !std::isfinite(value);
        } else {
            return value == nodata;
        }
    }

    T at(int col, int row) const { return values[grid.index(col, row)]; }
    T& at(int col, int row) { return values[grid.index(col, row)]; }

    std::size_t valid_count() const {
        std::size_t count = 0;
        for (const T& value : values) {
            if (!is_nodata(value)) {
                ++count;
            }
        }
        return count;
    }
};

using DepthRaster = Raster<double>;
using ScoreRaster = Raster<double>;
using ClassRaster = Raster<int>;

}  // namespace floodrisk

#endif  // FLOODRISK_RASTER_HPP

#ifndef FLOODRISK_DEPTH_RASTERIZER_HPP
#define FLOODRISK_DEPTH_RASTERIZER_HPP

#include <string>
#include <vector>

#include "floodrisk/errors.hpp"
#include "floodrisk/logging.hpp"
#include "floodrisk/raster.hpp"
#include "floodrisk/rating.hpp"

namespace floodrisk {

struct DepthRasterMetadata {
    std::vector<std::string> extrapolated_reaches;
    std::vector<std::string> negative_discharge_reaches;
    std::size_t painted_pixels = 0;
    std::size_t overlapping_pixels = 0;
};

struct DepthRasterResult {
    DepthRaster raster;
    DepthRasterMetadata metadata;
    std::vector<RunWarning> warnings;
};

class DepthRasterizer {
public:
    explicit DepthRasterizer(int tile_rows = 256, Logger logger = get_logger("DepthRasterizer"));

    DepthRasterResult rasterize(const std::vector<ResolvedReach>& reaches, const ReachCatalog& catalog,
                                const std::string& name = "depth") const;

private:
    int tile_rows_ = 256;
    Logger logger_;
};

}  // namespace floodrisk

#endif  // FLOODRISK_DEPTH_RASTERIZER_HPP

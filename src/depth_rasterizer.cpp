#include "floodrisk/depth_rasterizer.hpp"

#include <algorithm>
#include <cstdint>

namespace floodrisk {

namespace {

struct PixelDepth {
    std::size_t index = 0;
    double depth = 0.0;
};

}  // namespace

DepthRasterizer::DepthRasterizer(int tile_rows, Logger logger)
    : tile_rows_(std::max(1, tile_rows)), logger_(std::move(logger)) {}

DepthRasterResult DepthRasterizer::rasterize(const std::vector<ResolvedReach>& reaches, const ReachCatalog& catalog,
                                             const std::string& name) const {
    const GridSpec& grid = catalog.grid();
    DepthRasterResult result{DepthRaster(name, grid, kDepthNoData), {}, {}};

    const int tile_count = (grid.rows + tile_rows_ - 1) / tile_rows_;
    std::vector<std::vector<PixelDepth>> tiles(static_cast<std::size_t>(std::max(tile_count, 0)));
    for (const auto& reach : reaches) {
        if (reach.resolution.flag == DepthFlag::kExtrapolatedHigh) {
            result.metadata.extrapolated_reaches.push_back(reach.reach_id);
        } else if (reach.resolution.flag == DepthFlag::kNegativeDischarge) {
            result.metadata.negative_discharge_reaches.push_back(reach.reach_id);
        }
        for (const auto& pixel : catalog.reach(reach.reach_id).mask) {
            tiles[static_cast<std::size_t>(pixel.row / tile_rows_)].push_back(
                PixelDepth{grid.index(pixel.col, pixel.row), reach.resolution.depth});
        }
    }

    std::vector<std::uint16_t> claims(grid.size(), 0);
    auto& values = result.raster.values;
    std::size_t painted = 0;
    std::size_t overlapping = 0;

    // Each tile owns a disjoint band of rows.
#pragma omp parallel for schedule(dynamic) reduction(+ : painted, overlapping)
    for (int tile = 0; tile < tile_count; ++tile) {
        for (const auto& item : tiles[static_cast<std::size_t>(tile)]) {
            auto& claim = claims[item.index];
            if (claim == 0) {
                values[item.index] = item.depth;
                ++painted;
            } else {
                values[item.index] = std::max(values[item.index], item.depth);
                if (claim == 1) {
                    ++overlapping;
                }
            }
            if (claim < UINT16_MAX) {
                ++claim;
            }
        }
    }

    result.metadata.painted_pixels = painted;
    result.metadata.overlapping_pixels = overlapping;

    if (overlapping > 0) {
        result.warnings.push_back(RunWarning{"overlapping_masks", Stage::kDepthRasterizer, name,
                                             "pixels claimed by more than one reach resolved to the maximum depth",
                                             overlapping});
    }
    if (!result.metadata.extrapolated_reaches.empty()) {
        std::string joined;
        for (const auto& reach_id : result.metadata.extrapolated_reaches) {
            joined += joined.empty() ? reach_id : "," + reach_id;
        }
        result.warnings.push_back(RunWarning{"extrapolated_high", Stage::kRatingCurve, joined,
                                             "discharge above rating table; depth extrapolated from last segment",
                                             result.metadata.extrapolated_reaches.size()});
    }
    if (!result.metadata.negative_discharge_reaches.empty()) {
        std::string joined;
        for (const auto& reach_id : result.metadata.negative_discharge_reaches) {
            joined += joined.empty() ? reach_id : "," + reach_id;
        }
        result.warnings.push_back(RunWarning{"negative_discharge", Stage::kRatingCurve, joined,
                                             "negative discharge resolved to zero depth",
                                             result.metadata.negative_discharge_reaches.size()});
    }

    logger_.info("depth_raster_painted", {{"raster", name},
                                          {"reaches", std::to_string(reaches.size())},
                                          {"painted_pixels", std::to_string(painted)},
                                          {"overlapping_pixels", std::to_string(overlapping)}});
    return result;
}

}  // namespace floodrisk

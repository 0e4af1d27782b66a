#ifndef FLOODRISK_IO_HPP
#define FLOODRISK_IO_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "floodrisk/logging.hpp"
#include "floodrisk/raster.hpp"
#include "floodrisk/rating.hpp"
#include "floodrisk/severity.hpp"
#include "floodrisk/summary.hpp"

namespace floodrisk {

ScoreRaster read_ascii_grid(const std::string& path, const std::string& crs, const std::string& name);
void write_ascii_grid(const std::string& path, const DepthRaster& raster);
void write_ascii_grid(const std::string& path, const ClassRaster& raster);

std::shared_ptr<const ReachCatalog> load_reach_catalog(const std::string& catchment_grid,
                                                       const std::string& rating_csv,
                                                       const std::optional<std::string>& masks_csv,
                                                       const std::string& crs,
                                                       Logger logger = get_logger("ReachCatalogLoader"));

ForecastCycle read_forecast_csv(const std::string& path, const std::string& cycle_id);

void write_reach_depths_csv(const std::string& path, const std::vector<ResolvedReach>& reaches,
                            const SeverityScheme& scheme);

std::string summary_to_json(const SummaryStatistics& summary);
void write_summary_json(const std::string& path, const SummaryStatistics& summary);

}  // namespace floodrisk

#endif  // FLOODRISK_IO_HPP

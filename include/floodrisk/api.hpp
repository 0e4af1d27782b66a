#ifndef FLOODRISK_API_HPP
#define FLOODRISK_API_HPP

#include <memory>
#include <string>
#include <vector>

#include "floodrisk/config.hpp"
#include "floodrisk/engine.hpp"
#include "floodrisk/logging.hpp"
#include "floodrisk/raster.hpp"
#include "floodrisk/rating.hpp"

namespace floodrisk {

struct CycleInputs {
    std::shared_ptr<const ReachCatalog> catalog;
    ForecastCycle cycle;
    ScoreRaster vulnerability;
};

struct CycleOutputs {
    std::string depth_grid;
    std::string risk_grid;
    std::string reach_depths;
    std::string summary;
};

CycleInputs load_cycle_inputs(const EngineSettings& settings, Logger logger = get_logger("floodrisk"));

CycleResult run_cycle(const EngineSettings& settings, Logger logger = get_logger("floodrisk"));

CycleOutputs write_cycle_outputs(const CycleResult& result, const FloodRiskEngine& engine,
                                 const std::string& directory);

}  // namespace floodrisk

#endif  // FLOODRISK_API_HPP

#ifndef FLOODRISK_ENGINE_HPP
#define FLOODRISK_ENGINE_HPP

#include <memory>
#include <vector>

#include "floodrisk/aligner.hpp"
#include "floodrisk/config.hpp"
#include "floodrisk/depth_rasterizer.hpp"
#include "floodrisk/fusion.hpp"
#include "floodrisk/logging.hpp"
#include "floodrisk/rating.hpp"
#include "floodrisk/severity.hpp"
#include "floodrisk/summary.hpp"

namespace floodrisk {

struct CycleResult {
    std::vector<ResolvedReach> reaches;
    DepthRasterResult depth;
    ClassRaster severity;
    AlignedPair aligned;
    RiskRaster risk;
    SummaryStatistics summary;
};

class FloodRiskEngine {
public:
    explicit FloodRiskEngine(EngineSettings settings, Logger logger = get_logger("FloodRiskEngine"));

    CycleResult run(const ForecastCycle& cycle, std::shared_ptr<const ReachCatalog> catalog,
                    const ScoreRaster& vulnerability) const;

    const EngineSettings& settings() const { return settings_; }
    const SeverityScheme& severity_scheme() const { return scheme_; }
    const RiskClassTable& risk_table() const { return table_; }

private:
    CycleResult run_stages(const ForecastCycle& cycle, std::shared_ptr<const ReachCatalog> catalog,
                           const ScoreRaster& vulnerability, const Logger& logger) const;

    EngineSettings settings_;
    SeverityScheme scheme_;
    RiskClassTable table_;
    Logger logger_;
};

}  // namespace floodrisk

#endif  // FLOODRISK_ENGINE_HPP

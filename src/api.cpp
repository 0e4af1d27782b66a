#include "floodrisk/api.hpp"

#include <filesystem>

#include "floodrisk/errors.hpp"
#include "floodrisk/io.hpp"

namespace floodrisk {

namespace {

const std::string& required_path(const std::optional<std::string>& path, const std::string& key) {
    if (!path.has_value() || path->empty()) {
        throw FusionError(ErrorKind::kMissingConfiguration, Stage::kConfiguration, key, "input path is required");
    }
    return *path;
}

}  // namespace

CycleInputs load_cycle_inputs(const EngineSettings& settings, Logger logger) {
    const InputConfig& inputs = settings.inputs;
    const std::string& catchments = required_path(inputs.catchment_grid, "inputs.catchment_grid");
    const std::string& ratings = required_path(inputs.rating_table, "inputs.rating_table");
    const std::string& forecast = required_path(inputs.forecast, "inputs.forecast");
    const std::string& vulnerability = required_path(inputs.vulnerability_grid, "inputs.vulnerability_grid");
    std::string cycle_id = settings.cycle;
    if (cycle_id.empty()) {
        cycle_id = std::filesystem::path(forecast).stem().string();
    }

    CycleInputs loaded{
        load_reach_catalog(catchments, ratings, inputs.catchment_masks, inputs.reach_crs,
                           logger.with_fields({{"component", "catalog"}})),
        read_forecast_csv(forecast, cycle_id),
        read_ascii_grid(vulnerability, settings.vulnerability.crs, "vulnerability"),
    };
    logger.info("cycle_inputs_loaded", {{"cycle", cycle_id},
                                        {"reaches", std::to_string(loaded.catalog->size())},
                                        {"forecast_samples", std::to_string(loaded.cycle.samples.size())},
                                        {"vulnerability_grid", loaded.vulnerability.grid.describe()}});
    return loaded;
}

CycleResult run_cycle(const EngineSettings& settings, Logger logger) {
    configure_logging(settings.logging);
    FloodRiskEngine engine(settings, logger.with_fields({{"component", "engine"}}));
    CycleInputs inputs = load_cycle_inputs(engine.settings(), logger);
    return engine.run(inputs.cycle, inputs.catalog, inputs.vulnerability);
}

CycleOutputs write_cycle_outputs(const CycleResult& result, const FloodRiskEngine& engine,
                                 const std::string& directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw FusionError(ErrorKind::kInvalidInput, Stage::kIo, directory,
                          "unable to create output directory: " + ec.message());
    }
    const std::filesystem::path base(directory);
    const std::string& cycle = result.summary.cycle;

    CycleOutputs outputs;
    outputs.depth_grid = (base / ("depth_" + cycle + ".asc")).string();
    outputs.risk_grid = (base / ("risk_" + cycle + ".asc")).string();
    outputs.reach_depths = (base / ("reach_depths_" + cycle + ".csv")).string();
    outputs.summary = (base / ("risk_summary_" + cycle + ".json")).string();

    write_ascii_grid(outputs.depth_grid, result.depth.raster);
    write_ascii_grid(outputs.risk_grid, result.risk.bands);
    write_reach_depths_csv(outputs.reach_depths, result.reaches, engine.severity_scheme());
    write_summary_json(outputs.summary, result.summary);
    return outputs;
}

}  // namespace floodrisk

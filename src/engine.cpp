#include "floodrisk/engine.hpp"

#include "floodrisk/errors.hpp"

namespace floodrisk {

namespace {

EngineSettings validated(EngineSettings settings) {
    settings.validate();
    return settings;
}

}  // namespace

FloodRiskEngine::FloodRiskEngine(EngineSettings settings, Logger logger)
    : settings_(validated(std::move(settings))),
      scheme_(SeverityScheme::from_config(settings_.severity)),
      table_(RiskClassTable::from_config(settings_)),
      logger_(std::move(logger)) {}

CycleResult FloodRiskEngine::run(const ForecastCycle& cycle, std::shared_ptr<const ReachCatalog> catalog,
                                 const ScoreRaster& vulnerability) const {
    const Logger logger = logger_.with_fields({{"cycle", cycle.id}});
    logger.info("cycle_started", {{"reaches", std::to_string(cycle.samples.size())},
                                  {"vulnerability", vulnerability.name}});
    try {
        CycleResult result = run_stages(cycle, std::move(catalog), vulnerability, logger);
        for (const auto& warning : result.summary.warnings) {
            logger.warn("run_warning", {{"code", warning.code},
                                        {"stage", stage_name(warning.stage)},
                                        {"key", warning.key},
                                        {"count", std::to_string(warning.count)},
                                        {"detail", warning.detail}});
        }
        logger.info("cycle_completed", {{"valid_pixels", std::to_string(result.summary.valid_pixels)},
                                        {"priority_reaches", std::to_string(result.summary.priority_reaches.size())},
                                        {"warnings", std::to_string(result.summary.warnings.size())}});
        return result;
    } catch (const FusionError& err) {
        logger.error("cycle_failed", {{"kind", kind_name(err.kind())},
                                      {"stage", stage_name(err.stage())},
                                      {"key", err.key()},
                                      {"detail", err.detail()}});
        throw;
    }
}

CycleResult FloodRiskEngine::run_stages(const ForecastCycle& cycle, std::shared_ptr<const ReachCatalog> catalog,
                                        const ScoreRaster& vulnerability, const Logger& logger) const {
    if (cycle.samples.empty()) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kRatingCurve, cycle.id, "forecast cycle has no reaches");
    }
    if (!catalog) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kRatingCurve, cycle.id, "reach catalog is required");
    }
    const LogFields cycle_fields{{"cycle", cycle.id}};

    CycleResult result;
    RatingCurveResolver resolver(catalog);
    result.reaches = resolver.resolve_batch(cycle.samples);
    logger.info("stage_completed", {{"stage", stage_name(Stage::kRatingCurve)},
                                    {"resolved", std::to_string(result.reaches.size())}});

    DepthRasterizer rasterizer(256, get_logger("DepthRasterizer").with_fields(cycle_fields));
    result.depth = rasterizer.rasterize(result.reaches, *catalog, "depth");
    if (result.depth.metadata.painted_pixels == 0) {
        throw FusionError(ErrorKind::kEmptyInput, Stage::kDepthRasterizer, result.depth.raster.name,
                          "no catchment pixels were painted");
    }

    SeverityClassifier classifier(scheme_);
    result.severity = classifier.classify(result.depth.raster, "severity");
    logger.info("stage_completed", {{"stage", stage_name(Stage::kSeverityClassifier)},
                                    {"classified_pixels", std::to_string(result.severity.valid_count())}});

    GridAligner aligner(settings_.grid.target(), get_logger("GridAligner").with_fields(cycle_fields));
    result.aligned = aligner.align(result.severity, vulnerability);

    RiskFusionEngine fusion(table_, settings_.vulnerability.quantile_count,
                            get_logger("RiskFusionEngine").with_fields(cycle_fields));
    RiskFusionResult fused = fusion.fuse(result.aligned, "risk");
    result.risk = std::move(fused.raster);

    SummaryStatistics& summary = result.summary;
    summary.cycle = cycle.id;
    summary.reach_count = result.reaches.size();
    summary.bands = std::move(fused.bands);
    summary.area_units = fused.area_units;
    summary.valid_pixels = fused.valid_pixels;
    summary.nodata_pixels = fused.nodata_pixels;
    summary.severity_counts = classifier.class_counts(result.severity);
    summary.priority_reaches = priority_reaches(result.reaches, scheme_.very_high);
    summary.alignment = result.aligned.report;
    summary.tiering = std::move(fused.tiering);
    summary.depth = depth_statistics(result.depth.raster);
    summary.warnings = result.depth.warnings;
    summary.warnings.insert(summary.warnings.end(), fused.warnings.begin(), fused.warnings.end());
    return result;
}

}  // namespace floodrisk

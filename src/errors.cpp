#include "floodrisk/errors.hpp"

#include <utility>

namespace floodrisk {

namespace {

std::string render(ErrorKind kind, Stage stage, const std::string& key, const std::string& detail) {
    std::string message = kind_name(kind) + " at " + stage_name(stage);
    if (!key.empty()) {
        message += " [" + key + "]";
    }
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}  // namespace

std::string kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kUnknownReach:
            return "UnknownReach";
        case ErrorKind::kInvalidRatingTable:
            return "InvalidRatingTable";
        case ErrorKind::kDuplicateReachInCycle:
            return "DuplicateReachInCycle";
        case ErrorKind::kMissingConfiguration:
            return "MissingConfiguration";
        case ErrorKind::kDisjointExtents:
            return "DisjointExtents";
        case ErrorKind::kIncompatibleCrs:
            return "IncompatibleCRS";
        case ErrorKind::kEmptyInput:
            return "EmptyInput";
        case ErrorKind::kInvalidReachMask:
            return "InvalidReachMask";
        case ErrorKind::kInvalidInput:
            return "InvalidInput";
    }
    return "Unknown";
}

std::string stage_name(Stage stage) {
    switch (stage) {
        case Stage::kConfiguration:
            return "configuration";
        case Stage::kRatingCurve:
            return "rating_curve";
        case Stage::kDepthRasterizer:
            return "depth_rasterizer";
        case Stage::kSeverityClassifier:
            return "severity_classifier";
        case Stage::kGridAligner:
            return "grid_aligner";
        case Stage::kRiskFusion:
            return "risk_fusion";
        case Stage::kIo:
            return "io";
    }
    return "unknown";
}

FusionError::FusionError(ErrorKind kind, Stage stage, std::string key, std::string detail)
    : std::runtime_error(render(kind, stage, key, detail)),
      kind_(kind),
      stage_(stage),
      key_(std::move(key)),
      detail_(std::move(detail)) {}

}  // namespace floodrisk

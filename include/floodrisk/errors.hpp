#ifndef FLOODRISK_ERRORS_HPP
#define FLOODRISK_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace floodrisk {

enum class ErrorKind {
    kUnknownReach,
    kInvalidRatingTable,
    kDuplicateReachInCycle,
    kMissingConfiguration,
    kDisjointExtents,
    kIncompatibleCrs,
    kEmptyInput,
    kInvalidReachMask,
    kInvalidInput,
};

enum class Stage {
    kConfiguration,
    kRatingCurve,
    kDepthRasterizer,
    kSeverityClassifier,
    kGridAligner,
    kRiskFusion,
    kIo,
};

std::string kind_name(ErrorKind kind);
std::string stage_name(Stage stage);

class FusionError : public std::runtime_error {
public:
    FusionError(ErrorKind kind, Stage stage, std::string key, std::string detail);

    ErrorKind kind() const { return kind_; }
    Stage stage() const { return stage_; }
    const std::string& key() const { return key_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    Stage stage_;
    std::string key_;
    std::string detail_;
};

struct RunWarning {
    std::string code;
    Stage stage = Stage::kRiskFusion;
    std::string key;
    std::string detail;
    std::size_t count = 1;
};

}  // namespace floodrisk

#endif  // FLOODRISK_ERRORS_HPP

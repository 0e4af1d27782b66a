#ifndef FLOODRISK_CONFIG_HPP
#define FLOODRISK_CONFIG_HPP

#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "floodrisk/raster.hpp"

namespace floodrisk {

constexpr int kSeverityLevels = 4;

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct SeverityConfig {
    std::optional<double> moderate = std::nullopt;
    std::optional<double> high = std::nullopt;
    std::optional<double> very_high = std::nullopt;
    std::array<std::string, kSeverityLevels> names{"None/Low", "Moderate", "High", "Very High"};
};

struct VulnerabilityConfig {
    int quantile_count = 4;
    std::string crs = "EPSG:4326";
};

enum class GridMode {
    kIntersection,
    kExplicit,
};

struct GridConfig {
    GridMode mode = GridMode::kIntersection;
    std::optional<std::string> crs = std::nullopt;
    std::optional<double> origin_x = std::nullopt;
    std::optional<double> origin_y = std::nullopt;
    std::optional<double> pixel_width = std::nullopt;
    std::optional<double> pixel_height = std::nullopt;
    std::optional<int> cols = std::nullopt;
    std::optional<int> rows = std::nullopt;

    std::optional<GridSpec> target() const;
};

struct CollapseConfig {
    std::array<std::optional<std::vector<int>>, kSeverityLevels> rows{};
    std::vector<std::string> band_names;

    bool enabled() const;
};

bool is_monotonic_table(const std::vector<std::vector<int>>& table);

struct InputConfig {
    std::string reach_crs = "EPSG:5070";
    std::optional<std::string> catchment_grid = std::nullopt;
    std::optional<std::string> rating_table = std::nullopt;
    std::optional<std::string> catchment_masks = std::nullopt;
    std::optional<std::string> forecast = std::nullopt;
    std::optional<std::string> vulnerability_grid = std::nullopt;
};

struct OutputConfig {
    std::string directory = "output";
};

struct EngineSettings {
    LoggingConfig logging{};
    SeverityConfig severity{};
    VulnerabilityConfig vulnerability{};
    GridConfig grid{};
    CollapseConfig collapse{};
    InputConfig inputs{};
    OutputConfig outputs{};
    std::string cycle;

    static EngineSettings from_toml(const std::string& path);
    static EngineSettings parse(std::istream& input, const std::string& source = "<memory>");

    void validate() const;
};

}  // namespace floodrisk

#endif  // FLOODRISK_CONFIG_HPP

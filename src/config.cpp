#include "floodrisk/config.hpp"

#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>

#include "floodrisk/common.hpp"
#include "floodrisk/errors.hpp"

namespace floodrisk {

namespace {

const std::array<std::string, kSeverityLevels> kCollapseKeys{"none", "moderate", "high", "very_high"};

FusionError missing(const std::string& key, const std::string& detail) {
    return FusionError(ErrorKind::kMissingConfiguration, Stage::kConfiguration, key, detail);
}

FusionError malformed(const std::string& key, const std::string& value) {
    return FusionError(ErrorKind::kInvalidInput, Stage::kConfiguration, key, "cannot parse value '" + value + "'");
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw malformed(key, value);
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw malformed(key, value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw malformed(key, value);
    } catch (const std::out_of_range&) {
        throw malformed(key, value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw malformed(key, value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw malformed(key, value);
    } catch (const std::out_of_range&) {
        throw malformed(key, value);
    }
}

std::vector<int> parse_int_array(const std::string& key, const std::string& value) {
    if (trim(value).empty() || trim(value).front() != '[') {
        throw malformed(key, value);
    }
    std::vector<int> output;
    for (const auto& item : array_items(value)) {
        output.push_back(parse_int(key, item));
    }
    return output;
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

}  // namespace

bool is_monotonic_table(const std::vector<std::vector<int>>& table) {
    for (std::size_t s = 0; s < table.size(); ++s) {
        for (std::size_t v = 0; v < table[s].size(); ++v) {
            if (v + 1 < table[s].size() && table[s][v + 1] < table[s][v]) {
                return false;
            }
            if (s + 1 < table.size() && v < table[s + 1].size() && table[s + 1][v] < table[s][v]) {
                return false;
            }
        }
    }
    return true;
}

std::optional<GridSpec> GridConfig::target() const {
    if (mode != GridMode::kExplicit || !crs || !origin_x || !origin_y || !pixel_width || !pixel_height || !cols ||
        !rows) {
        return std::nullopt;
    }
    return GridSpec{*crs, *origin_x, *origin_y, *pixel_width, *pixel_height, *cols, *rows};
}

bool CollapseConfig::enabled() const {
    for (const auto& row : rows) {
        if (row.has_value()) {
            return true;
        }
    }
    return false;
}

EngineSettings EngineSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw missing(path, "unable to open config file");
    }
    return parse(file, path);
}

EngineSettings EngineSettings::parse(std::istream& input, const std::string& source) {
    EngineSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(input, line)) {
        auto hash_pos = line.find('#');
        if (hash_pos != std::string::npos) {
            line = line.substr(0, hash_pos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            throw FusionError(ErrorKind::kInvalidInput, Stage::kConfiguration, source,
                              "expected key = value, got '" + line + "'");
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));
        const std::string qualified = current_section.empty() ? key : current_section + "." + key;

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = to_upper(strip_quotes(value));
            } else if (key == "json") {
                settings.logging.json = parse_bool(qualified, value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(qualified, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(qualified, value);
            }
        } else if (current_section == "severity") {
            if (key == "moderate") {
                settings.severity.moderate = parse_double(qualified, value);
            } else if (key == "high") {
                settings.severity.high = parse_double(qualified, value);
            } else if (key == "very_high") {
                settings.severity.very_high = parse_double(qualified, value);
            } else if (key == "names") {
                auto names = array_items(value);
                if (names.size() != settings.severity.names.size()) {
                    throw missing(qualified, "expected exactly four severity class names");
                }
                std::copy(names.begin(), names.end(), settings.severity.names.begin());
            }
        } else if (current_section == "vulnerability") {
            if (key == "quantile_count") {
                settings.vulnerability.quantile_count = parse_int(qualified, value);
            } else if (key == "crs") {
                settings.vulnerability.crs = strip_quotes(value);
            }
        } else if (current_section == "grid") {
            if (key == "mode") {
                const auto mode = strip_quotes(value);
                if (mode == "intersection") {
                    settings.grid.mode = GridMode::kIntersection;
                } else if (mode == "explicit") {
                    settings.grid.mode = GridMode::kExplicit;
                } else {
                    throw malformed(qualified, value);
                }
            } else if (key == "crs") {
                settings.grid.crs = strip_quotes(value);
            } else if (key == "origin_x") {
                settings.grid.origin_x = parse_double(qualified, value);
            } else if (key == "origin_y") {
                settings.grid.origin_y = parse_double(qualified, value);
            } else if (key == "pixel_width") {
                settings.grid.pixel_width = parse_double(qualified, value);
            } else if (key == "pixel_height") {
                settings.grid.pixel_height = parse_double(qualified, value);
            } else if (key == "cols") {
                settings.grid.cols = parse_int(qualified, value);
            } else if (key == "rows") {
                settings.grid.rows = parse_int(qualified, value);
            }
        } else if (current_section == "collapse") {
            if (key == "band_names") {
                settings.collapse.band_names = array_items(value);
            } else {
                for (std::size_t i = 0; i < kCollapseKeys.size(); ++i) {
                    if (key == kCollapseKeys[i]) {
                        settings.collapse.rows[i] = parse_int_array(qualified, value);
                    }
                }
            }
        } else if (current_section == "inputs") {
            if (key == "reach_crs") {
                settings.inputs.reach_crs = strip_quotes(value);
            } else if (key == "catchment_grid") {
                settings.inputs.catchment_grid = parse_optional_string(value);
            } else if (key == "rating_table") {
                settings.inputs.rating_table = parse_optional_string(value);
            } else if (key == "catchment_masks") {
                settings.inputs.catchment_masks = parse_optional_string(value);
            } else if (key == "forecast") {
                settings.inputs.forecast = parse_optional_string(value);
            } else if (key == "vulnerability_grid") {
                settings.inputs.vulnerability_grid = parse_optional_string(value);
            }
        } else if (current_section == "outputs") {
            if (key == "directory") {
                settings.outputs.directory = strip_quotes(value);
            }
        } else if (current_section.empty()) {
            if (key == "cycle") {
                settings.cycle = strip_quotes(value);
            }
        }
    }

    return settings;
}

void EngineSettings::validate() const {
    if (!severity.moderate) {
        throw missing("severity.moderate", "depth threshold is required");
    }
    if (!severity.high) {
        throw missing("severity.high", "depth threshold is required");
    }
    if (!severity.very_high) {
        throw missing("severity.very_high", "depth threshold is required");
    }
    if (!(*severity.moderate > 0.0 && *severity.moderate < *severity.high && *severity.high < *severity.very_high)) {
        throw missing("severity", "thresholds must satisfy 0 < moderate < high < very_high");
    }
    if (vulnerability.quantile_count < 2) {
        throw missing("vulnerability.quantile_count", "at least two quantiles are required");
    }
    if (grid.mode == GridMode::kExplicit) {
        if (!grid.target()) {
            throw missing("grid", "explicit mode requires crs, origin_x, origin_y, pixel_width, pixel_height, "
                                  "cols and rows");
        }
        const GridSpec target = *grid.target();
        if (target.pixel_width <= 0.0 || target.pixel_height <= 0.0 || target.cols <= 0 || target.rows <= 0) {
            throw missing("grid", "explicit grid must have positive pixel size and dimensions");
        }
    }
    if (collapse.enabled()) {
        std::vector<std::vector<int>> table;
        for (std::size_t i = 0; i < collapse.rows.size(); ++i) {
            const auto& row = collapse.rows[i];
            if (!row) {
                throw missing("collapse." + kCollapseKeys[i], "collapse table is missing a severity row");
            }
            if (static_cast<int>(row->size()) != vulnerability.quantile_count) {
                throw missing("collapse." + kCollapseKeys[i],
                              "row must have one entry per vulnerability tier (" +
                                  std::to_string(vulnerability.quantile_count) + ")");
            }
            for (int band : *row) {
                if (band < 0) {
                    throw missing("collapse." + kCollapseKeys[i], "bands must be non-negative");
                }
            }
            table.push_back(*row);
        }
        if (!is_monotonic_table(table)) {
            throw missing("collapse", "bands must be non-decreasing in severity and in vulnerability tier");
        }
    }
}

}  // namespace floodrisk

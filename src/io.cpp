#include "floodrisk/io.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "floodrisk/common.hpp"
#include "floodrisk/errors.hpp"

namespace floodrisk {

namespace {

FusionError io_error(const std::string& key, const std::string& detail) {
    return FusionError(ErrorKind::kInvalidInput, Stage::kIo, key, detail);
}

std::string location(const std::string& path, std::size_t line) {
    return path + ":" + std::to_string(line);
}

double parse_number(const std::string& text, const std::string& where) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw io_error(where, "trailing characters in number '" + text + "'");
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw io_error(where, "not a number: '" + text + "'");
    } catch (const std::out_of_range&) {
        throw io_error(where, "number out of range: '" + text + "'");
    }
}

int parse_index(const std::string& text, const std::string& where) {
    const double value = parse_number(text, where);
    if (value != std::floor(value) || value < 0.0 || value > 2147483647.0) {
        throw io_error(where, "expected a non-negative integer, got '" + text + "'");
    }
    return static_cast<int>(value);
}

std::ifstream open_input(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw io_error(path, "unable to open file");
    }
    return input;
}

std::ofstream open_output(const std::string& path) {
    std::ofstream output(path);
    if (!output) {
        throw io_error(path, "unable to create file");
    }
    return output;
}

class CsvTable {
public:
    explicit CsvTable(const std::string& path) : path_(path), input_(open_input(path)) {
        std::string header;
        if (!std::getline(input_, header)) {
            throw io_error(path_, "missing header row");
        }
        line_ = 1;
        const auto names = split(header, ',');
        header_count_ = names.size();
        for (std::size_t i = 0; i < names.size(); ++i) {
            const std::string name = strip_quotes(trim(names[i]));
            if (!columns_.emplace(name, i).second) {
                throw io_error(path_, "duplicate column '" + name + "'");
            }
        }
    }

    std::size_t column(const std::vector<std::string>& aliases) const {
        for (const auto& alias : aliases) {
            auto it = columns_.find(alias);
            if (it != columns_.end()) {
                return it->second;
            }
        }
        throw io_error(path_, "missing column '" + aliases.front() + "'");
    }

    std::optional<std::size_t> optional_column(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool next(std::vector<std::string>& fields) {
        std::string line;
        while (std::getline(input_, line)) {
            ++line_;
            if (trim(line).empty()) {
                continue;
            }
            fields = split(line, ',');
            for (auto& field : fields) {
                field = strip_quotes(trim(field));
            }
            if (fields.size() < header_count_) {
                throw io_error(where(), "expected " + std::to_string(header_count_) + " fields");
            }
            return true;
        }
        return false;
    }

    std::string where() const { return location(path_, line_); }

private:
    std::string path_;
    std::ifstream input_;
    std::map<std::string, std::size_t> columns_;
    std::size_t header_count_ = 0;
    std::size_t line_ = 0;
};

std::string reach_key(double value) {
    std::ostringstream out;
    out << std::llround(value);
    return out.str();
}

template <typename T>
void write_grid(const std::string& path, const Raster<T>& raster) {
    const GridSpec& grid = raster.grid;
    std::ofstream output = open_output(path);
    output << std::setprecision(15);
    output << "ncols " << grid.cols << "\n";
    output << "nrows " << grid.rows << "\n";
    output << "xllcorner " << grid.origin_x << "\n";
    output << "yllcorner " << grid.origin_y - grid.pixel_height * grid.rows << "\n";
    if (grid.pixel_width == grid.pixel_height) {
        output << "cellsize " << grid.pixel_width << "\n";
    } else {
        output << "dx " << grid.pixel_width << "\n";
        output << "dy " << grid.pixel_height << "\n";
    }
    output << "NODATA_value " << raster.nodata << "\n";
    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.cols; ++col) {
            if (col > 0) {
                output << ' ';
            }
            const T value = raster.at(col, row);
            if (raster.is_nodata(value)) {
                output << raster.nodata;
            } else {
                output << value;
            }
        }
        output << "\n";
    }
    if (!output) {
        throw io_error(path, "write failed");
    }
}

}  // namespace

ScoreRaster read_ascii_grid(const std::string& path, const std::string& crs, const std::string& name) {
    std::ifstream input = open_input(path);
    std::map<std::string, double> header;
    std::string key;
    // Header keys precede the first numeric token.
    while (input >> key) {
        const std::string upper = to_upper(key);
        if (!upper.empty() && (std::isdigit(static_cast<unsigned char>(upper.front())) != 0 ||
                               upper.front() == '-' || upper.front() == '+' || upper.front() == '.')) {
            break;
        }
        std::string value;
        if (!(input >> value)) {
            throw io_error(path, "header key '" + key + "' has no value");
        }
        header[upper] = parse_number(value, path);
        key.clear();
    }

    auto require = [&](const std::string& header_key) {
        auto it = header.find(header_key);
        if (it == header.end()) {
            throw io_error(path, "missing header '" + header_key + "'");
        }
        return it->second;
    };

    auto dimension = [&](const std::string& header_key) {
        const double value = require(header_key);
        if (!std::isfinite(value) || value != std::floor(value) || value < 1.0 || value > 2147483647.0) {
            throw io_error(path, "header '" + header_key + "' must be a positive integer");
        }
        return static_cast<int>(value);
    };

    GridSpec grid;
    grid.crs = crs;
    grid.cols = dimension("NCOLS");
    grid.rows = dimension("NROWS");
    std::error_code size_error;
    const auto file_size = std::filesystem::file_size(path, size_error);
    if (!size_error && static_cast<double>(grid.cols) * grid.rows > static_cast<double>(file_size)) {
        throw io_error(path, "header declares more cells than the file holds");
    }
    if (header.count("CELLSIZE") != 0) {
        grid.pixel_width = header["CELLSIZE"];
        grid.pixel_height = header["CELLSIZE"];
    } else {
        grid.pixel_width = require("DX");
        grid.pixel_height = require("DY");
    }
    if (grid.cols <= 0 || grid.rows <= 0 || !(grid.pixel_width > 0.0) || !(grid.pixel_height > 0.0)) {
        throw io_error(path, "grid dimensions and cell size must be positive");
    }
    if (header.count("XLLCORNER") != 0) {
        grid.origin_x = header["XLLCORNER"];
    } else {
        grid.origin_x = require("XLLCENTER") - grid.pixel_width / 2.0;
    }
    double lower_y = 0.0;
    if (header.count("YLLCORNER") != 0) {
        lower_y = header["YLLCORNER"];
    } else {
        lower_y = require("YLLCENTER") - grid.pixel_height / 2.0;
    }
    grid.origin_y = lower_y + grid.pixel_height * grid.rows;

    const double nodata = header.count("NODATA_VALUE") != 0 ? header["NODATA_VALUE"] : kDepthNoData;
    ScoreRaster raster(name, grid, nodata);
    std::size_t filled = 0;
    if (!key.empty()) {
        raster.values[filled++] = parse_number(key, path);
    }
    std::string token;
    while (filled < raster.values.size() && input >> token) {
        raster.values[filled++] = parse_number(token, path);
    }
    if (filled != raster.values.size()) {
        throw io_error(path, "expected " + std::to_string(raster.values.size()) + " cells, found " +
                                 std::to_string(filled));
    }
    return raster;
}

void write_ascii_grid(const std::string& path, const DepthRaster& raster) {
    write_grid(path, raster);
}

void write_ascii_grid(const std::string& path, const ClassRaster& raster) {
    write_grid(path, raster);
}

std::shared_ptr<const ReachCatalog> load_reach_catalog(const std::string& catchment_grid,
                                                       const std::string& rating_csv,
                                                       const std::optional<std::string>& masks_csv,
                                                       const std::string& crs, Logger logger) {
    const ScoreRaster catchments = read_ascii_grid(catchment_grid, crs, "catchments");

    std::map<std::string, std::vector<RatingBreakpoint>> ratings;
    {
        CsvTable table(rating_csv);
        const std::size_t id_col = table.column({"feature_id", "HydroID", "reach_id"});
        const std::size_t discharge_col = table.column({"discharge", "discharge_cms"});
        const std::size_t depth_col = table.column({"depth", "stage"});
        std::vector<std::string> fields;
        while (table.next(fields)) {
            ratings[fields[id_col]].push_back(
                RatingBreakpoint{parse_number(fields[discharge_col], table.where()),
                                 parse_number(fields[depth_col], table.where())});
        }
    }

    std::map<std::string, ReachData> reaches;
    for (auto& [reach_id, breakpoints] : ratings) {
        reaches[reach_id].rating = RatingTable(std::move(breakpoints));
    }

    std::size_t orphan_pixels = 0;
    for (int row = 0; row < catchments.grid.rows; ++row) {
        for (int col = 0; col < catchments.grid.cols; ++col) {
            const double value = catchments.at(col, row);
            if (catchments.is_nodata(value)) {
                continue;
            }
            auto it = reaches.find(reach_key(value));
            if (it == reaches.end()) {
                ++orphan_pixels;
                continue;
            }
            it->second.mask.push_back(PixelIndex{col, row});
        }
    }

    if (masks_csv.has_value()) {
        CsvTable table(*masks_csv);
        const std::size_t id_col = table.column({"feature_id", "HydroID", "reach_id"});
        const std::size_t row_col = table.column({"row"});
        const std::size_t col_col = table.column({"col", "column"});
        std::vector<std::string> fields;
        while (table.next(fields)) {
            auto it = reaches.find(fields[id_col]);
            if (it == reaches.end()) {
                throw io_error(table.where(), "mask references reach '" + fields[id_col] + "' without a rating table");
            }
            it->second.mask.push_back(
                PixelIndex{parse_index(fields[col_col], table.where()), parse_index(fields[row_col], table.where())});
        }
    }

    if (orphan_pixels > 0) {
        logger.warn("catchment_pixels_without_rating", {{"grid", catchment_grid},
                                                        {"pixels", std::to_string(orphan_pixels)}});
    }
    logger.info("reach_catalog_loaded", {{"reaches", std::to_string(reaches.size())},
                                         {"grid", catchments.grid.describe()}});
    return std::make_shared<const ReachCatalog>(catchments.grid, std::move(reaches));
}

ForecastCycle read_forecast_csv(const std::string& path, const std::string& cycle_id) {
    CsvTable table(path);
    const std::size_t id_col = table.column({"feature_id", "reach_id"});
    const std::size_t discharge_col = table.column({"discharge", "streamflow", "max_discharge"});
    const auto start_col = table.optional_column("valid_start");
    const auto end_col = table.optional_column("valid_end");

    ForecastCycle cycle;
    cycle.id = cycle_id;
    std::vector<std::string> fields;
    while (table.next(fields)) {
        ForecastSample sample;
        sample.reach_id = fields[id_col];
        sample.max_discharge = parse_number(fields[discharge_col], table.where());
        if (start_col) {
            sample.valid_start = fields[*start_col];
        }
        if (end_col) {
            sample.valid_end = fields[*end_col];
        }
        cycle.samples.push_back(std::move(sample));
    }
    return cycle;
}

void write_reach_depths_csv(const std::string& path, const std::vector<ResolvedReach>& reaches,
                            const SeverityScheme& scheme) {
    std::ofstream output = open_output(path);
    output << std::setprecision(10);
    output << "feature_id,discharge,depth_m,severity_class,severity_name,flag\n";
    for (const auto& reach : reaches) {
        const int severity_class = scheme.classify(reach.resolution.depth);
        output << reach.reach_id << ',' << reach.discharge << ',' << reach.resolution.depth << ',' << severity_class
               << ',' << scheme.name(severity_class) << ',' << flag_name(reach.resolution.flag) << "\n";
    }
    if (!output) {
        throw io_error(path, "write failed");
    }
}

std::string summary_to_json(const SummaryStatistics& summary) {
    std::ostringstream out;
    out << std::setprecision(12);
    const GridSpec& grid = summary.alignment.target;
    out << "{\n";
    out << "  \"cycle\": \"" << escape_json(summary.cycle) << "\",\n";
    out << "  \"reach_count\": " << summary.reach_count << ",\n";
    out << "  \"valid_pixels\": " << summary.valid_pixels << ",\n";
    out << "  \"nodata_pixels\": " << summary.nodata_pixels << ",\n";
    out << "  \"area_units\": \"" << escape_json(summary.area_units) << "\",\n";
    out << "  \"risk_bands\": [";
    for (std::size_t i = 0; i < summary.bands.size(); ++i) {
        const auto& band = summary.bands[i];
        out << (i == 0 ? "\n" : ",\n") << "    {\"band\": " << band.band << ", \"name\": \""
            << escape_json(band.name) << "\", \"pixels\": " << band.pixels << ", \"area\": " << band.area
            << ", \"percent\": " << band.percent << "}";
    }
    out << "\n  ],\n";
    out << "  \"severity_counts\": [";
    for (std::size_t i = 0; i < summary.severity_counts.size(); ++i) {
        out << (i == 0 ? "" : ", ") << summary.severity_counts[i];
    }
    out << "],\n";
    out << "  \"priority_reaches\": [";
    for (std::size_t i = 0; i < summary.priority_reaches.size(); ++i) {
        out << (i == 0 ? "\"" : ", \"") << escape_json(summary.priority_reaches[i]) << "\"";
    }
    out << "],\n";
    out << "  \"depth\": {\"max\": " << summary.depth.max_depth << ", \"mean\": " << summary.depth.mean_depth
        << ", \"painted_pixels\": " << summary.depth.painted_pixels << "},\n";
    out << "  \"alignment\": {\"mode\": \"" << (summary.alignment.derived ? "intersection" : "explicit")
        << "\", \"crs\": \"" << escape_json(grid.crs) << "\", \"origin_x\": " << grid.origin_x
        << ", \"origin_y\": " << grid.origin_y << ", \"pixel_width\": " << grid.pixel_width
        << ", \"pixel_height\": " << grid.pixel_height << ", \"cols\": " << grid.cols << ", \"rows\": " << grid.rows
        << ", \"severity_resampled\": " << (summary.alignment.severity_resampled ? "true" : "false")
        << ", \"vulnerability_resampled\": " << (summary.alignment.vulnerability_resampled ? "true" : "false")
        << "},\n";
    out << "  \"vulnerability_tiers\": {\"requested\": " << summary.tiering.requested_count << ", \"breakpoints\": [";
    for (std::size_t i = 0; i < summary.tiering.breakpoints.size(); ++i) {
        out << (i == 0 ? "" : ", ") << summary.tiering.breakpoints[i];
    }
    out << "], \"ranges\": [";
    for (std::size_t i = 0; i < summary.tiering.tier_ranges.size(); ++i) {
        out << (i == 0 ? "" : ", ") << "[" << summary.tiering.tier_ranges[i].first << ", "
            << summary.tiering.tier_ranges[i].second << "]";
    }
    out << "]},\n";
    out << "  \"warnings\": [";
    for (std::size_t i = 0; i < summary.warnings.size(); ++i) {
        const auto& warning = summary.warnings[i];
        out << (i == 0 ? "\n" : ",\n") << "    {\"code\": \"" << escape_json(warning.code) << "\", \"stage\": \""
            << stage_name(warning.stage) << "\", \"key\": \"" << escape_json(warning.key) << "\", \"count\": "
            << warning.count << ", \"detail\": \"" << escape_json(warning.detail) << "\"}";
    }
    out << (summary.warnings.empty() ? "]\n" : "\n  ]\n");
    out << "}\n";
    return out.str();
}

void write_summary_json(const std::string& path, const SummaryStatistics& summary) {
    std::ofstream output = open_output(path);
    output << summary_to_json(summary);
    if (!output) {
        throw io_error(path, "write failed");
    }
}

}  // namespace floodrisk

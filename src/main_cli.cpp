#include "floodrisk/api.hpp"
#include "floodrisk/config.hpp"
#include "floodrisk/engine.hpp"
#include "floodrisk/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --config <path> [--cycle <id>] [--output-dir <dir>]\n";
}

void print_band_table(const floodrisk::SummaryStatistics& summary) {
    std::cout << "Risk bands for cycle " << summary.cycle << " (" << summary.valid_pixels << " valid pixels, "
              << summary.area_units << ")\n";
    for (const auto& band : summary.bands) {
        char line[128];
        std::snprintf(line, sizeof(line), "  %3d  %-28s %10zu px  %6.2f%%\n", band.band, band.name.c_str(),
                      band.pixels, band.percent);
        std::cout << line;
    }
    if (!summary.priority_reaches.empty()) {
        std::cout << "Priority reaches: " << summary.priority_reaches.size() << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string cycle;
    std::string output_dir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--cycle" || arg == "--output-dir") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                config_path = value;
            } else if (arg == "--cycle") {
                cycle = value;
            } else {
                output_dir = value;
            }
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto settings = floodrisk::EngineSettings::from_toml(config_path);
        if (!cycle.empty()) {
            settings.cycle = cycle;
        }
        if (!output_dir.empty()) {
            settings.outputs.directory = output_dir;
        }
        floodrisk::configure_logging(settings.logging);
        auto logger = floodrisk::get_logger("floodrisk_cli");

        floodrisk::FloodRiskEngine engine(settings);
        auto inputs = floodrisk::load_cycle_inputs(engine.settings(), logger);
        auto result = engine.run(inputs.cycle, inputs.catalog, inputs.vulnerability);
        auto outputs = floodrisk::write_cycle_outputs(result, engine, engine.settings().outputs.directory);
        logger.info("outputs_written", {{"depth_grid", outputs.depth_grid},
                                        {"risk_grid", outputs.risk_grid},
                                        {"reach_depths", outputs.reach_depths},
                                        {"summary", outputs.summary}});
        print_band_table(result.summary);
    } catch (const std::exception& exc) {
        std::cerr << "floodrisk_cli error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}

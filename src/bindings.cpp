#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "floodrisk/api.hpp"
#include "floodrisk/engine.hpp"
#include "floodrisk/errors.hpp"
#include "floodrisk/io.hpp"

namespace py = pybind11;

namespace {

template <typename T>
void bind_raster(py::module_& m, const char* name) {
    using RasterT = floodrisk::Raster<T>;
    py::class_<RasterT>(m, name)
        .def(py::init<>())
        .def(py::init<std::string, floodrisk::GridSpec, T>(), py::arg("name"), py::arg("grid"), py::arg("nodata"))
        .def_readwrite("name", &RasterT::name)
        .def_readwrite("grid", &RasterT::grid)
        .def_readwrite("nodata", &RasterT::nodata)
        .def_readwrite("values", &RasterT::values)
        .def("at", static_cast<T (RasterT::*)(int, int) const>(&RasterT::at))
        .def("valid_count", &RasterT::valid_count);
}

}  // namespace

PYBIND11_MODULE(floodrisk_python, m) {
    m.doc() = "Pybind11 bindings for the floodrisk C++ core.";

    py::register_exception<floodrisk::FusionError>(m, "FusionError", PyExc_RuntimeError);

    py::class_<floodrisk::GridSpec>(m, "GridSpec")
        .def(py::init<>())
        .def_readwrite("crs", &floodrisk::GridSpec::crs)
        .def_readwrite("origin_x", &floodrisk::GridSpec::origin_x)
        .def_readwrite("origin_y", &floodrisk::GridSpec::origin_y)
        .def_readwrite("pixel_width", &floodrisk::GridSpec::pixel_width)
        .def_readwrite("pixel_height", &floodrisk::GridSpec::pixel_height)
        .def_readwrite("cols", &floodrisk::GridSpec::cols)
        .def_readwrite("rows", &floodrisk::GridSpec::rows)
        .def("same_grid", &floodrisk::GridSpec::same_grid)
        .def("__repr__", &floodrisk::GridSpec::describe);

    bind_raster<double>(m, "ScoreRaster");
    m.attr("DepthRaster") = m.attr("ScoreRaster");
    bind_raster<int>(m, "ClassRaster");

    py::class_<floodrisk::SeverityConfig>(m, "SeverityConfig")
        .def(py::init<>())
        .def_readwrite("moderate", &floodrisk::SeverityConfig::moderate)
        .def_readwrite("high", &floodrisk::SeverityConfig::high)
        .def_readwrite("very_high", &floodrisk::SeverityConfig::very_high)
        .def_readwrite("names", &floodrisk::SeverityConfig::names);

    py::class_<floodrisk::EngineSettings>(m, "EngineSettings")
        .def(py::init<>())
        .def_static("from_toml", &floodrisk::EngineSettings::from_toml)
        .def("validate", &floodrisk::EngineSettings::validate)
        .def_readwrite("severity", &floodrisk::EngineSettings::severity)
        .def_readwrite("cycle", &floodrisk::EngineSettings::cycle)
        .def_property(
            "quantile_count", [](const floodrisk::EngineSettings& s) { return s.vulnerability.quantile_count; },
            [](floodrisk::EngineSettings& s, int value) { s.vulnerability.quantile_count = value; })
        .def_property(
            "output_directory", [](const floodrisk::EngineSettings& s) { return s.outputs.directory; },
            [](floodrisk::EngineSettings& s, const std::string& value) { s.outputs.directory = value; });

    py::class_<floodrisk::RatingBreakpoint>(m, "RatingBreakpoint")
        .def(py::init<>())
        .def(py::init([](double discharge, double depth) { return floodrisk::RatingBreakpoint{discharge, depth}; }))
        .def_readwrite("discharge", &floodrisk::RatingBreakpoint::discharge)
        .def_readwrite("depth", &floodrisk::RatingBreakpoint::depth);

    py::class_<floodrisk::PixelIndex>(m, "PixelIndex")
        .def(py::init<>())
        .def(py::init([](int col, int row) { return floodrisk::PixelIndex{col, row}; }))
        .def_readwrite("col", &floodrisk::PixelIndex::col)
        .def_readwrite("row", &floodrisk::PixelIndex::row);

    py::class_<floodrisk::ReachData>(m, "ReachData")
        .def(py::init([](std::vector<floodrisk::RatingBreakpoint> rating, floodrisk::CatchmentMask mask) {
                 return floodrisk::ReachData{floodrisk::RatingTable(std::move(rating)), std::move(mask)};
             }),
             py::arg("rating"), py::arg("mask"))
        .def_readwrite("mask", &floodrisk::ReachData::mask);

    py::class_<floodrisk::ReachCatalog, std::shared_ptr<floodrisk::ReachCatalog>>(m, "ReachCatalog")
        .def(py::init<floodrisk::GridSpec, std::map<std::string, floodrisk::ReachData>>(), py::arg("grid"),
             py::arg("reaches"))
        .def_property_readonly("grid", &floodrisk::ReachCatalog::grid)
        .def("reach_ids", &floodrisk::ReachCatalog::reach_ids)
        .def("__len__", &floodrisk::ReachCatalog::size);

    py::class_<floodrisk::ForecastSample>(m, "ForecastSample")
        .def(py::init<>())
        .def(py::init([](std::string reach_id, double discharge) {
                 return floodrisk::ForecastSample{std::move(reach_id), discharge, "", ""};
             }),
             py::arg("reach_id"), py::arg("max_discharge"))
        .def_readwrite("reach_id", &floodrisk::ForecastSample::reach_id)
        .def_readwrite("max_discharge", &floodrisk::ForecastSample::max_discharge)
        .def_readwrite("valid_start", &floodrisk::ForecastSample::valid_start)
        .def_readwrite("valid_end", &floodrisk::ForecastSample::valid_end);

    py::class_<floodrisk::ForecastCycle>(m, "ForecastCycle")
        .def(py::init<>())
        .def_readwrite("id", &floodrisk::ForecastCycle::id)
        .def_readwrite("samples", &floodrisk::ForecastCycle::samples);

    py::class_<floodrisk::RiskBandStats>(m, "RiskBandStats")
        .def_readonly("band", &floodrisk::RiskBandStats::band)
        .def_readonly("name", &floodrisk::RiskBandStats::name)
        .def_readonly("pixels", &floodrisk::RiskBandStats::pixels)
        .def_readonly("area", &floodrisk::RiskBandStats::area)
        .def_readonly("percent", &floodrisk::RiskBandStats::percent);

    py::class_<floodrisk::SummaryStatistics>(m, "SummaryStatistics")
        .def_readonly("cycle", &floodrisk::SummaryStatistics::cycle)
        .def_readonly("reach_count", &floodrisk::SummaryStatistics::reach_count)
        .def_readonly("bands", &floodrisk::SummaryStatistics::bands)
        .def_readonly("area_units", &floodrisk::SummaryStatistics::area_units)
        .def_readonly("valid_pixels", &floodrisk::SummaryStatistics::valid_pixels)
        .def_readonly("nodata_pixels", &floodrisk::SummaryStatistics::nodata_pixels)
        .def_readonly("severity_counts", &floodrisk::SummaryStatistics::severity_counts)
        .def_readonly("priority_reaches", &floodrisk::SummaryStatistics::priority_reaches)
        .def("to_json", &floodrisk::summary_to_json);

    py::class_<floodrisk::CycleResult>(m, "CycleResult")
        .def_property_readonly("depth", [](const floodrisk::CycleResult& r) { return r.depth.raster; })
        .def_readonly("severity", &floodrisk::CycleResult::severity)
        .def_property_readonly("risk_bands", [](const floodrisk::CycleResult& r) { return r.risk.bands; })
        .def_readonly("summary", &floodrisk::CycleResult::summary);

    py::class_<floodrisk::FloodRiskEngine>(m, "FloodRiskEngine")
        .def(py::init([](floodrisk::EngineSettings settings) {
            return floodrisk::FloodRiskEngine(std::move(settings));
        }))
        .def("run",
             [](const floodrisk::FloodRiskEngine& engine, const floodrisk::ForecastCycle& cycle,
                std::shared_ptr<floodrisk::ReachCatalog> catalog, const floodrisk::ScoreRaster& vulnerability) {
                 py::gil_scoped_release release;
                 return engine.run(cycle, std::move(catalog), vulnerability);
             },
             py::arg("cycle"), py::arg("catalog"), py::arg("vulnerability"))
        .def("write_outputs",
             [](const floodrisk::FloodRiskEngine& engine, const floodrisk::CycleResult& result,
                const std::string& directory) { floodrisk::write_cycle_outputs(result, engine, directory); },
             py::arg("result"), py::arg("directory"));

    m.def("read_ascii_grid", &floodrisk::read_ascii_grid, py::arg("path"), py::arg("crs"),
          py::arg("name") = "grid");
    m.def("run_cycle", [](const floodrisk::EngineSettings& settings) { return floodrisk::run_cycle(settings); },
          py::arg("settings"));
}

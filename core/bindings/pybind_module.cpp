// PyBind11 bindings for the webp_recompress core.
// Exposes the quality policy, the trial table, configuration and the
// top-level recompress call to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DWRC_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "config/config.hpp"
#include "files/working_files.hpp"
#include "quality/quality_policy.hpp"
#include "recompress/recompressor.hpp"
#include "search/trial_table.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

#include <iostream>

namespace py = pybind11;

PYBIND11_MODULE(wrc_bindings, m) {
    m.doc() = "webp_recompress core bindings";

    // ── ErrorKind ──
    py::enum_<wrc::ErrorKind>(m, "ErrorKind")
        .value("NONE", wrc::ErrorKind::NONE)
        .value("INPUT_FORMAT", wrc::ErrorKind::INPUT_FORMAT)
        .value("PROBE_FAILURE", wrc::ErrorKind::PROBE_FAILURE)
        .value("GUESS_FAILURE", wrc::ErrorKind::GUESS_FAILURE)
        .value("CONVERSION_FAILURE", wrc::ErrorKind::CONVERSION_FAILURE)
        .value("ENCODE_FAILURE", wrc::ErrorKind::ENCODE_FAILURE)
        .value("DECODE_FAILURE", wrc::ErrorKind::DECODE_FAILURE)
        .value("SCORE_FAILURE", wrc::ErrorKind::SCORE_FAILURE)
        .value("TRIAL_FAILURE", wrc::ErrorKind::TRIAL_FAILURE)
        .value("CLEANUP_FAILURE", wrc::ErrorKind::CLEANUP_FAILURE)
        .value("THRESHOLD_OUT_OF_RANGE", wrc::ErrorKind::THRESHOLD_OUT_OF_RANGE)
        .value("INVALID_CONFIG", wrc::ErrorKind::INVALID_CONFIG)
        .value("RELAXATION_LIMIT", wrc::ErrorKind::RELAXATION_LIMIT);

    m.def("error_kind_name", &wrc::errorKindName);

    // ── TrialRecord / TrialTable ──
    py::class_<wrc::TrialRecord>(m, "TrialRecord")
        .def(py::init<>())
        .def_readwrite("score", &wrc::TrialRecord::score)
        .def_readwrite("size", &wrc::TrialRecord::size)
        .def_readwrite("attempts", &wrc::TrialRecord::attempts);

    py::class_<wrc::TrialTable>(m, "TrialTable")
        .def(py::init<>())
        .def("record", &wrc::TrialTable::record,
             py::arg("quality"), py::arg("score"), py::arg("size"),
             py::return_value_policy::reference_internal)
        .def("contains", &wrc::TrialTable::contains)
        .def("size", &wrc::TrialTable::size)
        .def("total_attempts", &wrc::TrialTable::totalAttempts)
        .def("entries", &wrc::TrialTable::entries)
        .def("clear", &wrc::TrialTable::clear);

    // ── Quality policy ──
    py::class_<wrc::FinalQuality>(m, "FinalQuality")
        .def(py::init<>())
        .def_readwrite("quality", &wrc::FinalQuality::quality)
        .def_readwrite("size", &wrc::FinalQuality::size);

    m.def("clamp_quality", &wrc::clampQuality, py::arg("quality"));
    m.def("get_quality_interval", &wrc::getQualityInterval,
          py::arg("score"), py::arg("threshold"), py::arg("quality"));
    m.def("relax_threshold", &wrc::relaxThreshold,
          py::arg("threshold"), py::arg("multiplier"));
    m.def("get_final_quality", &wrc::getFinalQuality,
          py::arg("threshold"), py::arg("trials"));

    // ── Working files ──
    py::class_<wrc::WorkingFileSet>(m, "WorkingFileSet")
        .def(py::init<>())
        .def_readwrite("reference_png", &wrc::WorkingFileSet::reference_png)
        .def_readwrite("output_webp", &wrc::WorkingFileSet::output_webp)
        .def_readwrite("webp_png", &wrc::WorkingFileSet::webp_png);

    m.def("make_working_files", &wrc::makeWorkingFiles, py::arg("input"));

    // ── Config ──
    py::class_<wrc::ToolPaths>(m, "ToolPaths")
        .def(py::init<>())
        .def_readwrite("cwebp", &wrc::ToolPaths::cwebp)
        .def_readwrite("dwebp", &wrc::ToolPaths::dwebp)
        .def_readwrite("convert", &wrc::ToolPaths::convert)
        .def_readwrite("identify", &wrc::ToolPaths::identify)
        .def_readwrite("ssimulacra", &wrc::ToolPaths::ssimulacra);

    py::class_<wrc::RecompressConfig>(m, "RecompressConfig")
        .def(py::init<>())
        .def_readwrite("threshold", &wrc::RecompressConfig::threshold)
        .def_readwrite("threshold_multiplier", &wrc::RecompressConfig::threshold_multiplier)
        .def_readwrite("start", &wrc::RecompressConfig::start)
        .def_readwrite("quiet", &wrc::RecompressConfig::quiet)
        .def_readwrite("verbose", &wrc::RecompressConfig::verbose)
        .def_readwrite("max_attempts", &wrc::RecompressConfig::max_attempts)
        .def_readwrite("escape_nudge", &wrc::RecompressConfig::escape_nudge)
        .def_readwrite("max_relaxations", &wrc::RecompressConfig::max_relaxations)
        .def_readwrite("keep_intermediates", &wrc::RecompressConfig::keep_intermediates)
        .def_readwrite("tools", &wrc::RecompressConfig::tools);

    // ── RecompressResult ──
    py::class_<wrc::RecompressResult>(m, "RecompressResult")
        .def(py::init<>())
        .def_readwrite("success", &wrc::RecompressResult::success)
        .def_readwrite("error", &wrc::RecompressResult::error)
        .def_readwrite("message", &wrc::RecompressResult::message)
        .def_readwrite("input", &wrc::RecompressResult::input)
        .def_readwrite("output", &wrc::RecompressResult::output)
        .def_readwrite("lossless", &wrc::RecompressResult::lossless)
        .def_readwrite("input_size", &wrc::RecompressResult::input_size)
        .def_readwrite("output_size", &wrc::RecompressResult::output_size)
        .def_readwrite("quality", &wrc::RecompressResult::quality)
        .def_readwrite("final_threshold", &wrc::RecompressResult::final_threshold)
        .def_readwrite("relaxations", &wrc::RecompressResult::relaxations)
        .def_readwrite("total_trials", &wrc::RecompressResult::total_trials)
        .def_readwrite("elapsed_seconds", &wrc::RecompressResult::elapsed_seconds);

    m.def("default_config", []() {
        return wrc::RecompressConfig{};
    });

    m.def("recompress", [](const std::string& input, const wrc::RecompressConfig& config) {
        wrc::Logger logger(std::cout, std::cerr);
        return wrc::recompressFile(input, config, logger);
    }, py::arg("input"), py::arg("config") = wrc::RecompressConfig{});
}

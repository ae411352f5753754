#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <optional>
#include <vector>

#include "esync/align/discontinuity.hpp"
#include "esync/align/remap.hpp"
#include "esync/config.hpp"
#include "esync/errors.hpp"
#include "esync/harp/barcode.hpp"
#include "esync/harp/line_search.hpp"

namespace py = pybind11;

// Copy a 1-D NumPy array (any numeric dtype, forcecast) into a vector
template <typename T>
std::vector<T> numpy_to_vector(py::array_t<T, py::array::c_style | py::array::forcecast> input) {
    py::buffer_info buf_info = input.request();
    T* ptr = static_cast<T*>(buf_info.ptr);
    return std::vector<T>(ptr, ptr + buf_info.size);
}

py::array_t<double> vector_to_numpy(const std::vector<double>& vec) {
    py::array_t<double> out(vec.size());
    std::copy(vec.begin(), vec.end(), out.mutable_data());
    return out;
}

PYBIND11_MODULE(esync_py, m) {
    m.doc() = "Timestamp alignment for multi-stream electrophysiology recordings";

    py::register_exception<esync::DataIntegrityError>(m, "DataIntegrityError", PyExc_RuntimeError);
    py::register_exception<esync::BarcodeDecodeError>(m, "BarcodeDecodeError", PyExc_RuntimeError);
    py::register_exception<esync::AmbiguousSyncLineError>(m, "AmbiguousSyncLineError", PyExc_RuntimeError);

    py::class_<esync::HarpConfig>(m, "HarpConfig")
        .def(py::init<>())
        .def_readwrite("segment_gap_s", &esync::HarpConfig::segment_gap_s)
        .def_readwrite("baud_rate", &esync::HarpConfig::baud_rate)
        .def_readwrite("onset_gap_s", &esync::HarpConfig::onset_gap_s)
        .def_readwrite("short_gap_s", &esync::HarpConfig::short_gap_s)
        .def_readwrite("bin_width_s", &esync::HarpConfig::bin_width_s)
        .def_readwrite("min_p_value", &esync::HarpConfig::min_p_value)
        .def_readwrite("min_short_gap_fraction", &esync::HarpConfig::min_short_gap_fraction)
        .def_readwrite("line", &esync::HarpConfig::line);

    py::class_<esync::align::SampleRange>(m, "SampleRange")
        .def_readonly("first", &esync::align::SampleRange::first)
        .def_readonly("last", &esync::align::SampleRange::last);

    py::class_<esync::align::DiscontinuityReport>(m, "DiscontinuityReport")
        .def_readonly("realignable", &esync::align::DiscontinuityReport::realignable)
        .def_readonly("discontinuities", &esync::align::DiscontinuityReport::discontinuities)
        .def_readonly("main_range", &esync::align::DiscontinuityReport::main_range)
        .def_readonly("residual_ranges", &esync::align::DiscontinuityReport::residual_ranges)
        .def_readonly("removable", &esync::align::DiscontinuityReport::removable)
        .def_readonly("backward", &esync::align::DiscontinuityReport::backward)
        .def_readonly("main_tied", &esync::align::DiscontinuityReport::main_tied)
        .def_readonly("overlap_percent", &esync::align::DiscontinuityReport::overlap_percent);

    py::class_<esync::harp::LineStatistics>(m, "LineStatistics")
        .def_readonly("line", &esync::harp::LineStatistics::line)
        .def_readonly("rising_edges", &esync::harp::LineStatistics::rising_edges)
        .def_readonly("chi2", &esync::harp::LineStatistics::chi2)
        .def_readonly("p_value", &esync::harp::LineStatistics::p_value)
        .def_readonly("short_gap_fraction", &esync::harp::LineStatistics::short_gap_fraction)
        .def_readonly("accepted", &esync::harp::LineStatistics::accepted);

    py::class_<esync::harp::LineSearchResult>(m, "LineSearchResult")
        .def_readonly("lines", &esync::harp::LineSearchResult::lines)
        .def_readonly("candidates", &esync::harp::LineSearchResult::candidates);

    m.def("remap", [](py::array_t<double, py::array::c_style | py::array::forcecast> raw,
                      py::array_t<double, py::array::c_style | py::array::forcecast> anchor_index,
                      py::array_t<double, py::array::c_style | py::array::forcecast> anchor_time) {
        auto r = numpy_to_vector<double>(raw);
        auto ai = numpy_to_vector<double>(anchor_index);
        auto at = numpy_to_vector<double>(anchor_time);
        return vector_to_numpy(esync::align::remap(r, ai, at));
    }, "Piecewise-linear remap of raw values through anchor pairs",
       py::arg("raw"), py::arg("anchor_index"), py::arg("anchor_time"));

    m.def("detect_discontinuities", [](py::array_t<int64_t, py::array::c_style | py::array::forcecast> counter,
                                       size_t max_discontinuities) {
        auto c = numpy_to_vector<int64_t>(counter);
        return esync::align::detect_discontinuities(c, max_discontinuities);
    }, "Classify steps != 1 in a raw sample counter",
       py::arg("sample_numbers"), py::arg("max_discontinuities") = 2);

    // Events given as parallel arrays of one stream: line, state, timestamp
    m.def("droppable_residuals", &esync::align::droppable_residuals, py::arg("report"));

    m.def("select_barcode_lines", [](py::array_t<int64_t, py::array::c_style | py::array::forcecast> lines,
                                     py::array_t<int64_t, py::array::c_style | py::array::forcecast> states,
                                     py::array_t<double, py::array::c_style | py::array::forcecast> times,
                                     const esync::HarpConfig& cfg) {
        auto l = numpy_to_vector<int64_t>(lines);
        auto s = numpy_to_vector<int64_t>(states);
        auto t = numpy_to_vector<double>(times);
        if (l.size() != s.size() || l.size() != t.size())
            throw std::invalid_argument("lines, states and times must have the same length");
        esync::EventStream events;
        for (size_t k = 0; k < l.size(); ++k) {
            esync::Event e;
            e.line = static_cast<int>(l[k]);
            e.state = static_cast<int>(s[k]);
            e.timestamp = t[k];
            events.push_back(e);
        }
        return esync::harp::select_barcode_lines(events, 0, cfg);
    }, "Score every digital line as a Harp barcode candidate",
       py::arg("lines"), py::arg("states"), py::arg("times"), py::arg("config") = esync::HarpConfig{});

    m.def("decode_barcodes", [](py::array_t<double, py::array::c_style | py::array::forcecast> times,
                                py::array_t<int64_t, py::array::c_style | py::array::forcecast> states,
                                const esync::HarpConfig& cfg) {
        auto t = numpy_to_vector<double>(times);
        auto s64 = numpy_to_vector<int64_t>(states);
        std::vector<int> s(s64.begin(), s64.end());
        auto summary = esync::harp::decode_barcodes(t, s, cfg);
        return py::make_tuple(vector_to_numpy(summary.anchors.sample_index),
                              vector_to_numpy(summary.anchors.target_time));
    }, "Decode Harp barcodes; returns (local_times, harp_times)",
       py::arg("times"), py::arg("states"), py::arg("config") = esync::HarpConfig{});
}

/**
 * @file data_bindings.cpp
 * @brief Python bindings for timestamp helpers and CSV log loading
 */

#include "ghostmeter/data/log_loader.hpp"
#include "ghostmeter/data/timestamp.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace ghostmeter;

void bind_data(py::module_ &m) {
  // Timestamps
  m.def("parse_timestamp", &timestamp::parse, py::arg("text"),
        "Parse an ISO-like date/time string into UTC epoch seconds");
  m.def("day_of_year", &timestamp::day_of_year, py::arg("date"),
        "Day of year (1..366), 1 for missing or unparseable dates");

  // LogCsvOptions
  py::class_<LogCsvOptions>(m, "LogCsvOptions")
      .def(py::init<>())
      .def_readwrite("delimiter", &LogCsvOptions::delimiter)
      .def_readwrite("has_header", &LogCsvOptions::has_header)
      .def_readwrite("time_column", &LogCsvOptions::time_column)
      .def_readwrite("supply_column", &LogCsvOptions::supply_column)
      .def_readwrite("return_column", &LogCsvOptions::return_column)
      .def_readwrite("date_column", &LogCsvOptions::date_column)
      .def_readwrite("water_column", &LogCsvOptions::water_column)
      .def_readwrite("electricity_column", &LogCsvOptions::electricity_column);

  py::class_<LoadStats>(m, "LoadStats")
      .def(py::init<>())
      .def_readonly("rows_read", &LoadStats::rows_read)
      .def_readonly("rows_skipped", &LoadStats::rows_skipped);

  // LogLoader (static)
  m.def(
      "load_samples",
      [](const std::string &path, const LogCsvOptions &opts) {
        return LogLoader::load_samples(path, opts);
      },
      py::arg("path"), py::arg("opts") = LogCsvOptions(),
      "Load sensor samples (timestamp, supply, return) from a CSV file");
  m.def(
      "load_history",
      [](const std::string &path, const LogCsvOptions &opts) {
        return LogLoader::load_history(path, opts);
      },
      py::arg("path"), py::arg("opts") = LogCsvOptions(),
      "Load daily history (date, water, electricity) from a CSV file");
}

/**
 * @file engine_bindings.cpp
 * @brief Python bindings for the request-level engine API
 *
 * Exposes:
 * - SampleRecord / DayAnalysisRequest / DayAnalysisResponse
 * - CoefficientRequest
 * - DistributionRequest / DistributionResult
 * - HeatingEngine
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ghostmeter/core/config.hpp"
#include "ghostmeter/core/heating_engine.hpp"

namespace py = pybind11;

namespace ghostmeter {

/**
 * @brief Initialize engine bindings
 */
void init_engine_bindings(py::module_& m) {
    // ========================================================================
    // Day analysis
    // ========================================================================
    py::class_<SampleRecord>(m, "SampleRecord",
        "Sensor sample with an ISO-like timestamp string")
        .def(py::init<>())
        .def(py::init<const std::string&, double, double>(),
            py::arg("timestamp"), py::arg("supply_temp"), py::arg("return_temp"))
        .def_readwrite("timestamp", &SampleRecord::timestamp)
        .def_readwrite("supply_temp", &SampleRecord::supply_temp)
        .def_readwrite("return_temp", &SampleRecord::return_temp);

    py::class_<DayAnalysisRequest>(m, "DayAnalysisRequest")
        .def(py::init<>())
        .def_readwrite("samples", &DayAnalysisRequest::samples)
        .def_readwrite("flow_rate", &DayAnalysisRequest::flow_rate)
        .def_readwrite("indoor_temperature", &DayAnalysisRequest::indoor_temperature)
        .def_readwrite("solar_avg", &DayAnalysisRequest::solar_avg)
        .def_readwrite("previous_meter_value", &DayAnalysisRequest::previous_meter_value)
        .def_readwrite("date", &DayAnalysisRequest::date)
        .def_readwrite("current_coefficient", &DayAnalysisRequest::current_coefficient);

    py::class_<DayAnalysisResponse>(m, "DayAnalysisResponse")
        .def_readonly("kwh", &DayAnalysisResponse::kwh)
        .def_readonly("run_minutes", &DayAnalysisResponse::run_minutes)
        .def_readonly("off_minutes", &DayAnalysisResponse::off_minutes)
        .def_readonly("new_meter_value", &DayAnalysisResponse::new_meter_value)
        .def_readonly("solar_gain", &DayAnalysisResponse::solar_gain)
        .def_readonly("used_coefficient", &DayAnalysisResponse::used_coefficient)
        .def_readonly("grid_points", &DayAnalysisResponse::grid_points)
        .def_readonly("error", &DayAnalysisResponse::error)
        .def("ok", &DayAnalysisResponse::ok)
        .def("to_dict", [](const DayAnalysisResponse& r) {
            py::dict d;
            d["kwh"] = r.kwh;
            d["run_minutes"] = r.run_minutes;
            d["off_minutes"] = r.off_minutes;
            d["new_meter_value"] = r.new_meter_value;
            d["solar_gain"] = r.solar_gain;
            d["used_coefficient"] = r.used_coefficient;
            if (!r.ok()) {
                d["error"] = r.error;
            }
            return d;
        }, "Response payload as a dict");

    // ========================================================================
    // Coefficient learning
    // ========================================================================
    py::class_<CoefficientRequest>(m, "CoefficientRequest")
        .def(py::init<>())
        .def_readwrite("history", &CoefficientRequest::history)
        .def_readwrite("mode", &CoefficientRequest::mode)
        .def_readwrite("strategy", &CoefficientRequest::strategy);

    // ========================================================================
    // Distribution
    // ========================================================================
    py::class_<DistributionRequest>(m, "DistributionRequest")
        .def(py::init<>())
        .def_readwrite("total_electricity_delta", &DistributionRequest::total_electricity_delta)
        .def_readwrite("daily_water_logs", &DistributionRequest::daily_water_logs);

    py::class_<DistributionResult>(m, "DistributionResult")
        .def_readonly("results", &DistributionResult::results)
        .def_readonly("error", &DistributionResult::error)
        .def("ok", &DistributionResult::ok);

    // ========================================================================
    // HeatingEngine
    // ========================================================================
    py::class_<HeatingEngine>(m, "HeatingEngine",
        "Stateless estimation engine; every call returns a well-formed response")
        .def(py::init<const EngineConfig&>(), py::arg("config") = EngineConfig())
        .def("analyze_day", &HeatingEngine::analyze_day,
            py::arg("request"),
            py::call_guard<py::gil_scoped_release>(),
            "Energy, run/off minutes, ghost meter and solar gain for one day")
        .def("learn_coefficient", &HeatingEngine::learn_coefficient,
            py::arg("request"),
            py::call_guard<py::gil_scoped_release>(),
            "Learn the water-to-electricity coefficient from daily history")
        .def("distribute", &HeatingEngine::distribute,
            py::arg("request"),
            py::call_guard<py::gil_scoped_release>(),
            "Allocate an aggregate electricity delta to days")
        .def_property_readonly("config", &HeatingEngine::config);
}

} // namespace ghostmeter

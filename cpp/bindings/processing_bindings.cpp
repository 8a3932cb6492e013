/**
 * @file processing_bindings.cpp
 * @brief Python bindings for the estimation components and their config
 */

#include "ghostmeter/core/config.hpp"
#include "ghostmeter/core/types.hpp"
#include "ghostmeter/processing/coefficient_learner.hpp"
#include "ghostmeter/processing/energy_distributor.hpp"
#include "ghostmeter/processing/energy_integrator.hpp"
#include "ghostmeter/processing/ghost_meter.hpp"
#include "ghostmeter/processing/resampler.hpp"
#include "ghostmeter/processing/solar_gain.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace ghostmeter;

void bind_processing(py::module_ &m) {
  // ===== CONFIGURATION =====

  py::class_<RunDetectionConfig>(m, "RunDetectionConfig")
      .def(py::init<>())
      .def_readwrite("delta_t_threshold", &RunDetectionConfig::delta_t_threshold)
      .def_readwrite("min_supply_temperature",
                     &RunDetectionConfig::min_supply_temperature)
      .def_readwrite("power_factor", &RunDetectionConfig::power_factor)
      .def_readwrite("day_minutes", &RunDetectionConfig::day_minutes)
      .def("validate", &RunDetectionConfig::validate);

  py::class_<SolarModelConfig>(m, "SolarModelConfig")
      .def(py::init<>())
      .def_readwrite("window_area_m2", &SolarModelConfig::window_area_m2)
      .def_readwrite("g_value", &SolarModelConfig::g_value)
      .def_readwrite("hours_per_day", &SolarModelConfig::hours_per_day)
      .def_readwrite("min_shading_factor", &SolarModelConfig::min_shading_factor)
      .def_readwrite("solstice_offset_days",
                     &SolarModelConfig::solstice_offset_days)
      .def_readwrite("days_per_year", &SolarModelConfig::days_per_year)
      .def("validate", &SolarModelConfig::validate);

  py::class_<CoefficientConfig>(m, "CoefficientConfig")
      .def(py::init<>())
      .def_readwrite("default_coefficient",
                     &CoefficientConfig::default_coefficient)
      .def_readwrite("min_activity_kwh", &CoefficientConfig::min_activity_kwh)
      .def_readwrite("min_valid_days", &CoefficientConfig::min_valid_days)
      .def_readwrite("recent_window_days",
                     &CoefficientConfig::recent_window_days)
      .def_readwrite("clamp_min", &CoefficientConfig::clamp_min)
      .def_readwrite("clamp_max", &CoefficientConfig::clamp_max)
      .def_readwrite("outlier_ratio_min", &CoefficientConfig::outlier_ratio_min)
      .def_readwrite("outlier_ratio_max", &CoefficientConfig::outlier_ratio_max)
      .def_readwrite("round_decimals", &CoefficientConfig::round_decimals)
      .def("validate", &CoefficientConfig::validate);

  py::class_<EngineConfig>(m, "EngineConfig")
      .def(py::init<>())
      .def_readwrite("run", &EngineConfig::run)
      .def_readwrite("solar", &EngineConfig::solar)
      .def_readwrite("coefficient", &EngineConfig::coefficient)
      .def("validate", &EngineConfig::validate);

  // ===== DATA TYPES =====

  py::class_<SensorSample>(m, "SensorSample")
      .def(py::init<>())
      .def(py::init<double, double, double>(), py::arg("timestamp"),
           py::arg("supply_temperature"), py::arg("return_temperature"))
      .def_readwrite("timestamp", &SensorSample::timestamp)
      .def_readwrite("supply_temperature", &SensorSample::supply_temperature)
      .def_readwrite("return_temperature", &SensorSample::return_temperature);

  py::class_<ResampledPoint>(m, "ResampledPoint")
      .def_readonly("minute_offset", &ResampledPoint::minute_offset)
      .def_readonly("timestamp", &ResampledPoint::timestamp)
      .def_readonly("supply_temperature", &ResampledPoint::supply_temperature)
      .def_readonly("return_temperature", &ResampledPoint::return_temperature)
      .def_property_readonly("delta_t", &ResampledPoint::delta_t);

  py::class_<EnergyResult>(m, "EnergyResult")
      .def(py::init<>())
      .def_readonly("kwh", &EnergyResult::kwh)
      .def_readonly("run_minutes", &EnergyResult::run_minutes)
      .def_readonly("off_minutes", &EnergyResult::off_minutes)
      .def_readonly("grid_points", &EnergyResult::grid_points)
      .def("__repr__", [](const EnergyResult &r) {
        return "<EnergyResult kwh=" + std::to_string(r.kwh) +
               " run=" + std::to_string(r.run_minutes) +
               " off=" + std::to_string(r.off_minutes) + ">";
      });

  py::class_<GhostMeterState>(m, "GhostMeterState")
      .def_readonly("previous_value", &GhostMeterState::previous_value)
      .def_readonly("new_value", &GhostMeterState::new_value)
      .def_property_readonly("increment", &GhostMeterState::increment);

  py::class_<HistoryDayRecord>(m, "HistoryDayRecord")
      .def(py::init<>())
      .def(py::init<const std::string &, double, double>(), py::arg("date"),
           py::arg("water_energy"), py::arg("electricity"))
      .def_readwrite("date", &HistoryDayRecord::date)
      .def_readwrite("water_energy", &HistoryDayRecord::water_energy)
      .def_readwrite("electricity", &HistoryDayRecord::electricity);

  py::enum_<HistoryMode>(m, "HistoryMode")
      .value("DELTA", HistoryMode::DELTA)
      .value("DIRECT", HistoryMode::DIRECT)
      .export_values();

  py::enum_<CoefficientStrategy>(m, "CoefficientStrategy")
      .value("RECENCY_WEIGHTED", CoefficientStrategy::RECENCY_WEIGHTED)
      .value("OUTLIER_FILTERED", CoefficientStrategy::OUTLIER_FILTERED)
      .export_values();

  py::enum_<CoefficientStatus>(m, "CoefficientStatus")
      .value("COMPUTED", CoefficientStatus::COMPUTED)
      .value("INSUFFICIENT_DATA", CoefficientStatus::INSUFFICIENT_DATA)
      .value("DIVISION_BY_ZERO", CoefficientStatus::DIVISION_BY_ZERO)
      .value("ALL_OUTLIERS", CoefficientStatus::ALL_OUTLIERS)
      .value("ERROR", CoefficientStatus::ERROR)
      .export_values();

  py::class_<CoefficientEstimate>(m, "CoefficientEstimate")
      .def_readonly("value", &CoefficientEstimate::value)
      .def_readonly("raw_value", &CoefficientEstimate::raw_value)
      .def_readonly("sample_size", &CoefficientEstimate::sample_size)
      .def_readonly("status", &CoefficientEstimate::status)
      .def_readonly("reason", &CoefficientEstimate::reason)
      .def_property_readonly("status_tag", [](const CoefficientEstimate &e) {
        return std::string(to_string(e.status));
      })
      .def("__repr__", [](const CoefficientEstimate &e) {
        return "<CoefficientEstimate value=" + std::to_string(e.value) +
               " status=" + to_string(e.status) + ">";
      });

  py::class_<DailyWaterLog>(m, "DailyWaterLog")
      .def(py::init<>())
      .def(py::init<const std::string &, double>(), py::arg("date"),
           py::arg("water_energy"))
      .def_readwrite("date", &DailyWaterLog::date)
      .def_readwrite("water_energy", &DailyWaterLog::water_energy);

  py::class_<DailyAllocation>(m, "DailyAllocation")
      .def_readonly("date", &DailyAllocation::date)
      .def_readonly("allocated_electricity",
                    &DailyAllocation::allocated_electricity);

  // ===== COMPONENTS =====

  m.def("resample", &Resampler::resample, py::arg("samples"),
        R"pbdoc(
            Resample sensor samples onto a uniform 1-minute grid.

            Samples are sorted and averaged per calendar minute; minutes
            without samples are linearly interpolated. The grid spans the
            first..last observed minute; nothing is extrapolated.
        )pbdoc");

  m.def("integrate_energy", &EnergyIntegrator::analyze, py::arg("samples"),
        py::arg("flow_rate"), py::arg("config") = RunDetectionConfig(),
        R"pbdoc(
            Resample samples and integrate thermal power (trapezoidal rule).

            Raises ValueError for a negative flow rate or non-finite values.
        )pbdoc");

  m.def("shading_factor", &SolarGainModel::shading_factor,
        py::arg("day_of_year"), py::arg("config") = SolarModelConfig());
  m.def("solar_gain", &SolarGainModel::estimate, py::arg("date"),
        py::arg("irradiance"), py::arg("indoor_temperature"),
        py::arg("config") = SolarModelConfig(),
        "Passive solar gain in kWh (0 unless indoor_temperature > 0 and a "
        "date is given)");

  m.def("accumulate_meter", &GhostMeter::accumulate, py::arg("previous_value"),
        py::arg("water_kwh"), py::arg("coefficient"),
        "Ghost meter step: previous + water_kwh * coefficient");

  m.def("learn_coefficient", &CoefficientLearner::learn, py::arg("history"),
        py::arg("mode") = HistoryMode::DELTA,
        py::arg("strategy") = CoefficientStrategy::RECENCY_WEIGHTED,
        py::arg("config") = CoefficientConfig(),
        "Learn the water-to-electricity coefficient (may raise on malformed "
        "dates; use HeatingEngine for the non-raising variant)");

  m.def("distribute_energy", &EnergyDistributor::distribute,
        py::arg("total_electricity_delta"), py::arg("daily_water_logs"),
        "Split an electricity delta across days by water-energy share");
}

#pragma once

/**
 * @file config.hpp
 * @brief Tunable constants of the estimation engine
 *
 * Every threshold the components use lives here with its canonical
 * default. Callers pass the structs explicitly; nothing is global.
 */

#include "ghostmeter/core/types.hpp"

namespace ghostmeter {

/// Run detection and power integration
struct RunDetectionConfig {
    double delta_t_threshold = 0.4;         ///< Minimum supply-return difference (°C)
    double min_supply_temperature = 25.0;   ///< Supply must exceed this to count as running (°C)
    double power_factor = constants::WATER_POWER_FACTOR;  ///< kW per l/min per °C
    int day_minutes = constants::MINUTES_PER_DAY;         ///< Length of the analysed day

    RunDetectionConfig() = default;

    /// Throws std::invalid_argument on inconsistent values
    void validate() const;
};

/// Passive solar gain model
struct SolarModelConfig {
    double window_area_m2 = 12.0;       ///< Glazed area facing the sun
    double g_value = 0.6;               ///< Glazing transmittance
    double hours_per_day = 24.0;        ///< Hours the average irradiance applies to
    double min_shading_factor = 0.15;   ///< Diffuse-light floor of the annual cycle
    int solstice_offset_days = 10;      ///< Shifts the cosine peak to the winter solstice
    int days_per_year = 365;            ///< Period of the annual cycle

    SolarModelConfig() = default;

    void validate() const;
};

/// Coefficient learning
struct CoefficientConfig {
    double default_coefficient = constants::DEFAULT_COEFFICIENT;
    double min_activity_kwh = 0.5;      ///< Both water and electricity must exceed this
    size_t min_valid_days = 3;          ///< Fewer valid days -> default coefficient
    size_t recent_window_days = 7;      ///< Days used by the recency-weighted estimator
    double clamp_min = 0.7;             ///< Safe range of the recency-weighted estimator
    double clamp_max = 1.5;
    double outlier_ratio_min = 0.8;     ///< Per-day ratio band of the outlier-filtered estimator
    double outlier_ratio_max = 2.5;
    int round_decimals = 3;             ///< Rounding of the reported value (< 0 disables)

    CoefficientConfig() = default;

    void validate() const;
};

/// Complete engine configuration
struct EngineConfig {
    RunDetectionConfig run;
    SolarModelConfig solar;
    CoefficientConfig coefficient;

    EngineConfig() = default;

    void validate() const {
        run.validate();
        solar.validate();
        coefficient.validate();
    }
};

} // namespace ghostmeter

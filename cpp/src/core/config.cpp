#include "ghostmeter/core/config.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace ghostmeter {

void RunDetectionConfig::validate() const {
    if (!std::isfinite(delta_t_threshold) || delta_t_threshold < 0.0) {
        throw std::invalid_argument("delta_t_threshold must be >= 0");
    }
    if (!std::isfinite(min_supply_temperature)) {
        throw std::invalid_argument("min_supply_temperature must be finite");
    }
    if (!std::isfinite(power_factor) || power_factor <= 0.0) {
        throw std::invalid_argument("power_factor must be > 0");
    }
    if (day_minutes <= 0) {
        throw std::invalid_argument("day_minutes must be > 0");
    }
}

void SolarModelConfig::validate() const {
    if (window_area_m2 < 0.0 || g_value < 0.0 || hours_per_day < 0.0) {
        throw std::invalid_argument("Solar model area, g-value and hours must be >= 0");
    }
    if (min_shading_factor < 0.0 || min_shading_factor > 1.0) {
        throw std::invalid_argument("min_shading_factor must be within [0, 1]");
    }
    if (days_per_year <= 0) {
        throw std::invalid_argument("days_per_year must be > 0");
    }
}

void CoefficientConfig::validate() const {
    if (!std::isfinite(default_coefficient)) {
        throw std::invalid_argument("default_coefficient must be finite");
    }
    if (min_activity_kwh < 0.0) {
        throw std::invalid_argument("min_activity_kwh must be >= 0");
    }
    if (min_valid_days == 0) {
        throw std::invalid_argument("min_valid_days must be >= 1");
    }
    if (recent_window_days == 0) {
        throw std::invalid_argument("recent_window_days must be >= 1");
    }
    if (clamp_min > clamp_max) {
        throw std::invalid_argument(
            "clamp range is empty: " + std::to_string(clamp_min) +
            " > " + std::to_string(clamp_max));
    }
    if (outlier_ratio_min > outlier_ratio_max) {
        throw std::invalid_argument(
            "outlier band is empty: " + std::to_string(outlier_ratio_min) +
            " > " + std::to_string(outlier_ratio_max));
    }
}

const char* to_string(CoefficientStatus status) {
    switch (status) {
        case CoefficientStatus::COMPUTED:          return "computed";
        case CoefficientStatus::INSUFFICIENT_DATA: return "insufficient_data";
        case CoefficientStatus::DIVISION_BY_ZERO:  return "division_by_zero";
        case CoefficientStatus::ALL_OUTLIERS:      return "all_outliers";
        case CoefficientStatus::ERROR:             return "error";
    }
    return "unknown";
}

} // namespace ghostmeter

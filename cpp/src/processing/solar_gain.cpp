#include "ghostmeter/processing/solar_gain.hpp"
#include "ghostmeter/data/timestamp.hpp"
#include <cmath>

namespace ghostmeter {

namespace {
constexpr double PI = 3.14159265358979323846;
}

double SolarGainModel::shading_factor(int day_of_year, const SolarModelConfig& config) {
    const double phase = 2.0 * PI * (day_of_year + config.solstice_offset_days) /
                         static_cast<double>(config.days_per_year);
    const double cycle = (std::cos(phase) + 1.0) / 2.0;
    return config.min_shading_factor + (1.0 - config.min_shading_factor) * cycle;
}

double SolarGainModel::gain_kwh(double irradiance_w_m2,
                                int day_of_year,
                                const SolarModelConfig& config) {
    return irradiance_w_m2 * config.hours_per_day * config.window_area_m2 *
           config.g_value * shading_factor(day_of_year, config) / 1000.0;
}

double SolarGainModel::estimate(const std::string& date,
                                double irradiance_w_m2,
                                double indoor_temperature,
                                const SolarModelConfig& config) {
    if (!(indoor_temperature > 0.0) || date.empty()) {
        return 0.0;
    }
    return gain_kwh(irradiance_w_m2, timestamp::day_of_year(date), config);
}

} // namespace ghostmeter

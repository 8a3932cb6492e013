#pragma once

#include "ghostmeter/core/config.hpp"
#include <string>

namespace ghostmeter {

/**
 * Passive solar gain model
 *
 * The shading factor follows a cosine over the year, peaking near the
 * winter solstice and floored at min_shading_factor. The gain is a
 * reported value only; it is not fed into the ghost meter.
 */
class SolarGainModel {
public:
    SolarGainModel() = delete;  // Static class, no instances

    /// Shading/efficiency factor in [min_shading_factor, 1]
    static double shading_factor(int day_of_year,
                                 const SolarModelConfig& config = SolarModelConfig());

    /// Daily gain in kWh for an average irradiance (W/m²)
    static double gain_kwh(double irradiance_w_m2,
                           int day_of_year,
                           const SolarModelConfig& config = SolarModelConfig());

    /// Gated estimate: 0 unless indoor_temperature > 0 and a date is given.
    /// Unparseable dates count as day 1.
    static double estimate(const std::string& date,
                           double irradiance_w_m2,
                           double indoor_temperature,
                           const SolarModelConfig& config = SolarModelConfig());
};

} // namespace ghostmeter

#pragma once

#include "ghostmeter/core/types.hpp"

namespace ghostmeter {

/// Simulated cumulative electricity meter of the boiler circuit.
/// new = previous + water_kwh * coefficient, no clamping.
class GhostMeter {
public:
    GhostMeter() = delete;  // Static class, no instances

    static GhostMeterState accumulate(double previous_value,
                                      double water_kwh,
                                      double coefficient);
};

} // namespace ghostmeter

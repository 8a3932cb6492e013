#include "ghostmeter/processing/ghost_meter.hpp"

namespace ghostmeter {

GhostMeterState GhostMeter::accumulate(double previous_value,
                                       double water_kwh,
                                       double coefficient) {
    return GhostMeterState(previous_value, previous_value + water_kwh * coefficient);
}

} // namespace ghostmeter

#pragma once

#include "ghostmeter/core/types.hpp"
#include <vector>

namespace ghostmeter {

/**
 * Energy distributor
 *
 * Splits one aggregate electricity delta across days in proportion to
 * each day's water energy. When no water energy was recorded at all the
 * delta is split evenly. Output order follows input order.
 */
class EnergyDistributor {
public:
    EnergyDistributor() = delete;  // Static class, no instances

    static std::vector<DailyAllocation> distribute(
        double total_electricity_delta,
        const std::vector<DailyWaterLog>& daily_water_logs
    );
};

} // namespace ghostmeter

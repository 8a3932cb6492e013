#include "ghostmeter/processing/energy_distributor.hpp"
#include "ghostmeter/processing/arrow_utils.hpp"
#include <cmath>
#include <stdexcept>

namespace ghostmeter {

std::vector<DailyAllocation> EnergyDistributor::distribute(
    double total_electricity_delta,
    const std::vector<DailyWaterLog>& daily_water_logs
) {
    std::vector<DailyAllocation> results;
    if (daily_water_logs.empty()) {
        return results;
    }
    if (!std::isfinite(total_electricity_delta)) {
        throw std::invalid_argument("total_electricity_delta must be finite");
    }

    std::vector<double> water;
    water.reserve(daily_water_logs.size());
    for (const auto& day : daily_water_logs) {
        if (!std::isfinite(day.water_energy)) {
            throw std::invalid_argument("Non-finite water energy for " + day.date);
        }
        water.push_back(day.water_energy);
    }

    const double total_water = arrow_utils::sum(water);
    results.reserve(daily_water_logs.size());

    if (total_water == 0.0) {
        const double even = total_electricity_delta / static_cast<double>(daily_water_logs.size());
        for (const auto& day : daily_water_logs) {
            results.emplace_back(day.date, even);
        }
        return results;
    }

    for (const auto& day : daily_water_logs) {
        results.emplace_back(day.date, total_electricity_delta * (day.water_energy / total_water));
    }
    return results;
}

} // namespace ghostmeter

#include "ghostmeter/processing/energy_integrator.hpp"
#include "ghostmeter/processing/arrow_utils.hpp"
#include "ghostmeter/processing/resampler.hpp"
#include "ghostmeter/data/timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace ghostmeter {

bool EnergyIntegrator::is_running(const ResampledPoint& point,
                                  const RunDetectionConfig& config) {
    return point.delta_t() > config.delta_t_threshold &&
           point.supply_temperature > config.min_supply_temperature;
}

bool EnergyIntegrator::is_running(const SensorSample& sample,
                                  const RunDetectionConfig& config) {
    return is_running(ResampledPoint(0, sample.timestamp,
                                     sample.supply_temperature,
                                     sample.return_temperature),
                      config);
}

PowerSeries EnergyIntegrator::classify(
    const std::vector<ResampledPoint>& grid,
    double flow_rate,
    const RunDetectionConfig& config
) {
    if (!std::isfinite(flow_rate) || flow_rate < 0.0) {
        throw std::invalid_argument("flow_rate must be a finite value >= 0");
    }

    PowerSeries series;
    series.hours.reserve(grid.size());
    series.power_kw.reserve(grid.size());
    series.running.reserve(grid.size());

    if (grid.empty()) {
        return series;
    }

    const double start = grid.front().timestamp;
    for (const auto& p : grid) {
        const bool running = is_running(p, config);
        series.hours.push_back((p.timestamp - start) / 3600.0);
        series.power_kw.push_back(running ? flow_rate * p.delta_t() * config.power_factor : 0.0);
        series.running.push_back(running);
    }

    return series;
}

double EnergyIntegrator::trapezoid(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("trapezoid: x and y differ in length");
    }
    if (x.size() < 2) {
        return 0.0;
    }

    std::vector<double> areas;
    areas.reserve(x.size() - 1);
    for (size_t i = 1; i < x.size(); ++i) {
        areas.push_back((x[i] - x[i - 1]) * (y[i] + y[i - 1]) * 0.5);
    }
    return arrow_utils::sum(areas);
}

int EnergyIntegrator::count_run_minutes(
    const std::vector<ResampledPoint>& grid,
    const std::vector<bool>& running,
    const std::vector<SensorSample>& samples,
    const RunDetectionConfig& config
) {
    std::unordered_set<int64_t> minutes;
    for (size_t i = 0; i < grid.size() && i < running.size(); ++i) {
        if (running[i]) {
            minutes.insert(timestamp::minute_key(grid[i].timestamp));
        }
    }
    // A minute runs if any raw sample inside it ran, even when the
    // minute's averaged grid value does not
    for (const auto& s : samples) {
        if (is_running(s, config)) {
            minutes.insert(timestamp::minute_key(s.timestamp));
        }
    }
    return static_cast<int>(minutes.size());
}

EnergyResult EnergyIntegrator::integrate(
    const std::vector<ResampledPoint>& grid,
    double flow_rate,
    const RunDetectionConfig& config,
    const std::vector<SensorSample>& samples
) {
    config.validate();

    if (grid.empty()) {
        return EnergyResult::empty(config.day_minutes);
    }

    auto series = classify(grid, flow_rate, config);

    EnergyResult result;
    result.grid_points = grid.size();
    // Power is never negative, so neither is the integral
    result.kwh = std::max(0.0, trapezoid(series.hours, series.power_kw));
    result.run_minutes = std::min(count_run_minutes(grid, series.running, samples, config),
                                  config.day_minutes);
    result.off_minutes = config.day_minutes - result.run_minutes;
    return result;
}

EnergyResult EnergyIntegrator::analyze(
    std::vector<SensorSample> samples,
    double flow_rate,
    const RunDetectionConfig& config
) {
    const auto sorted = Resampler::prepare(std::move(samples));
    return integrate(Resampler::resample(sorted), flow_rate, config, sorted);
}

} // namespace ghostmeter

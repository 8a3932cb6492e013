#include "ghostmeter/core/heating_engine.hpp"
#include "ghostmeter/data/timestamp.hpp"
#include "ghostmeter/processing/coefficient_learner.hpp"
#include "ghostmeter/processing/energy_distributor.hpp"
#include "ghostmeter/processing/energy_integrator.hpp"
#include "ghostmeter/processing/ghost_meter.hpp"
#include "ghostmeter/processing/solar_gain.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ghostmeter {

HeatingEngine::HeatingEngine(const EngineConfig& config)
    : config_(config)
{}

// ============================================================================
// Day analysis
// ============================================================================

DayAnalysisResponse HeatingEngine::analyze_day(const DayAnalysisRequest& request) const {
    const double previous = request.previous_meter_value.value_or(0.0);
    const double coefficient = request.current_coefficient.value_or(
        config_.coefficient.default_coefficient);

    DayAnalysisResponse response;
    response.used_coefficient = coefficient;

    try {
        std::vector<SensorSample> samples;
        samples.reserve(request.samples.size());
        for (const auto& rec : request.samples) {
            samples.emplace_back(timestamp::parse(rec.timestamp), rec.supply_temp, rec.return_temp);
        }

        const auto energy = EnergyIntegrator::analyze(std::move(samples), request.flow_rate, config_.run);
        const auto meter = GhostMeter::accumulate(previous, energy.kwh, coefficient);

        response.kwh = energy.kwh;
        response.run_minutes = energy.run_minutes;
        response.off_minutes = energy.off_minutes;
        response.grid_points = energy.grid_points;
        response.new_meter_value = meter.new_value;
    } catch (const std::exception& e) {
        std::cerr << "[ENGINE] analyze_day failed: " << e.what() << std::endl;
        // Zero energy, whole day off, meter unchanged
        const auto empty = EnergyResult::empty(config_.run.day_minutes);
        response.kwh = empty.kwh;
        response.run_minutes = empty.run_minutes;
        response.off_minutes = empty.off_minutes;
        response.grid_points = 0;
        response.new_meter_value = previous;
        response.error = e.what();
    }

    // Independent of the samples
    try {
        response.solar_gain = SolarGainModel::estimate(
            request.date.value_or(std::string()),
            request.solar_avg.value_or(0.0),
            request.indoor_temperature.value_or(0.0),
            config_.solar);
    } catch (const std::exception& e) {
        std::cerr << "[ENGINE] solar gain failed: " << e.what() << std::endl;
        response.solar_gain = 0.0;
        if (response.ok()) {
            response.error = e.what();
        }
    }

    return response;
}

// ============================================================================
// Coefficient learning
// ============================================================================

CoefficientEstimate HeatingEngine::learn_coefficient(const CoefficientRequest& request) const {
    try {
        return CoefficientLearner::learn(request.history, request.mode,
                                         request.strategy, config_.coefficient);
    } catch (const std::exception& e) {
        std::cerr << "[ENGINE] learn_coefficient failed: " << e.what() << std::endl;
        return CoefficientEstimate::fallback(
            config_.coefficient.default_coefficient,
            CoefficientStatus::ERROR,
            std::string("error: ") + e.what());
    }
}

// ============================================================================
// Distribution
// ============================================================================

DistributionResult HeatingEngine::distribute(const DistributionRequest& request) const {
    DistributionResult result;
    try {
        result.results = EnergyDistributor::distribute(
            request.total_electricity_delta, request.daily_water_logs);
    } catch (const std::exception& e) {
        std::cerr << "[ENGINE] distribute failed: " << e.what() << std::endl;
        result.results.clear();
        result.error = e.what();
    }
    return result;
}

} // namespace ghostmeter

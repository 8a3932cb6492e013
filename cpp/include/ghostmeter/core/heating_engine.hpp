#pragma once

/**
 * @file heating_engine.hpp
 * @brief Request-level API of the ghostmeter engine
 *
 * HeatingEngine is the entry point used by the transport layer. Each
 * operation takes one self-contained request and always returns a
 * well-formed response: internal failures are caught here, logged and
 * turned into the documented default values with an `error` message.
 *
 * Usage:
 * @code
 *   HeatingEngine engine;   // default EngineConfig
 *
 *   DayAnalysisRequest req;
 *   req.samples = {{"2024-01-10 06:00:00", 45.0, 38.0},
 *                  {"2024-01-10 06:30:00", 47.0, 39.5}};
 *   req.flow_rate = 12.0;
 *   req.previous_meter_value = 1520.4;
 *   auto day = engine.analyze_day(req);
 *
 *   CoefficientRequest hist;
 *   hist.history = load_history_somehow();
 *   auto coeff = engine.learn_coefficient(hist);
 * @endcode
 *
 * The engine holds no mutable state and can be shared between threads.
 */

#include "ghostmeter/core/config.hpp"
#include "ghostmeter/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ghostmeter {

/// Sensor sample as delivered by the upstream system
struct SampleRecord {
    std::string timestamp;      ///< ISO-like date/time
    double supply_temp;
    double return_temp;

    SampleRecord() : supply_temp(0.0), return_temp(0.0) {}
    SampleRecord(const std::string& t, double supply, double ret)
        : timestamp(t), supply_temp(supply), return_temp(ret) {}
};

/// One day of sensor data plus context
struct DayAnalysisRequest {
    std::vector<SampleRecord> samples;
    double flow_rate = 0.0;                            ///< l/min, constant for the batch
    std::optional<double> indoor_temperature;
    std::optional<double> solar_avg;                   ///< Average irradiance, W/m²
    std::optional<double> previous_meter_value;
    std::optional<std::string> date;
    std::optional<double> current_coefficient;
};

struct DayAnalysisResponse {
    double kwh = 0.0;
    int run_minutes = 0;
    int off_minutes = 0;
    double new_meter_value = 0.0;
    double solar_gain = 0.0;           ///< Reported only, not part of the meter
    double used_coefficient = 0.0;
    size_t grid_points = 0;
    std::string error;                 ///< Empty on success

    bool ok() const { return error.empty(); }
};

struct CoefficientRequest {
    std::vector<HistoryDayRecord> history;
    HistoryMode mode = HistoryMode::DELTA;
    CoefficientStrategy strategy = CoefficientStrategy::RECENCY_WEIGHTED;
};

struct DistributionRequest {
    double total_electricity_delta = 0.0;
    std::vector<DailyWaterLog> daily_water_logs;
};

struct DistributionResult {
    std::vector<DailyAllocation> results;
    std::string error;

    bool ok() const { return error.empty(); }
};

/**
 * @brief Stateless estimation engine
 */
class HeatingEngine {
public:
    /// Construct with a configuration (copied, never modified)
    explicit HeatingEngine(const EngineConfig& config = EngineConfig());

    /// Energy, run/off minutes, ghost meter and solar gain for one day
    DayAnalysisResponse analyze_day(const DayAnalysisRequest& request) const;

    /// Learn the water-to-electricity coefficient from daily history
    CoefficientEstimate learn_coefficient(const CoefficientRequest& request) const;

    /// Allocate an aggregate electricity delta to days
    DistributionResult distribute(const DistributionRequest& request) const;

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
};

} // namespace ghostmeter

#pragma once

/**
 * @file types.hpp
 * @brief Core data types for the ghostmeter estimation engine
 *
 * Plain value types shared by the processing components, the engine
 * facade and the Python bindings. None of them own external state.
 */

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace ghostmeter {

// ============================================================================
// Sensor Data
// ============================================================================

/**
 * @brief One raw reading from the boiler circuit
 *
 * Timestamps are UTC epoch seconds (see data/timestamp.hpp for parsing).
 */
struct SensorSample {
    double timestamp;             ///< Epoch seconds
    double supply_temperature;    ///< Flow (supply) temperature, °C
    double return_temperature;    ///< Return temperature, °C

    SensorSample()
        : timestamp(0.0), supply_temperature(0.0), return_temperature(0.0) {}

    SensorSample(double t, double supply, double ret)
        : timestamp(t), supply_temperature(supply), return_temperature(ret) {}
};

/**
 * @brief Point on the uniform 1-minute grid produced by the resampler
 */
struct ResampledPoint {
    int64_t minute_offset;        ///< Minutes since the first observed minute
    double timestamp;             ///< Epoch seconds of this grid point
    double supply_temperature;    ///< Interpolated supply temperature
    double return_temperature;    ///< Interpolated return temperature

    ResampledPoint()
        : minute_offset(0), timestamp(0.0)
        , supply_temperature(0.0), return_temperature(0.0) {}

    ResampledPoint(int64_t offset, double t, double supply, double ret)
        : minute_offset(offset), timestamp(t)
        , supply_temperature(supply), return_temperature(ret) {}

    /// Temperature difference floored at zero
    double delta_t() const {
        double d = supply_temperature - return_temperature;
        return d > 0.0 ? d : 0.0;
    }
};

// ============================================================================
// Result Types
// ============================================================================

/**
 * @brief Thermal energy and run/off classification for one batch
 *
 * run_minutes + off_minutes always equals the configured day length.
 */
struct EnergyResult {
    double kwh;              ///< Integrated thermal energy (>= 0)
    int run_minutes;         ///< Calendar minutes with the circuit running
    int off_minutes;         ///< Remaining minutes of the day
    size_t grid_points;      ///< Number of resampled grid points used

    EnergyResult() : kwh(0.0), run_minutes(0), off_minutes(0), grid_points(0) {}

    /// Defined result for an empty or unusable batch
    static EnergyResult empty(int day_minutes) {
        EnergyResult r;
        r.off_minutes = day_minutes;
        return r;
    }
};

/**
 * @brief Simulated electricity meter reading before and after one day
 */
struct GhostMeterState {
    double previous_value;
    double new_value;

    GhostMeterState() : previous_value(0.0), new_value(0.0) {}
    GhostMeterState(double prev, double next) : previous_value(prev), new_value(next) {}

    /// Amount added by this accumulation step
    double increment() const { return new_value - previous_value; }
};

// ============================================================================
// Coefficient Learning
// ============================================================================

/**
 * @brief One day of history supplied by the upstream system
 *
 * In delta mode `electricity` is a cumulative meter reading, in direct
 * mode it is the day's consumption.
 */
struct HistoryDayRecord {
    std::string date;
    double water_energy;     ///< Estimated thermal energy, kWh
    double electricity;      ///< Meter reading or daily usage, kWh

    HistoryDayRecord() : water_energy(0.0), electricity(0.0) {}

    HistoryDayRecord(const std::string& d, double water, double ele)
        : date(d), water_energy(water), electricity(ele) {}
};

/// How the electricity column of a history is interpreted
enum class HistoryMode {
    DELTA,    ///< Cumulative readings, differenced day by day
    DIRECT    ///< Already daily consumption
};

/// Which estimator turns valid days into a coefficient
enum class CoefficientStrategy {
    RECENCY_WEIGHTED,    ///< sum(ele) / sum(water) over the last N days, clamped
    OUTLIER_FILTERED     ///< Water-weighted mean of per-day ratios inside the outlier band
};

/// Outcome tag of a coefficient estimation
enum class CoefficientStatus {
    COMPUTED,
    INSUFFICIENT_DATA,
    DIVISION_BY_ZERO,
    ALL_OUTLIERS,
    ERROR
};

/// Human-readable name of a status tag
const char* to_string(CoefficientStatus status);

/**
 * @brief Learned coefficient plus provenance
 */
struct CoefficientEstimate {
    double value;               ///< Coefficient to use (rounded, within safe range)
    double raw_value;           ///< Unclamped, unrounded estimate (= value on fallback)
    size_t sample_size;         ///< Days that contributed to the estimate
    CoefficientStatus status;
    std::string reason;         ///< Human-readable explanation

    CoefficientEstimate()
        : value(0.0), raw_value(0.0), sample_size(0)
        , status(CoefficientStatus::INSUFFICIENT_DATA) {}

    /// Fallback estimate carrying the default coefficient
    static CoefficientEstimate fallback(double default_value,
                                        CoefficientStatus status,
                                        const std::string& reason) {
        CoefficientEstimate e;
        e.value = default_value;
        e.raw_value = default_value;
        e.status = status;
        e.reason = reason;
        return e;
    }
};

// ============================================================================
// Distribution
// ============================================================================

/// Water energy of one day in a distribution window
struct DailyWaterLog {
    std::string date;
    double water_energy;

    DailyWaterLog() : water_energy(0.0) {}
    DailyWaterLog(const std::string& d, double water) : date(d), water_energy(water) {}
};

/// Electricity allocated to one day
struct DailyAllocation {
    std::string date;
    double allocated_electricity;

    DailyAllocation() : allocated_electricity(0.0) {}
    DailyAllocation(const std::string& d, double share) : date(d), allocated_electricity(share) {}
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    /// Minutes in a calendar day
    constexpr int MINUTES_PER_DAY = 1440;

    /// Seconds between grid points
    constexpr double GRID_STEP_SECONDS = 60.0;

    /// Coefficient used whenever learning is not possible
    constexpr double DEFAULT_COEFFICIENT = 1.157;

    /// kW per (l/min · °C): 4.186 kJ/(kg·K) * 1 kg/l / 60 s
    constexpr double WATER_POWER_FACTOR = 0.0697;
}

} // namespace ghostmeter

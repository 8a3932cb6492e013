#pragma once

#include "ghostmeter/core/config.hpp"
#include "ghostmeter/core/types.hpp"
#include <vector>

namespace ghostmeter {

/// Per-grid-point power classification
struct PowerSeries {
    std::vector<double> hours;      ///< Elapsed hours since first grid point
    std::vector<double> power_kw;   ///< Instantaneous power (0 when not running)
    std::vector<bool> running;      ///< Run state per grid point
};

/**
 * Run classifier and power integrator
 *
 * Derives an instantaneous power signal from the resampled grid and
 * integrates it with the trapezoidal rule.
 */
class EnergyIntegrator {
public:
    EnergyIntegrator() = delete;  // Static class, no instances

    /// Run state of a single point: delta-T and supply must both exceed their thresholds
    static bool is_running(const ResampledPoint& point, const RunDetectionConfig& config);
    static bool is_running(const SensorSample& sample, const RunDetectionConfig& config);

    /// Build the power series. Throws std::invalid_argument for a negative flow rate.
    static PowerSeries classify(
        const std::vector<ResampledPoint>& grid,
        double flow_rate,
        const RunDetectionConfig& config = RunDetectionConfig()
    );

    /// Trapezoidal integral of y over x, 0 for fewer than 2 points
    static double trapezoid(const std::vector<double>& x, const std::vector<double>& y);

    /// Distinct calendar minutes in which any grid point or any raw sample was running
    static int count_run_minutes(
        const std::vector<ResampledPoint>& grid,
        const std::vector<bool>& running,
        const std::vector<SensorSample>& samples = {},
        const RunDetectionConfig& config = RunDetectionConfig()
    );

    /// Full energy figure for a resampled batch.
    /// @param samples Raw samples behind the grid, used for per-minute run state
    static EnergyResult integrate(
        const std::vector<ResampledPoint>& grid,
        double flow_rate,
        const RunDetectionConfig& config = RunDetectionConfig(),
        const std::vector<SensorSample>& samples = {}
    );

    /// Resample raw samples and integrate them
    static EnergyResult analyze(
        std::vector<SensorSample> samples,
        double flow_rate,
        const RunDetectionConfig& config = RunDetectionConfig()
    );
};

} // namespace ghostmeter

#pragma once

#include "ghostmeter/core/types.hpp"
#include <vector>
#include <cstddef>

namespace ghostmeter {

/**
 * Time-series normalizer
 *
 * Turns sparse, irregularly timed sensor samples into a uniform grid on
 * calendar-minute boundaries spanning the first..last observed minute.
 * Samples sharing a minute are averaged; minutes without samples are
 * linearly interpolated; nothing is extrapolated.
 */
class Resampler {
public:
    Resampler() = delete;  // Static class, no instances

    /// Upper bound on grid size (a batch spanning ~2 years)
    static constexpr size_t MAX_GRID_POINTS = 1'000'000;

    /// Stable sort by timestamp.
    /// Throws std::invalid_argument on non-finite values.
    static std::vector<SensorSample> prepare(std::vector<SensorSample> samples);

    /// Average sorted samples per calendar minute; each result is stamped
    /// with the start of its minute
    static std::vector<SensorSample> bucket_minutes(const std::vector<SensorSample>& sorted);

    /// Resample onto the 1-minute grid.
    /// @param samples Samples in any order
    /// @return Grid points, empty for empty input
    static std::vector<ResampledPoint> resample(std::vector<SensorSample> samples);

private:
    /// Linear interpolation between two values
    static double lerp(double left, double right, double weight) {
        return left + weight * (right - left);
    }
};

} // namespace ghostmeter

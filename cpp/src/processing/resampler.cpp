#include "ghostmeter/processing/resampler.hpp"
#include "ghostmeter/data/timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ghostmeter {

std::vector<SensorSample> Resampler::prepare(std::vector<SensorSample> samples) {
    for (const auto& s : samples) {
        if (!std::isfinite(s.timestamp) ||
            !std::isfinite(s.supply_temperature) ||
            !std::isfinite(s.return_temperature)) {
            throw std::invalid_argument("Non-finite value in sensor sample");
        }
    }

    std::stable_sort(samples.begin(), samples.end(),
        [](const SensorSample& a, const SensorSample& b) {
            return a.timestamp < b.timestamp;
        });
    return samples;
}

std::vector<SensorSample> Resampler::bucket_minutes(const std::vector<SensorSample>& sorted) {
    std::vector<SensorSample> out;
    out.reserve(sorted.size());

    size_t i = 0;
    while (i < sorted.size()) {
        const int64_t key = timestamp::minute_key(sorted[i].timestamp);
        size_t j = i;
        double supply_sum = 0.0;
        double return_sum = 0.0;
        while (j < sorted.size() && timestamp::minute_key(sorted[j].timestamp) == key) {
            supply_sum += sorted[j].supply_temperature;
            return_sum += sorted[j].return_temperature;
            ++j;
        }
        const double n = static_cast<double>(j - i);
        out.emplace_back(static_cast<double>(key) * constants::GRID_STEP_SECONDS,
                         supply_sum / n, return_sum / n);
        i = j;
    }

    return out;
}

std::vector<ResampledPoint> Resampler::resample(std::vector<SensorSample> samples) {
    const auto buckets = bucket_minutes(prepare(std::move(samples)));

    std::vector<ResampledPoint> grid;
    if (buckets.empty()) {
        return grid;
    }

    const int64_t first = timestamp::minute_key(buckets.front().timestamp);
    const int64_t last = timestamp::minute_key(buckets.back().timestamp);
    const int64_t count = last - first + 1;
    if (count > static_cast<int64_t>(MAX_GRID_POINTS)) {
        throw std::invalid_argument(
            "Sample span too long for resampling: " + std::to_string(count) + " minutes");
    }
    grid.reserve(static_cast<size_t>(count));

    // Walk the minutes; observed minutes take the bucket mean, gaps are
    // interpolated between the neighbouring observed minutes
    size_t left = 0;
    for (int64_t k = 0; k < count; ++k) {
        const int64_t minute = first + k;
        const double t = static_cast<double>(minute) * constants::GRID_STEP_SECONDS;

        while (left + 1 < buckets.size() &&
               timestamp::minute_key(buckets[left + 1].timestamp) <= minute) {
            ++left;
        }

        const auto& a = buckets[left];
        const int64_t a_minute = timestamp::minute_key(a.timestamp);

        double supply = a.supply_temperature;
        double ret = a.return_temperature;
        if (a_minute != minute && left + 1 < buckets.size()) {
            const auto& b = buckets[left + 1];
            const int64_t b_minute = timestamp::minute_key(b.timestamp);
            const double weight = static_cast<double>(minute - a_minute) /
                                  static_cast<double>(b_minute - a_minute);
            supply = lerp(a.supply_temperature, b.supply_temperature, weight);
            ret = lerp(a.return_temperature, b.return_temperature, weight);
        }

        grid.emplace_back(k, t, supply, ret);
    }

    return grid;
}

} // namespace ghostmeter

#pragma once

#include "ghostmeter/core/config.hpp"
#include "ghostmeter/core/types.hpp"
#include <string>
#include <vector>

namespace ghostmeter {

/// Water energy and electricity used on one day
struct DailyUsage {
    std::string date;
    double water_energy;
    double electricity;

    DailyUsage() : water_energy(0.0), electricity(0.0) {}
    DailyUsage(const std::string& d, double water, double ele)
        : date(d), water_energy(water), electricity(ele) {}

    /// Electricity per unit of water energy
    double ratio() const { return electricity / water_energy; }
};

/**
 * Coefficient learner
 *
 * Converts a history of (water energy, electricity) days into the
 * coefficient used by the ghost meter. Two estimators are offered:
 *
 * - RECENCY_WEIGHTED: sum(electricity) / sum(water) over the most recent
 *   valid days, clamped to [clamp_min, clamp_max].
 * - OUTLIER_FILTERED: water-weighted mean of per-day ratios after
 *   dropping days outside [outlier_ratio_min, outlier_ratio_max]. No clamp.
 *
 * Both fall back to default_coefficient when there is too little data.
 */
class CoefficientLearner {
public:
    CoefficientLearner() = delete;  // Static class, no instances

    /// Sort history by date and derive daily electricity usage.
    /// In DELTA mode the first day's usage is 0.
    /// Throws std::invalid_argument for an unparseable date.
    static std::vector<DailyUsage> daily_usage(
        std::vector<HistoryDayRecord> history,
        HistoryMode mode
    );

    /// Keep days where water and electricity both exceed min_activity_kwh
    static std::vector<DailyUsage> filter_active(
        const std::vector<DailyUsage>& days,
        const CoefficientConfig& config = CoefficientConfig()
    );

    static CoefficientEstimate estimate_recency_weighted(
        const std::vector<DailyUsage>& valid_days,
        const CoefficientConfig& config = CoefficientConfig()
    );

    static CoefficientEstimate estimate_outlier_filtered(
        const std::vector<DailyUsage>& valid_days,
        const CoefficientConfig& config = CoefficientConfig()
    );

    /// Full pipeline: daily usage -> activity filter -> estimator
    static CoefficientEstimate learn(
        std::vector<HistoryDayRecord> history,
        HistoryMode mode = HistoryMode::DELTA,
        CoefficientStrategy strategy = CoefficientStrategy::RECENCY_WEIGHTED,
        const CoefficientConfig& config = CoefficientConfig()
    );

    /// Round to a number of decimals, unchanged when decimals < 0
    static double round_to(double value, int decimals);

private:
    static CoefficientEstimate insufficient(size_t valid, const CoefficientConfig& config);
    static std::string format_reason(size_t days, double raw);
};

} // namespace ghostmeter

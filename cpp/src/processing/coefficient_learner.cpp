#include "ghostmeter/processing/coefficient_learner.hpp"
#include "ghostmeter/processing/arrow_utils.hpp"
#include "ghostmeter/data/timestamp.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace ghostmeter {

std::vector<DailyUsage> CoefficientLearner::daily_usage(
    std::vector<HistoryDayRecord> history,
    HistoryMode mode
) {
    // Sort by parsed date; parse() throws for malformed dates
    std::vector<std::pair<double, size_t>> order;
    order.reserve(history.size());
    for (size_t i = 0; i < history.size(); ++i) {
        order.emplace_back(timestamp::parse(history[i].date), i);
    }
    std::stable_sort(order.begin(), order.end(),
        [](const std::pair<double, size_t>& a, const std::pair<double, size_t>& b) {
            return a.first < b.first;
        });

    std::vector<DailyUsage> days;
    days.reserve(history.size());

    double previous_reading = 0.0;
    for (size_t k = 0; k < order.size(); ++k) {
        auto& rec = history[order[k].second];

        double usage = rec.electricity;
        if (mode == HistoryMode::DELTA) {
            usage = (k == 0) ? 0.0 : rec.electricity - previous_reading;
            previous_reading = rec.electricity;
        }

        days.emplace_back(std::move(rec.date), rec.water_energy, usage);
    }

    return days;
}

std::vector<DailyUsage> CoefficientLearner::filter_active(
    const std::vector<DailyUsage>& days,
    const CoefficientConfig& config
) {
    std::vector<DailyUsage> valid;
    valid.reserve(days.size());
    for (const auto& d : days) {
        if (d.water_energy > config.min_activity_kwh &&
            d.electricity > config.min_activity_kwh) {
            valid.push_back(d);
        }
    }
    return valid;
}

CoefficientEstimate CoefficientLearner::estimate_recency_weighted(
    const std::vector<DailyUsage>& valid_days,
    const CoefficientConfig& config
) {
    if (valid_days.size() < config.min_valid_days) {
        return insufficient(valid_days.size(), config);
    }

    const size_t window = std::min(config.recent_window_days, valid_days.size());
    const size_t first = valid_days.size() - window;

    std::vector<double> water;
    std::vector<double> ele;
    water.reserve(window);
    ele.reserve(window);
    for (size_t i = first; i < valid_days.size(); ++i) {
        water.push_back(valid_days[i].water_energy);
        ele.push_back(valid_days[i].electricity);
    }

    const double sum_water = arrow_utils::sum(water);
    const double sum_ele = arrow_utils::sum(ele);

    if (sum_water == 0.0) {
        auto e = CoefficientEstimate::fallback(
            config.default_coefficient, CoefficientStatus::DIVISION_BY_ZERO, "division by zero");
        e.sample_size = window;
        return e;
    }

    const double raw = sum_ele / sum_water;
    const double clamped = std::clamp(raw, config.clamp_min, config.clamp_max);

    CoefficientEstimate e;
    e.value = round_to(clamped, config.round_decimals);
    e.raw_value = raw;
    e.sample_size = window;
    e.status = CoefficientStatus::COMPUTED;
    e.reason = format_reason(window, raw);
    return e;
}

CoefficientEstimate CoefficientLearner::estimate_outlier_filtered(
    const std::vector<DailyUsage>& valid_days,
    const CoefficientConfig& config
) {
    if (valid_days.size() < config.min_valid_days) {
        return insufficient(valid_days.size(), config);
    }

    std::vector<double> weighted_ratios;
    std::vector<double> weights;
    for (const auto& d : valid_days) {
        if (d.water_energy == 0.0) {
            continue;
        }
        const double r = d.ratio();
        if (r < config.outlier_ratio_min || r > config.outlier_ratio_max) {
            continue;
        }
        weighted_ratios.push_back(r * d.water_energy);
        weights.push_back(d.water_energy);
    }

    if (weights.empty()) {
        return CoefficientEstimate::fallback(
            config.default_coefficient, CoefficientStatus::ALL_OUTLIERS,
            "all days filtered as outliers");
    }

    const double total_weight = arrow_utils::sum(weights);
    if (total_weight == 0.0) {
        auto e = CoefficientEstimate::fallback(
            config.default_coefficient, CoefficientStatus::DIVISION_BY_ZERO, "division by zero");
        e.sample_size = weights.size();
        return e;
    }

    const double raw = arrow_utils::sum(weighted_ratios) / total_weight;

    CoefficientEstimate e;
    e.value = round_to(raw, config.round_decimals);
    e.raw_value = raw;
    e.sample_size = weights.size();
    e.status = CoefficientStatus::COMPUTED;
    e.reason = format_reason(weights.size(), raw);
    return e;
}

CoefficientEstimate CoefficientLearner::learn(
    std::vector<HistoryDayRecord> history,
    HistoryMode mode,
    CoefficientStrategy strategy,
    const CoefficientConfig& config
) {
    config.validate();

    auto valid = filter_active(daily_usage(std::move(history), mode), config);

    switch (strategy) {
        case CoefficientStrategy::OUTLIER_FILTERED:
            return estimate_outlier_filtered(valid, config);
        case CoefficientStrategy::RECENCY_WEIGHTED:
            return estimate_recency_weighted(valid, config);
    }
    throw std::invalid_argument("Unknown coefficient strategy");
}

double CoefficientLearner::round_to(double value, int decimals) {
    if (decimals < 0) {
        return value;
    }
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

CoefficientEstimate CoefficientLearner::insufficient(size_t valid,
                                                     const CoefficientConfig& config) {
    auto e = CoefficientEstimate::fallback(
        config.default_coefficient, CoefficientStatus::INSUFFICIENT_DATA,
        "insufficient data (<" + std::to_string(config.min_valid_days) + " valid days)");
    e.sample_size = valid;
    return e;
}

std::string CoefficientLearner::format_reason(size_t days, double raw) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "computed from %zu days (raw: %.3f)", days, raw);
    return buf;
}

} // namespace ghostmeter

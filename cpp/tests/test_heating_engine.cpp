/*
 * HeatingEngine request-level tests.
 */

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <thread>
#include <vector>

#include "ghostmeter/core/heating_engine.hpp"
#include "ghostmeter/core/version.hpp"

using namespace ghostmeter;

namespace {

DayAnalysisRequest one_hour_run() {
    DayAnalysisRequest req;
    req.samples = {{"2024-12-20 06:00:00", 50.0, 40.0},
                   {"2024-12-20 07:00:00", 50.0, 40.0}};
    req.flow_rate = 10.0;
    return req;
}

} // namespace

TEST(HeatingEngine, EmptyDay)
{
    HeatingEngine engine;
    DayAnalysisRequest req;
    req.previous_meter_value = 250.0;

    auto r = engine.analyze_day(req);
    EXPECT_TRUE(r.ok());
    EXPECT_DOUBLE_EQ(0.0, r.kwh);
    EXPECT_EQ(0, r.run_minutes);
    EXPECT_EQ(1440, r.off_minutes);
    EXPECT_DOUBLE_EQ(250.0, r.new_meter_value);
    EXPECT_DOUBLE_EQ(1.157, r.used_coefficient);
    EXPECT_DOUBLE_EQ(0.0, r.solar_gain);
}

TEST(HeatingEngine, FullDayAnalysis)
{
    HeatingEngine engine;
    auto req = one_hour_run();
    req.previous_meter_value = 100.0;
    req.current_coefficient = 1.2;
    req.date = "2024-12-20";
    req.indoor_temperature = 21.0;
    req.solar_avg = 100.0;

    auto r = engine.analyze_day(req);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_NEAR(6.97, r.kwh, 1e-9);
    EXPECT_EQ(61, r.run_minutes);
    EXPECT_EQ(1379, r.off_minutes);
    EXPECT_EQ(61u, r.grid_points);
    EXPECT_DOUBLE_EQ(1.2, r.used_coefficient);
    // Solar gain is reported but not part of the meter
    EXPECT_NEAR(17.28, r.solar_gain, 1e-9);
    EXPECT_NEAR(100.0 + 6.97 * 1.2, r.new_meter_value, 1e-9);
}

TEST(HeatingEngine, SolarGainNeedsIndoorTemperature)
{
    HeatingEngine engine;
    auto req = one_hour_run();
    req.date = "2024-12-20";
    req.solar_avg = 100.0;

    EXPECT_DOUBLE_EQ(0.0, engine.analyze_day(req).solar_gain);
}

TEST(HeatingEngine, MalformedSamplesDegrade)
{
    HeatingEngine engine;
    auto req = one_hour_run();
    req.samples.push_back({"20.12.2024 08:00", 50.0, 40.0});
    req.previous_meter_value = 42.0;
    req.current_coefficient = 1.1;
    req.date = "2024-12-20";
    req.indoor_temperature = 21.0;
    req.solar_avg = 100.0;

    auto r = engine.analyze_day(req);
    EXPECT_FALSE(r.ok());
    EXPECT_DOUBLE_EQ(0.0, r.kwh);
    EXPECT_EQ(0, r.run_minutes);
    EXPECT_EQ(1440, r.off_minutes);
    EXPECT_DOUBLE_EQ(42.0, r.new_meter_value);
    EXPECT_DOUBLE_EQ(1.1, r.used_coefficient);
    // Solar gain does not depend on the samples
    EXPECT_NEAR(17.28, r.solar_gain, 1e-9);
}

TEST(HeatingEngine, RunningSampleLateInMinute)
{
    HeatingEngine engine;
    DayAnalysisRequest req;
    req.samples = {{"2024-12-20 06:00:05", 10.0, 10.0},
                   {"2024-12-20 06:00:45", 30.0, 29.0}};
    req.flow_rate = 10.0;

    auto r = engine.analyze_day(req);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(1, r.run_minutes);
    EXPECT_EQ(1439, r.off_minutes);
    EXPECT_EQ(1u, r.grid_points);
}

TEST(HeatingEngine, TimestampsWithUtcOffset)
{
    HeatingEngine engine;
    DayAnalysisRequest req;
    req.samples = {{"2024-12-20T06:00:00+01:00", 50.0, 40.0},
                   {"2024-12-20T07:00:00+01:00", 50.0, 40.0}};
    req.flow_rate = 10.0;
    req.date = "2024-12-20T00:00:00+01:00";
    req.indoor_temperature = 21.0;
    req.solar_avg = 100.0;

    auto r = engine.analyze_day(req);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_NEAR(6.97, r.kwh, 1e-9);
    EXPECT_EQ(61, r.run_minutes);
    EXPECT_NEAR(17.28, r.solar_gain, 1e-9);
}

TEST(HeatingEngine, NegativeFlowDegrades)
{
    HeatingEngine engine;
    auto req = one_hour_run();
    req.flow_rate = -3.0;
    auto r = engine.analyze_day(req);
    EXPECT_FALSE(r.ok());
    EXPECT_DOUBLE_EQ(0.0, r.kwh);
}

TEST(HeatingEngine, LearnCoefficient)
{
    HeatingEngine engine;
    CoefficientRequest req;
    req.history = {{"2024-01-01", 5.0, 100.0},
                   {"2024-01-02", 10.0, 110.0},
                   {"2024-01-03", 10.0, 122.0},
                   {"2024-01-04", 10.0, 131.0}};

    auto e = engine.learn_coefficient(req);
    EXPECT_EQ(CoefficientStatus::COMPUTED, e.status);
    EXPECT_NEAR(31.0 / 30.0, e.raw_value, 1e-12);
    EXPECT_NEAR(1.033, e.value, 1e-9);

    req.mode = HistoryMode::DIRECT;
    req.strategy = CoefficientStrategy::OUTLIER_FILTERED;
    req.history = {{"2024-01-01", 10.0, 12.0},
                   {"2024-01-02", 10.0, 12.0},
                   {"2024-01-03", 10.0, 12.0}};
    EXPECT_NEAR(1.2, engine.learn_coefficient(req).value, 1e-9);
}

TEST(HeatingEngine, LearnCoefficientNeverThrows)
{
    HeatingEngine engine;
    CoefficientRequest req;
    req.history = {{"yesterday", 10.0, 12.0}};

    auto e = engine.learn_coefficient(req);
    EXPECT_EQ(CoefficientStatus::ERROR, e.status);
    EXPECT_DOUBLE_EQ(1.157, e.value);
    EXPECT_EQ(0u, e.reason.rfind("error: ", 0));

    EngineConfig config;
    config.coefficient.clamp_min = 5.0;
    HeatingEngine misconfigured(config);
    req.history.clear();
    EXPECT_EQ(CoefficientStatus::ERROR, misconfigured.learn_coefficient(req).status);
}

TEST(HeatingEngine, Distribute)
{
    HeatingEngine engine;
    DistributionRequest req;
    req.total_electricity_delta = 10.0;
    req.daily_water_logs = {{"A", 5.0}, {"B", 5.0}};

    auto r = engine.distribute(req);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(2u, r.results.size());
    EXPECT_EQ("A", r.results[0].date);
    EXPECT_DOUBLE_EQ(5.0, r.results[0].allocated_electricity);
    EXPECT_DOUBLE_EQ(5.0, r.results[1].allocated_electricity);

    req.total_electricity_delta = std::numeric_limits<double>::infinity();
    auto bad = engine.distribute(req);
    EXPECT_FALSE(bad.ok());
    EXPECT_TRUE(bad.results.empty());
}

TEST(HeatingEngine, SharedAcrossThreads)
{
    const HeatingEngine engine;
    const auto req = one_hour_run();
    const double expected = engine.analyze_day(req).kwh;

    std::vector<double> results(4, -1.0);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&, i] {
            results[i] = engine.analyze_day(req).kwh;
        });
    }
    for (auto& t : workers) {
        t.join();
    }
    for (double kwh : results) {
        EXPECT_DOUBLE_EQ(expected, kwh);
    }
}

TEST(Version, StringMatchesComponents)
{
    const std::string expected = std::to_string(Version::MAJOR) + "." +
                                 std::to_string(Version::MINOR) + "." +
                                 std::to_string(Version::PATCH);
    EXPECT_EQ(expected, Version::get_version_string());
}

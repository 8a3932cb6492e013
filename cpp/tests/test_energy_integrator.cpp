/*
 * Run classifier and power integrator tests.
 */

#include <gtest/gtest.h>
#include <random>
#include <stdexcept>
#include <vector>

#include "ghostmeter/processing/energy_integrator.hpp"
#include "ghostmeter/processing/resampler.hpp"

using namespace ghostmeter;

namespace {
const double T0 = 1704866400.0;

ResampledPoint point(double supply, double ret) {
    return ResampledPoint(0, T0, supply, ret);
}
}

TEST(EnergyIntegrator, Trapezoid)
{
    EXPECT_DOUBLE_EQ(3.0, EnergyIntegrator::trapezoid({0.0, 1.0, 2.0}, {0.0, 2.0, 2.0}));
    // Irregular spacing
    EXPECT_DOUBLE_EQ(4.0, EnergyIntegrator::trapezoid({0.0, 0.5, 3.5}, {2.0, 2.0, 0.0}));
    EXPECT_DOUBLE_EQ(0.0, EnergyIntegrator::trapezoid({1.0}, {5.0}));
    EXPECT_DOUBLE_EQ(0.0, EnergyIntegrator::trapezoid({}, {}));
    EXPECT_THROW(EnergyIntegrator::trapezoid({0.0, 1.0}, {1.0}), std::invalid_argument);
}

TEST(EnergyIntegrator, RunThresholdsAreStrict)
{
    RunDetectionConfig config;
    EXPECT_FALSE(EnergyIntegrator::is_running(point(25.0, 20.0), config));   // supply not above 25
    EXPECT_FALSE(EnergyIntegrator::is_running(point(40.0, 39.6), config));   // delta-T 0.4
    EXPECT_TRUE(EnergyIntegrator::is_running(point(25.1, 24.6), config));
    EXPECT_FALSE(EnergyIntegrator::is_running(point(40.0, 45.0), config));   // reversed

    config.min_supply_temperature = 20.0;
    EXPECT_TRUE(EnergyIntegrator::is_running(point(25.0, 20.0), config));
}

TEST(EnergyIntegrator, ConstantRunForOneHour)
{
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0, 50.0, 40.0),
        SensorSample(T0 + 3600.0, 50.0, 40.0),
    }, 10.0);

    // 10 l/min * 10 °C * 0.0697 = 6.97 kW for one hour
    EXPECT_NEAR(6.97, result.kwh, 1e-9);
    EXPECT_EQ(61, result.run_minutes);
    EXPECT_EQ(1440 - 61, result.off_minutes);
    EXPECT_EQ(61u, result.grid_points);
}

TEST(EnergyIntegrator, LinearRampIsIntegratedExactly)
{
    // Delta-T ramps 10 -> 30 °C over an hour; the trapezoid rule is exact for a ramp
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0, 30.0, 20.0),
        SensorSample(T0 + 3600.0, 50.0, 20.0),
    }, 10.0);
    EXPECT_NEAR(10.0 * 20.0 * 0.0697, result.kwh, 1e-9);
}

TEST(EnergyIntegrator, IrregularSamplesUseTrapezoid)
{
    // Hot for the first half hour then cold; the interpolated ramp-down
    // minute contributes half of one minute's power.
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0, 50.0, 40.0),
        SensorSample(T0 + 1800.0, 50.0, 40.0),
        SensorSample(T0 + 1860.0, 20.0, 20.0),
        SensorSample(T0 + 3600.0, 20.0, 20.0),
    }, 10.0);
    const double power = 10.0 * 10.0 * 0.0697;
    EXPECT_NEAR(power * 0.5 + power * (1.0 / 60.0) * 0.5, result.kwh, 1e-9);
    EXPECT_EQ(31, result.run_minutes);
}

TEST(EnergyIntegrator, EmptyBatch)
{
    auto result = EnergyIntegrator::analyze({}, 12.0);
    EXPECT_DOUBLE_EQ(0.0, result.kwh);
    EXPECT_EQ(0, result.run_minutes);
    EXPECT_EQ(1440, result.off_minutes);
    EXPECT_EQ(0u, result.grid_points);
}

TEST(EnergyIntegrator, SinglePointHasNoArea)
{
    auto result = EnergyIntegrator::analyze({SensorSample(T0, 60.0, 40.0)}, 12.0);
    EXPECT_DOUBLE_EQ(0.0, result.kwh);
    EXPECT_EQ(1, result.run_minutes);
    EXPECT_EQ(1439, result.off_minutes);
}

TEST(EnergyIntegrator, ReversedTemperaturesGiveNoEnergy)
{
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0, 40.0, 50.0),
        SensorSample(T0 + 600.0, 41.0, 52.0),
    }, 10.0);
    EXPECT_DOUBLE_EQ(0.0, result.kwh);
    EXPECT_EQ(0, result.run_minutes);
    EXPECT_EQ(1440, result.off_minutes);
}

TEST(EnergyIntegrator, ZeroFlowStillCountsRunMinutes)
{
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0, 50.0, 40.0),
        SensorSample(T0 + 300.0, 50.0, 40.0),
    }, 0.0);
    EXPECT_DOUBLE_EQ(0.0, result.kwh);
    EXPECT_EQ(6, result.run_minutes);
}

TEST(EnergyIntegrator, NegativeFlowRejected)
{
    EXPECT_THROW(EnergyIntegrator::analyze({
        SensorSample(T0, 50.0, 40.0),
        SensorSample(T0 + 300.0, 50.0, 40.0),
    }, -1.0), std::invalid_argument);
}

TEST(EnergyIntegrator, RunMinutesCappedAtDayLength)
{
    RunDetectionConfig config;
    config.day_minutes = 60;
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0, 50.0, 40.0),
        SensorSample(T0 + 7200.0, 50.0, 40.0),
    }, 10.0, config);
    EXPECT_EQ(60, result.run_minutes);
    EXPECT_EQ(0, result.off_minutes);
}

TEST(EnergyIntegrator, RandomBatchesNeverNegative)
{
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> offset(0.0, 86399.0);
    std::uniform_real_distribution<double> temp(5.0, 80.0);
    std::uniform_real_distribution<double> flow(0.0, 30.0);
    std::uniform_int_distribution<int> count(0, 40);

    for (int trial = 0; trial < 200; ++trial) {
        std::vector<SensorSample> samples;
        const int n = count(rng);
        for (int i = 0; i < n; ++i) {
            samples.emplace_back(T0 + offset(rng), temp(rng), temp(rng));
        }
        auto result = EnergyIntegrator::analyze(samples, flow(rng));
        EXPECT_GE(result.kwh, 0.0);
        EXPECT_GE(result.run_minutes, 0);
        EXPECT_GE(result.off_minutes, 0);
        EXPECT_EQ(1440, result.run_minutes + result.off_minutes);
    }
}

TEST(EnergyIntegrator, RunningSampleInsideMinuteCountsThatMinute)
{
    // The minute's average (20 / 19.5) is below the supply threshold,
    // but the second sample on its own is running
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0 + 5.0, 10.0, 10.0),
        SensorSample(T0 + 45.0, 30.0, 29.0),
    }, 10.0);
    EXPECT_EQ(1u, result.grid_points);
    EXPECT_EQ(1, result.run_minutes);
    EXPECT_EQ(1439, result.off_minutes);

    const auto sorted = Resampler::prepare({
        SensorSample(T0 + 5.0, 10.0, 10.0),
        SensorSample(T0 + 45.0, 30.0, 29.0),
    });
    const auto grid = Resampler::resample(sorted);
    auto series = EnergyIntegrator::classify(grid, 10.0);
    EXPECT_FALSE(series.running[0]);
    EXPECT_EQ(0, EnergyIntegrator::count_run_minutes(grid, series.running));
    EXPECT_EQ(1, EnergyIntegrator::count_run_minutes(grid, series.running, sorted));
}

TEST(EnergyIntegrator, LateSampleInLastMinuteIsIntegrated)
{
    // 06:00:00 .. 06:01:59 spans two grid minutes
    auto result = EnergyIntegrator::analyze({
        SensorSample(T0, 50.0, 40.0),
        SensorSample(T0 + 119.0, 50.0, 40.0),
    }, 10.0);
    EXPECT_EQ(2u, result.grid_points);
    EXPECT_NEAR(10.0 * 10.0 * 0.0697 / 60.0, result.kwh, 1e-9);
    EXPECT_EQ(2, result.run_minutes);
}

/*
 * Passive solar gain model tests.
 */

#include <gtest/gtest.h>

#include "ghostmeter/processing/solar_gain.hpp"

using namespace ghostmeter;

TEST(SolarGain, PeaksAtWinterSolstice)
{
    // day 355 + 10 day offset = one full period
    EXPECT_NEAR(1.0, SolarGainModel::shading_factor(355), 1e-12);
    EXPECT_NEAR(0.15, SolarGainModel::shading_factor(172), 1e-3);
    EXPECT_GT(SolarGainModel::shading_factor(1), SolarGainModel::shading_factor(100));
}

TEST(SolarGain, FactorIsPeriodicAndBounded)
{
    for (int day = -1000; day <= 1000; ++day) {
        const double f = SolarGainModel::shading_factor(day);
        EXPECT_GE(f, 0.15 - 1e-12) << " day " << day;
        EXPECT_LE(f, 1.0 + 1e-12) << " day " << day;
        EXPECT_NEAR(f, SolarGainModel::shading_factor(day + 365), 1e-9) << " day " << day;
    }
}

TEST(SolarGain, GainFormula)
{
    // 100 W/m² * 24 h * 12 m² * 0.6 * 1.0 / 1000
    EXPECT_NEAR(17.28, SolarGainModel::gain_kwh(100.0, 355), 1e-9);
    EXPECT_DOUBLE_EQ(0.0, SolarGainModel::gain_kwh(0.0, 355));

    SolarModelConfig config;
    config.window_area_m2 = 6.0;
    EXPECT_NEAR(8.64, SolarGainModel::gain_kwh(100.0, 355, config), 1e-9);
}

TEST(SolarGain, EstimateIsGated)
{
    EXPECT_NEAR(17.28, SolarGainModel::estimate("2024-12-20", 100.0, 21.0), 1e-9);
    EXPECT_DOUBLE_EQ(0.0, SolarGainModel::estimate("2024-12-20", 100.0, 0.0));
    EXPECT_DOUBLE_EQ(0.0, SolarGainModel::estimate("2024-12-20", 100.0, -3.0));
    EXPECT_DOUBLE_EQ(0.0, SolarGainModel::estimate("", 100.0, 21.0));
}

TEST(SolarGain, UnparseableDateCountsAsDayOne)
{
    EXPECT_DOUBLE_EQ(SolarGainModel::gain_kwh(150.0, 1),
                     SolarGainModel::estimate("yesterday", 150.0, 20.0));
}

/*
 * Unit tests for the LO offset planner
 * Direct range, increment selection, command text and the uncovered gap
 * just above 1.3 GHz
 */

#include <gtest/gtest.h>
#include <cmath>
#include "FrequencyPlanner.h"

constexpr double TOL = 1e-9;

// ============================================================================
// Test Suite: FrequencyPlannerDirect
// ============================================================================

TEST(FrequencyPlannerDirect, LowEdgeDisablesLo) {
    FrequencyPlan plan = FrequencyPlanner::plan(0.00015);
    ASSERT_TRUE(plan.ok());
    EXPECT_FALSE(plan.loEnabled);
    EXPECT_EQ(plan.measurementCommands, QStringList({ "27.3SP0MZ" }));
    EXPECT_EQ(plan.sourceCommands, QStringList({ "FR3GZLE-70DM" }));
}

TEST(FrequencyPlannerDirect, DirectLimitIsInclusive) {
    FrequencyPlan plan = FrequencyPlanner::plan(1.3);
    ASSERT_TRUE(plan.ok());
    EXPECT_FALSE(plan.loEnabled);
    EXPECT_DOUBLE_EQ(plan.sourceFrequencyGHz, 3.0);
    EXPECT_DOUBLE_EQ(plan.sourceLevelDbm, -70.0);
    EXPECT_DOUBLE_EQ(plan.incrementGHz, 0.0);
}

TEST(FrequencyPlannerDirect, WholeDirectRangeUsesReferenceSetting) {
    for (double f = 0.00015; f <= 1.3; f += 0.0125) {
        FrequencyPlan plan = FrequencyPlanner::plan(f);
        ASSERT_TRUE(plan.ok()) << "f = " << f;
        EXPECT_FALSE(plan.loEnabled) << "f = " << f;
        EXPECT_EQ(plan.sourceCommands, QStringList({ "FR3GZLE-70DM" })) << "f = " << f;
    }
}

// ============================================================================
// Test Suite: FrequencyPlannerOffset
// ============================================================================

TEST(FrequencyPlannerOffset, TwoPointFiveTakesSmallestIncrement) {
    FrequencyPlan plan = FrequencyPlanner::plan(2.5);
    ASSERT_TRUE(plan.ok());
    EXPECT_TRUE(plan.loEnabled);
    EXPECT_DOUBLE_EQ(plan.incrementGHz, 0.12053);
    EXPECT_NEAR(plan.loFrequencyMHz, 2620.53, TOL);
    EXPECT_NEAR(plan.sourceFrequencyGHz, 2.62053, TOL);
    EXPECT_DOUBLE_EQ(plan.sourceLevelDbm, 8.0);
    EXPECT_EQ(plan.measurementCommands, QStringList({ "27.3SP2620.53MZ" }));
    EXPECT_EQ(plan.sourceCommands, QStringList({ "FR2.62053GZ", "LE8DM" }));
}

TEST(FrequencyPlannerOffset, OnePointFiveSkipsIncrementsThatFallShort) {
    // 1.5 + 0.48053 = 1.98053 is not above 2.0
    FrequencyPlan plan = FrequencyPlanner::plan(1.5);
    ASSERT_TRUE(plan.ok());
    EXPECT_DOUBLE_EQ(plan.incrementGHz, 0.60053);
    EXPECT_EQ(plan.measurementCommands, QStringList({ "27.3SP2100.53MZ" }));
    EXPECT_EQ(plan.sourceCommands, QStringList({ "FR2.10053GZ", "LE8DM" }));
}

TEST(FrequencyPlannerOffset, OnePointEightUsesSecondIncrement) {
    FrequencyPlan plan = FrequencyPlanner::plan(1.8);
    ASSERT_TRUE(plan.ok());
    EXPECT_DOUBLE_EQ(plan.incrementGHz, 0.24053);
    EXPECT_EQ(plan.measurementCommands, QStringList({ "27.3SP2040.53MZ" }));
}

TEST(FrequencyPlannerOffset, JustAboveGapUsesLargestIncrement) {
    FrequencyPlan plan = FrequencyPlanner::plan(1.32);
    ASSERT_TRUE(plan.ok());
    EXPECT_DOUBLE_EQ(plan.incrementGHz, 0.68053);
    EXPECT_EQ(plan.sourceCommands.first(), QString("FR2.00053GZ"));
}

TEST(FrequencyPlannerOffset, TopOfRange) {
    FrequencyPlan plan = FrequencyPlanner::plan(18.0);
    ASSERT_TRUE(plan.ok());
    EXPECT_DOUBLE_EQ(plan.incrementGHz, 0.12053);
    EXPECT_EQ(plan.measurementCommands, QStringList({ "27.3SP18120.53MZ" }));
    EXPECT_EQ(plan.sourceCommands, QStringList({ "FR18.12053GZ", "LE8DM" }));
}

TEST(FrequencyPlannerOffset, ChosenIncrementIsFirstThatClearsFloor) {
    const QVector<double> &incs = FrequencyPlanner::increments();
    for (double f = 1.32; f <= 18.0; f += 0.0371) {
        FrequencyPlan plan = FrequencyPlanner::plan(f);
        ASSERT_TRUE(plan.ok()) << "f = " << f;
        EXPECT_GT(f + plan.incrementGHz, 2.0) << "f = " << f;
        for (double inc : incs) {
            if (inc >= plan.incrementGHz) break;
            EXPECT_LE(f + inc, 2.0) << "f = " << f << " skipped " << inc;
        }
        EXPECT_NEAR(plan.loFrequencyMHz, (f + plan.incrementGHz) * 1000, TOL) << "f = " << f;
        EXPECT_NEAR(plan.sourceFrequencyGHz, f + plan.incrementGHz, TOL) << "f = " << f;
    }
}

// ============================================================================
// Test Suite: FrequencyPlannerInvalid
// ============================================================================

TEST(FrequencyPlannerInvalid, BelowDomain) {
    FrequencyPlan plan = FrequencyPlanner::plan(0.0001);
    EXPECT_EQ(plan.error, RigError::InvalidFrequency);
    EXPECT_TRUE(plan.measurementCommands.isEmpty());
    EXPECT_TRUE(plan.sourceCommands.isEmpty());
}

TEST(FrequencyPlannerInvalid, AboveDomain) {
    EXPECT_EQ(FrequencyPlanner::plan(18.0001).error, RigError::InvalidFrequency);
}

TEST(FrequencyPlannerInvalid, NotANumber) {
    EXPECT_EQ(FrequencyPlanner::plan(std::nan("")).error, RigError::InvalidFrequency);
}

TEST(FrequencyPlannerInvalid, GapAboveDirectLimitHasNoIncrement) {
    // 1.31 + 0.68053 = 1.99053, no increment clears 2.0
    for (double f : { 1.3000001, 1.31, 1.319 }) {
        FrequencyPlan plan = FrequencyPlanner::plan(f);
        EXPECT_EQ(plan.error, RigError::InvalidFrequency) << "f = " << f;
        EXPECT_FALSE(plan.loEnabled);
        EXPECT_TRUE(plan.measurementCommands.isEmpty());
        EXPECT_TRUE(plan.sourceCommands.isEmpty());
        EXPECT_FALSE(plan.message.isEmpty());
    }
}

// ============================================================================
// Test Suite: FrequencyPlannerFormat
// ============================================================================

TEST(FrequencyPlannerFormat, DropsTrailingZeros) {
    EXPECT_EQ(FrequencyPlanner::formatNumber(3.0), QString("3"));
    EXPECT_EQ(FrequencyPlanner::formatNumber(2620.53), QString("2620.53"));
    EXPECT_EQ(FrequencyPlanner::formatNumber(10120.53), QString("10120.53"));
}

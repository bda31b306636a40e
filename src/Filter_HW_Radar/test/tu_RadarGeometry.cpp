// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarGeometry.h"
#include <gtest/gtest.h>

namespace {

    const double SURFACE_RADIUS = 150.;
    const double MAX_RANGE = 200.;
    const double SPEED = 300000.;
    const double TOLERANCE = 1e-9;

    SRadarScan make_scan(int _angle, std::vector<SRadarEcho> _echoes)
    {
        SRadarScan scan;
        scan.scanAngleDegrees = _angle;
        scan.pulseDurationMicroseconds = 10;
        scan.echoes = std::move(_echoes);
        return scan;
    }

}

TEST(CRadarGeometry, FirstEchoAtZeroDegrees)
{
    const SRadarScan scan = make_scan(0, { { 0.001, 0.5 } });

    EXPECT_NEAR(CRadarGeometry::oneWayDistance(0.001, SPEED), 150., TOLERANCE);
    EXPECT_NEAR(CRadarGeometry::rangeFraction(150., MAX_RANGE), 0.75, TOLERANCE);

    SRadarPosition pos;
    ASSERT_TRUE(CRadarGeometry::computePosition(scan, SURFACE_RADIUS, MAX_RANGE, SPEED, pos));
    EXPECT_NEAR(pos.x, 262.5, TOLERANCE);
    EXPECT_NEAR(pos.y, 150., TOLERANCE);
}

TEST(CRadarGeometry, QuarterTurns)
{
    SRadarPosition pos;

    ASSERT_TRUE(CRadarGeometry::computePosition(make_scan(90, { { 0.001, 0.5 } }), SURFACE_RADIUS, MAX_RANGE, SPEED, pos));
    EXPECT_NEAR(pos.x, 150., 1e-6);
    EXPECT_NEAR(pos.y, 262.5, 1e-6);

    ASSERT_TRUE(CRadarGeometry::computePosition(make_scan(180, { { 0.001, 0.5 } }), SURFACE_RADIUS, MAX_RANGE, SPEED, pos));
    EXPECT_NEAR(pos.x, 37.5, 1e-6);
    EXPECT_NEAR(pos.y, 150., 1e-6);

    ASSERT_TRUE(CRadarGeometry::computePosition(make_scan(270, { { 0.001, 0.5 } }), SURFACE_RADIUS, MAX_RANGE, SPEED, pos));
    EXPECT_NEAR(pos.x, 150., 1e-6);
    EXPECT_NEAR(pos.y, 37.5, 1e-6);
}

TEST(CRadarGeometry, NoEchoNoPosition)
{
    SRadarPosition pos;
    pos.x = -1.;
    pos.y = -1.;

    EXPECT_FALSE(CRadarGeometry::computePosition(make_scan(90, {}), SURFACE_RADIUS, MAX_RANGE, SPEED, pos));
    EXPECT_DOUBLE_EQ(pos.x, -1.);
    EXPECT_DOUBLE_EQ(pos.y, -1.);
}

TEST(CRadarGeometry, OnlyTheFirstEchoIsUsed)
{
    SRadarPosition first_only;
    SRadarPosition with_more;

    ASSERT_TRUE(CRadarGeometry::computePosition(make_scan(30, { { 0.0005, 0.9 } }), SURFACE_RADIUS, MAX_RANGE, SPEED, first_only));
    ASSERT_TRUE(CRadarGeometry::computePosition(make_scan(30, { { 0.0005, 0.9 }, { 0.0001, 1. }, { 0.0012, 0.2 } }),
        SURFACE_RADIUS, MAX_RANGE, SPEED, with_more));

    EXPECT_DOUBLE_EQ(first_only.x, with_more.x);
    EXPECT_DOUBLE_EQ(first_only.y, with_more.y);
}

TEST(CRadarGeometry, EchoBeyondMaxRangeIsNotClamped)
{
    // 0.002 s -> 300 units -> 1.5 of the displayed range
    SRadarPosition pos;
    ASSERT_TRUE(CRadarGeometry::computePosition(make_scan(0, { { 0.002, 0.5 } }), SURFACE_RADIUS, MAX_RANGE, SPEED, pos));
    EXPECT_NEAR(pos.x, 1.5 * SURFACE_RADIUS + SURFACE_RADIUS, TOLERANCE);
    EXPECT_NEAR(pos.y, SURFACE_RADIUS, TOLERANCE);
}

TEST(CRadarGeometry, ZeroRoundTripIsTheCenter)
{
    SRadarPosition pos;
    ASSERT_TRUE(CRadarGeometry::computePosition(make_scan(123, { { 0., 0.5 } }), SURFACE_RADIUS, MAX_RANGE, SPEED, pos));
    EXPECT_NEAR(pos.x, SURFACE_RADIUS, TOLERANCE);
    EXPECT_NEAR(pos.y, SURFACE_RADIUS, TOLERANCE);
}

TEST(CRadarGeometry, SameInputSameOutput)
{
    const SRadarScan scan = make_scan(217, { { 0.00077, 0.3 } });

    SRadarPosition a;
    SRadarPosition b;
    ASSERT_TRUE(CRadarGeometry::computePosition(scan, SURFACE_RADIUS, MAX_RANGE, SPEED, a));
    ASSERT_TRUE(CRadarGeometry::computePosition(scan, SURFACE_RADIUS, MAX_RANGE, SPEED, b));

    EXPECT_EQ(a.x, b.x);
    EXPECT_EQ(a.y, b.y);
}

TEST(CRadarGeometry, EveryEchoingScanIsProjected)
{
    for (int angle = 0; angle < 360; angle += 15)
    {
        SRadarPosition pos;
        EXPECT_TRUE(CRadarGeometry::computePosition(make_scan(angle, { { 0.0004, 0.5 } }), SURFACE_RADIUS, MAX_RANGE, SPEED, pos))
            << "angle " << angle;
        EXPECT_FALSE(CRadarGeometry::computePosition(make_scan(angle, {}), SURFACE_RADIUS, MAX_RANGE, SPEED, pos))
            << "angle " << angle;
    }
}

// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarViewer.h"
#include <gtest/gtest.h>
#include <limits>

namespace {

    bool is_target_red(const cv::Mat& _canvas, int _x, int _y)
    {
        const cv::Vec3b& px = _canvas.at<cv::Vec3b>(_y, _x);
        return px[0] == 0 && px[1] == 0 && px[2] == 255;
    }

    int count_target_pixels(const cv::Mat& _canvas)
    {
        cv::Mat mask;
        cv::inRange(_canvas, cv::Scalar(0, 0, 255), cv::Scalar(0, 0, 255), mask);
        return cv::countNonZero(mask);
    }

}

TEST(CRadarViewer, CanvasCoversTheSurface)
{
    CRadarViewer viewer(150.);
    const cv::Mat& canvas = viewer.render();

    EXPECT_EQ(canvas.cols, 300);
    EXPECT_EQ(canvas.rows, 300);
    EXPECT_EQ(canvas.type(), CV_8UC3);
}

TEST(CRadarViewer, TargetIsDrawnAtItsPosition)
{
    CRadarViewer viewer(150.);
    viewer.onConnectivityChanged(ERadarConnectivity::Connected);

    EXPECT_FALSE(viewer.isDotVisible());
    EXPECT_FALSE(is_target_red(viewer.render(), 262, 150));

    SRadarPosition pos;
    pos.x = 262.5;
    pos.y = 150.;
    viewer.onScanUpdate(0, &pos);

    EXPECT_TRUE(viewer.isDotVisible());
    EXPECT_EQ(viewer.getAngle(), 0);
    EXPECT_TRUE(is_target_red(viewer.render(), 262, 150));
}

TEST(CRadarViewer, TargetStaysUntilReplaced)
{
    CRadarViewer viewer(150.);

    SRadarPosition pos;
    pos.x = 262.5;
    pos.y = 150.;
    viewer.onScanUpdate(0, &pos);

    // Sweep without echo: beam moves, dot stays
    viewer.onScanUpdate(90, nullptr);
    EXPECT_EQ(viewer.getAngle(), 90);
    EXPECT_TRUE(viewer.isDotVisible());
    EXPECT_DOUBLE_EQ(viewer.getDotPosition().x, 262.5);
    EXPECT_TRUE(is_target_red(viewer.render(), 262, 150));

    SRadarPosition moved;
    moved.x = 150.;
    moved.y = 37.5;
    viewer.onScanUpdate(270, &moved);

    const cv::Mat& canvas = viewer.render();
    EXPECT_TRUE(is_target_red(canvas, 150, 37));
    EXPECT_FALSE(is_target_red(canvas, 262, 150));
}

TEST(CRadarViewer, OutlineFollowsConnectivity)
{
    CRadarViewer viewer(150.);
    EXPECT_EQ(viewer.getState(), ERadarConnectivity::Disconnected);

    // Beam pointing left, away from the top of the outline
    viewer.onScanUpdate(180, nullptr);

    viewer.onConnectivityChanged(ERadarConnectivity::Connected);
    EXPECT_EQ(viewer.getState(), ERadarConnectivity::Connected);
    {
        const cv::Vec3b px = viewer.render().at<cv::Vec3b>(10, 150);
        EXPECT_GT(px[1], 60);
        EXPECT_EQ(px[0], 0);
        EXPECT_EQ(px[2], 0);
    }

    viewer.onConnectivityChanged(ERadarConnectivity::Disconnected);
    {
        const cv::Vec3b px = viewer.render().at<cv::Vec3b>(10, 150);
        EXPECT_GT(px[1], 30);
        EXPECT_EQ(px[0], px[1]);
        EXPECT_EQ(px[1], px[2]);
    }
}

TEST(CRadarViewer, FarAwayTargetIsNotDrawn)
{
    CRadarViewer viewer(150.);
    viewer.onConnectivityChanged(ERadarConnectivity::Connected);

    // 1e300 s round trip, accepted by the decoder and projected unclamped
    SRadarPosition far_away;
    far_away.x = 7.5e305;
    far_away.y = 150.;
    viewer.onScanUpdate(0, &far_away);

    EXPECT_TRUE(viewer.isDotVisible());
    EXPECT_EQ(count_target_pixels(viewer.render()), 0);

    SRadarPosition not_a_number;
    not_a_number.x = 150.;
    not_a_number.y = std::numeric_limits<double>::quiet_NaN();
    viewer.onScanUpdate(0, &not_a_number);
    EXPECT_EQ(count_target_pixels(viewer.render()), 0);

    SRadarPosition below;
    below.x = -1e12;
    below.y = -1e12;
    viewer.onScanUpdate(0, &below);
    EXPECT_EQ(count_target_pixels(viewer.render()), 0);
}

TEST(CRadarViewer, TargetOnTheEdgeIsClipped)
{
    CRadarViewer viewer(150.);

    SRadarPosition edge;
    edge.x = 301.;
    edge.y = 150.;
    viewer.onScanUpdate(0, &edge);

    const cv::Mat& canvas = viewer.render();
    EXPECT_TRUE(is_target_red(canvas, 299, 150));
    EXPECT_GT(count_target_pixels(canvas), 0);
}

// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarViewer.h"
#include <opencv2/imgproc.hpp>
#include <cmath>

namespace {

    const cv::Scalar COLOR_BACKGROUND(0, 0, 0);
    const cv::Scalar COLOR_SCOPE(0, 255, 0);
    const cv::Scalar COLOR_OFFLINE(128, 128, 128);
    const cv::Scalar COLOR_TARGET(0, 0, 255);

    // Layout of the reference 300 x 300 scope, scaled with the surface radius
    const double SCOPE_MARGIN = 10. / 150.;
    const double RING_STEP = 70. / 150.;
    const double BEAM_LENGTH = 200. / 150.;
    const double BEAM_WIDTH = 4.;
    const double BEAM_OPACITY = 100. / 255.;
    const int    TARGET_RADIUS = 3;

    bool is_on_canvas(double _coordinate, int _size)
    {
        return std::isfinite(_coordinate)
            && _coordinate > -(TARGET_RADIUS + 1.)
            && _coordinate < _size + TARGET_RADIUS + 1.;
    }

}

CRadarViewer::CRadarViewer(double _surface_radius) :
    m_Radius(_surface_radius)
{
    const int side = static_cast<int>(std::lround(2. * m_Radius));
    m_Canvas = cv::Mat(side, side, CV_8UC3, COLOR_BACKGROUND);
}

void CRadarViewer::onConnectivityChanged(ERadarConnectivity _state)
{
    m_State = _state;
}

void CRadarViewer::onScanUpdate(int _angle_degrees, const SRadarPosition* _position)
{
    m_Angle = _angle_degrees;

    if (_position != nullptr)
    {
        m_DotPosition = *_position;
        m_bDotVisible = true;
    }
}

const cv::Mat& CRadarViewer::render()
{
    m_Canvas.setTo(COLOR_BACKGROUND);

    const cv::Point center(static_cast<int>(m_Radius), static_cast<int>(m_Radius));
    const cv::Scalar outline = (m_State == ERadarConnectivity::Connected) ? COLOR_SCOPE : COLOR_OFFLINE;

    // Scope background and range rings
    cv::circle(m_Canvas, center, static_cast<int>(std::lround(m_Radius * (1. - SCOPE_MARGIN))), outline, 1, cv::LINE_AA);
    for (int i = 1; i <= 3; ++i)
        cv::circle(m_Canvas, center, static_cast<int>(std::lround(i * RING_STEP * m_Radius)), outline, 1, cv::LINE_AA);

    // Beam: rectangle along the local x axis, rotated by the scan angle
    const double a = m_Angle * RADAR_DEG2RAD;
    const double c = std::cos(a);
    const double s = std::sin(a);
    const double local[4][2] = {
        { -2., 0. },
        { BEAM_LENGTH * m_Radius - 2., 0. },
        { BEAM_LENGTH * m_Radius - 2., BEAM_WIDTH },
        { -2., BEAM_WIDTH } };

    std::vector<cv::Point> beam;
    for (const auto& p : local)
    {
        beam.emplace_back(static_cast<int>(std::lround(center.x + p[0] * c - p[1] * s)),
            static_cast<int>(std::lround(center.y + p[0] * s + p[1] * c)));
    }

    cv::Mat overlay = m_Canvas.clone();
    cv::fillConvexPoly(overlay, beam, outline, cv::LINE_AA);
    cv::addWeighted(overlay, BEAM_OPACITY, m_Canvas, 1. - BEAM_OPACITY, 0., m_Canvas);

    // Positions are not clamped: a dot partly off the canvas is clipped, one that can't touch it is skipped
    if (m_bDotVisible && is_on_canvas(m_DotPosition.x, m_Canvas.cols) && is_on_canvas(m_DotPosition.y, m_Canvas.rows))
    {
        const cv::Point dot(static_cast<int>(m_DotPosition.x), static_cast<int>(m_DotPosition.y));
        cv::circle(m_Canvas, dot, TARGET_RADIUS, COLOR_TARGET, cv::FILLED);
    }

    if (m_State != ERadarConnectivity::Connected)
    {
        const std::string caption = (m_State == ERadarConnectivity::Connecting) ? "CONNECTING" : "DISCONNECTED";
        cv::putText(m_Canvas, caption, cv::Point(8, m_Canvas.rows - 8), cv::FONT_HERSHEY_SIMPLEX, 0.4, COLOR_OFFLINE, 1, cv::LINE_AA);
    }

    return m_Canvas;
}

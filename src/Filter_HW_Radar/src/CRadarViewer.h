// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_VIEWER_H_
#define CRADAR_VIEWER_H_

#include "CRadarDisplayPort.h"
#include <opencv2/core.hpp>

/*
 * Radar scope drawn with OpenCV on a square canvas of side 2 * surface_radius:
 * background disc, three range rings, the beam at the last scan angle and a dot
 * at the last target position. The dot stays on screen until a newer target
 * replaces it. The outline turns gray while the sensor is not connected.
 */
class CRadarViewer : public CRadarDisplayPort
{
public:
    explicit CRadarViewer(double _surface_radius);
    ~CRadarViewer() override = default;

    void onConnectivityChanged(ERadarConnectivity _state) override;
    void onScanUpdate(int _angle_degrees, const SRadarPosition* _position) override;

    const cv::Mat& render();

    ERadarConnectivity getState() const { return m_State; }
    int getAngle() const { return m_Angle; }
    bool isDotVisible() const { return m_bDotVisible; }
    const SRadarPosition& getDotPosition() const { return m_DotPosition; }

private:
    const double        m_Radius;
    cv::Mat             m_Canvas;

    ERadarConnectivity  m_State = ERadarConnectivity::Disconnected;
    int                 m_Angle = 0;
    bool                m_bDotVisible = false;
    SRadarPosition      m_DotPosition;
};

#endif // CRADAR_VIEWER_H_

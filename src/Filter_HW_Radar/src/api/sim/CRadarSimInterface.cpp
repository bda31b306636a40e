// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarSimInterface.h"
#include "CRadarDecoder.h"
#include <spdlog/spdlog.h>
#include <cstdlib>

CRadarSimInterface::CRadarSimInterface(double _period_seconds,
    int _angle_step,
    double _range_fraction,
    double _max_range_units,
    double _propagation_speed) :
    m_Period(toWaitDuration(_period_seconds)),
    m_AngleStep((_angle_step % 360 + 360) % 360),
    // Round trip of an echo placed at _range_fraction of the displayed range
    m_EchoRoundTrip(2. * _range_fraction * _max_range_units / _propagation_speed)
{
}

ERadarConnectionError CRadarSimInterface::connect(const std::string& _address)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_bCancelled)
        return ERadarConnectionError::Closed;

    spdlog::info("CRadarSimInterface: Simulated sensor attached (address {} ignored)", _address);
    m_IsConnected = true;
    return ERadarConnectionError::None;
}

ERadarConnectionError CRadarSimInterface::receive(std::string& _out_message)
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_IsConnected)
            return ERadarConnectionError::Closed;

        // Pace the sweep
        if (m_cv.wait_for(lock, m_Period, [this] { return m_bCancelled; }))
            return ERadarConnectionError::Closed;
    }

    _out_message = CRadarDecoder::encode(step());
    return ERadarConnectionError::None;
}

SRadarScan CRadarSimInterface::step()
{
    SRadarScan scan;
    scan.scanAngleDegrees = m_Angle;
    scan.pulseDurationMicroseconds = 10;

    int distance = std::abs(m_Angle - m_TargetBearing) % 360;
    if (distance > 180)
        distance = 360 - distance;

    if (distance <= m_TargetHalfWidth)
    {
        SRadarEcho echo;
        echo.roundTripSeconds = m_EchoRoundTrip;
        echo.power = 0.5;
        scan.echoes.push_back(echo);
    }

    m_Angle = ((m_Angle + m_AngleStep) % 360 + 360) % 360;
    return scan;
}

void CRadarSimInterface::close()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_IsConnected = false;
}

void CRadarSimInterface::cancel()
{
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_bCancelled = true;
    }
    m_cv.notify_all();
}

void CRadarSimInterface::reset()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_bCancelled = false;
    m_IsConnected = false;
}

// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_SIM_INTERFACE_H_
#define CRADAR_SIM_INTERFACE_H_

#include "api/CRadarLinkInterface.h"
#include <chrono>
#include <condition_variable>
#include <mutex>

/*
 * Simulated sensor: the beam sweeps by a fixed step per message and a single
 * target sits at a fixed bearing and range. Messages are produced as wire text,
 * so that they go through the same decoding as live data.
 */
class CRadarSimInterface : public CRadarLinkInterface
{
public:
    CRadarSimInterface(double _period_seconds,
        int _angle_step,
        double _range_fraction,
        double _max_range_units,
        double _propagation_speed);
    CRadarSimInterface(const CRadarSimInterface&) = delete;
    CRadarSimInterface& operator=(const CRadarSimInterface&) = delete;
    ~CRadarSimInterface() override = default;

    ERadarConnectionError connect(const std::string& _address) override;
    ERadarConnectionError receive(std::string& _out_message) override;
    void close() override;
    void cancel() override;
    void reset() override;

    /// Generates the scan at the current beam angle and advances the beam.
    SRadarScan step();

private:
    const std::chrono::microseconds m_Period;
    const int       m_AngleStep;
    const double    m_EchoRoundTrip;
    const int       m_TargetBearing = 45;
    const int       m_TargetHalfWidth = 15;

    int             m_Angle = 0;
    bool            m_IsConnected = false;

    std::mutex              m_mutex;
    std::condition_variable m_cv;
    bool                    m_bCancelled = false;
};

#endif // CRADAR_SIM_INTERFACE_H_

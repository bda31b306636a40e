// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_DISPLAY_PORT_H_
#define CRADAR_DISPLAY_PORT_H_

#include "CRadarTypes.h"

// Rendering side of the pipeline. Called on the consumer's own thread.
class CRadarDisplayPort
{
public:
    virtual ~CRadarDisplayPort() = default;

    virtual void onConnectivityChanged(ERadarConnectivity _state) = 0;

    /// _position is nullptr when the scan carried no echo.
    virtual void onScanUpdate(int _angle_degrees, const SRadarPosition* _position) = 0;
};

#endif // CRADAR_DISPLAY_PORT_H_

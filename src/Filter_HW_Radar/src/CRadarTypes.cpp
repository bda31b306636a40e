// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarTypes.h"
#include <cmath>

const char* toString(ERadarConnectivity _state)
{
    switch (_state)
    {
    case ERadarConnectivity::Disconnected: return "Disconnected";
    case ERadarConnectivity::Connecting:   return "Connecting";
    case ERadarConnectivity::Connected:    return "Connected";
    }
    return "Unknown";
}

const char* toString(ERadarDecodeError _error)
{
    switch (_error)
    {
    case ERadarDecodeError::None:       return "None";
    case ERadarDecodeError::Malformed:  return "Malformed";
    case ERadarDecodeError::OutOfRange: return "OutOfRange";
    }
    return "Unknown";
}

const char* toString(ERadarConnectionError _error)
{
    switch (_error)
    {
    case ERadarConnectionError::None:        return "None";
    case ERadarConnectionError::Unreachable: return "Unreachable";
    case ERadarConnectionError::Closed:      return "Closed";
    case ERadarConnectionError::Timeout:     return "Timeout";
    }
    return "Unknown";
}

std::chrono::microseconds toWaitDuration(double _seconds)
{
    if (std::isnan(_seconds) || _seconds <= 0.)
        return std::chrono::microseconds(0);

    const double seconds = std::fmin(_seconds, RADAR_MAX_WAIT_SECONDS);
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::duration<double>(seconds));
}

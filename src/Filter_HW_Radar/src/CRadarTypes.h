// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_TYPES_H_
#define CRADAR_TYPES_H_

#include <chrono>
#include <vector>
#include <string>

#ifndef RADAR_PI
#define RADAR_PI 3.14159265358979323846
#endif

#define RADAR_DEG2RAD (RADAR_PI / 180.0)

// Upper bound of every configured delay, period and timeout [s]
#define RADAR_MAX_WAIT_SECONDS 86400.0

// One reflected pulse
struct SRadarEcho
{
    double roundTripSeconds = 0.; // two-way propagation time [s]
    double power = 0.;            // normalized reflectivity [0, 1]
};

// One sweep measurement at a given angle
struct SRadarScan
{
    int scanAngleDegrees = 0;           // [0, 360)
    int pulseDurationMicroseconds = 0;  // [us]
    std::vector<SRadarEcho> echoes;
};

// Display-surface coordinates
struct SRadarPosition
{
    double x = 0.;
    double y = 0.;
};

enum class ERadarConnectivity
{
    Disconnected = 0,
    Connecting = 1,
    Connected = 2
};

enum class ERadarDecodeError
{
    None = 0,
    Malformed = 1,
    OutOfRange = 2
};

enum class ERadarConnectionError
{
    None = 0,
    Unreachable = 1,
    Closed = 2,
    Timeout = 3
};

enum class ERadarEventType
{
    ConnectivityChanged = 0,
    ReportReceived = 1
};

struct SRadarEvent
{
    ERadarEventType type = ERadarEventType::ConnectivityChanged;
    ERadarConnectivity state = ERadarConnectivity::Disconnected;

    // ReportReceived only
    int angleDegrees = 0;
    bool hasPosition = false;
    SRadarPosition position;
};

const char* toString(ERadarConnectivity _state);
const char* toString(ERadarDecodeError _error);
const char* toString(ERadarConnectionError _error);

/// Seconds to a wait duration. NaN and negative values give 0, large values are capped at RADAR_MAX_WAIT_SECONDS.
std::chrono::microseconds toWaitDuration(double _seconds);

#endif // CRADAR_TYPES_H_

// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_CONFIG_H_
#define CRADAR_CONFIG_H_

#include "CRadarTypes.h"
#include <map>
#include <nlohmann/json_fwd.hpp>

class CRadarConfig
{
public:
    // Link
    std::string interfaceType = "websocket";       // "websocket" or "sim"
    std::string serverAddress = "ws://localhost:4000";
    double      reconnectDelaySeconds = 5.;
    double      connectTimeoutSeconds = 5.;

    // Geometry
    double      surfaceRadius = 150.;
    double      maxRangeUnits = 200.;
    double      propagationSpeed = 300000.;        // [units/s], speed of light in km/s

    // Event delivery
    size_t      eventQueueCapacity = 64;

    // Simulation interface
    double      simPeriodSeconds = 0.05;
    int         simAngleStep = 6;              // [deg] per message, [0, 360)
    double      simRangeFraction = 0.75;

    std::string logLevel = "info";

public:
    /// Custom filter parameters (key -> value strings). Unknown keys and unparsable values are reported and skipped.
    static CRadarConfig fromParameters(const std::map<std::string, std::string>& _params);
    static CRadarConfig fromJson(const nlohmann::json& _json);
    static bool fromJsonFile(const std::string& _path, CRadarConfig& _out_config);

    /// True if every value is usable as is.
    bool validate() const;

    /// Replaces every unusable value (non finite, negative, zero where a positive value is needed) with its default.
    /// Delays, periods and timeouts above RADAR_MAX_WAIT_SECONDS are capped; simAngleStep is reduced to [0, 360).
    void sanitize();

    void applyLogLevel() const;
};

#endif // CRADAR_CONFIG_H_

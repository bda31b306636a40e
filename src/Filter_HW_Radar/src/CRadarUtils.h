// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRadarUtils_H
#define CRadarUtils_H

#include "CRadarTypes.h"
#include <memory>

class CRadarConfig;
class CRadarLinkInterface;

class CRadarUtils
{
public:
    enum RadarInterfaceType
    {
        Radar_SIM_INTERFACE       = 0,
        Radar_WEBSOCKET_INTERFACE = 1
    };

public:
    CRadarUtils() = default;
    CRadarUtils(const CRadarUtils&) = default;
    CRadarUtils(CRadarUtils&&) = default;
    CRadarUtils& operator=(const CRadarUtils&) = default;
    CRadarUtils& operator=(CRadarUtils&&) = default;
    ~CRadarUtils() = default;

    static RadarInterfaceType StringToEnumType(const std::string& _str_type);

    /// Creates the sensor link selected by the "interface" option.
    static std::unique_ptr<CRadarLinkInterface> createLink(const CRadarConfig& _config);
};
#endif // CRadarUtils_H

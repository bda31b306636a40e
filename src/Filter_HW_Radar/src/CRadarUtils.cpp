// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarUtils.h"
#include "CRadarConfig.h"
#include "api/sim/CRadarSimInterface.h"
#include "api/websocket/CRadarWebSocketInterface.h"
#include <spdlog/spdlog.h>

CRadarUtils::RadarInterfaceType CRadarUtils::StringToEnumType(const std::string& _str_type)
{
    if (_str_type.compare("sim") == 0)
        return Radar_SIM_INTERFACE;
    else if (_str_type.compare("websocket") == 0)
        return Radar_WEBSOCKET_INTERFACE;

    spdlog::warn("CRadarUtils: Unknown radar interface '{}'. Switching to websocket.", _str_type);
    return Radar_WEBSOCKET_INTERFACE;
}

std::unique_ptr<CRadarLinkInterface> CRadarUtils::createLink(const CRadarConfig& _config)
{
    CRadarConfig config = _config;
    config.sanitize();

    if (StringToEnumType(config.interfaceType) == Radar_SIM_INTERFACE)
    {
        return std::make_unique<CRadarSimInterface>(config.simPeriodSeconds,
            config.simAngleStep,
            config.simRangeFraction,
            config.maxRangeUnits,
            config.propagationSpeed);
    }

    return std::make_unique<CRadarWebSocketInterface>(config.connectTimeoutSeconds);
}

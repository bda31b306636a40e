// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarConfig.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <limits>

namespace {

    bool is_log_level(const std::string& _name)
    {
        static const char* const names[] = { "trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off" };
        for (const char* name : names)
        {
            if (_name == name)
                return true;
        }
        return false;
    }

    const double MAX_NUMBER = std::numeric_limits<double>::max();

    // Finite, at least zero (or above it), at most _max
    bool in_bounds(double _value, bool _allow_zero, double _max)
    {
        return std::isfinite(_value) && (_allow_zero ? _value >= 0. : _value > 0.) && _value <= _max;
    }

    void bound(const char* _key, double& _value, double _default, bool _allow_zero, double _max)
    {
        if (in_bounds(_value, _allow_zero, _max))
            return;

        if (std::isfinite(_value) && _value > _max)
        {
            spdlog::warn("CRadarConfig: {} = {} is too large. Using {}.", _key, _value, _max);
            _value = _max;
        }
        else
        {
            spdlog::warn("CRadarConfig: {} = {} is not usable. Using {}.", _key, _value, _default);
            _value = _default;
        }
    }

    int wrap_angle_step(long long _step)
    {
        return static_cast<int>((_step % 360 + 360) % 360);
    }

    bool parse_double(const std::string& _key, const std::string& _value, double& _out)
    {
        try
        {
            size_t pos = 0;
            const double v = std::stod(_value, &pos);
            if (pos != _value.size())
                throw std::invalid_argument(_value);
            _out = v;
            return true;
        }
        catch (const std::exception&)
        {
            spdlog::warn("CRadarConfig: Parameter {} has a non numeric value '{}'. Keeping {}.", _key, _value, _out);
            return false;
        }
    }

    bool parse_int(const std::string& _key, const std::string& _value, long long& _out)
    {
        try
        {
            size_t pos = 0;
            const long long v = std::stoll(_value, &pos);
            if (pos != _value.size())
                throw std::invalid_argument(_value);
            _out = v;
            return true;
        }
        catch (const std::exception&)
        {
            spdlog::warn("CRadarConfig: Parameter {} has a non integer value '{}'. Keeping {}.", _key, _value, _out);
            return false;
        }
    }

}

CRadarConfig CRadarConfig::fromParameters(const std::map<std::string, std::string>& _params)
{
    CRadarConfig config;

    for (const auto& param : _params)
    {
        const std::string& key = param.first;
        const std::string& value = param.second;

        if (value.empty())
            continue;

        if (key == "interface")
            config.interfaceType = value;
        else if (key == "serverAddress")
            config.serverAddress = value;
        else if (key == "reconnectDelaySeconds")
            parse_double(key, value, config.reconnectDelaySeconds);
        else if (key == "connectTimeoutSeconds")
            parse_double(key, value, config.connectTimeoutSeconds);
        else if (key == "surfaceRadius")
            parse_double(key, value, config.surfaceRadius);
        else if (key == "maxRangeUnits")
            parse_double(key, value, config.maxRangeUnits);
        else if (key == "propagationSpeed")
            parse_double(key, value, config.propagationSpeed);
        else if (key == "simPeriodSeconds")
            parse_double(key, value, config.simPeriodSeconds);
        else if (key == "simRangeFraction")
            parse_double(key, value, config.simRangeFraction);
        else if (key == "eventQueueCapacity")
        {
            long long capacity = static_cast<long long>(config.eventQueueCapacity);
            if (parse_int(key, value, capacity))
                config.eventQueueCapacity = capacity > 0 ? static_cast<size_t>(capacity) : 0;
        }
        else if (key == "simAngleStep")
        {
            long long step = config.simAngleStep;
            if (parse_int(key, value, step))
                config.simAngleStep = wrap_angle_step(step);
        }
        else if (key == "logLevel")
            config.logLevel = value;
        else
            spdlog::warn("CRadarConfig: Unknown parameter {}. Ignored.", key);
    }

    config.sanitize();
    return config;
}

CRadarConfig CRadarConfig::fromJson(const nlohmann::json& _json)
{
    CRadarConfig config;

    if (!_json.is_object())
    {
        spdlog::error("CRadarConfig: Configuration root must be a JSON object. Using defaults.");
        return config;
    }

    for (const auto& item : _json.items())
    {
        const std::string& key = item.key();
        const nlohmann::json& value = item.value();

        double* number = nullptr;
        if (key == "reconnectDelaySeconds")     number = &config.reconnectDelaySeconds;
        else if (key == "connectTimeoutSeconds") number = &config.connectTimeoutSeconds;
        else if (key == "surfaceRadius")        number = &config.surfaceRadius;
        else if (key == "maxRangeUnits")        number = &config.maxRangeUnits;
        else if (key == "propagationSpeed")     number = &config.propagationSpeed;
        else if (key == "simPeriodSeconds")     number = &config.simPeriodSeconds;
        else if (key == "simRangeFraction")     number = &config.simRangeFraction;

        if (number != nullptr)
        {
            if (value.is_number())
                *number = value.get<double>();
            else
                spdlog::warn("CRadarConfig: Key {} expects a number.", key);
            continue;
        }

        std::string* text = nullptr;
        if (key == "interface")           text = &config.interfaceType;
        else if (key == "serverAddress")  text = &config.serverAddress;
        else if (key == "logLevel")       text = &config.logLevel;

        if (text != nullptr)
        {
            if (value.is_string())
                *text = value.get<std::string>();
            else
                spdlog::warn("CRadarConfig: Key {} expects a string.", key);
            continue;
        }

        if (key == "eventQueueCapacity")
        {
            if (value.is_number_integer())
                config.eventQueueCapacity = value.get<long long>() > 0 ? value.get<size_t>() : 0;
            else
                spdlog::warn("CRadarConfig: Key {} expects an integer.", key);
        }
        else if (key == "simAngleStep")
        {
            if (value.is_number_integer())
                config.simAngleStep = wrap_angle_step(value.get<long long>());
            else
                spdlog::warn("CRadarConfig: Key {} expects an integer.", key);
        }
        else
        {
            spdlog::warn("CRadarConfig: Unknown key {}. Ignored.", key);
        }
    }

    config.sanitize();
    return config;
}

bool CRadarConfig::fromJsonFile(const std::string& _path, CRadarConfig& _out_config)
{
    std::ifstream stream_in(_path);
    if (!stream_in.is_open())
    {
        spdlog::error("CRadarConfig: Can't open configuration file {}", _path);
        return false;
    }

    const nlohmann::json doc = nlohmann::json::parse(stream_in, nullptr, false);
    if (doc.is_discarded())
    {
        spdlog::error("CRadarConfig: Configuration file {} is not valid JSON", _path);
        return false;
    }

    _out_config = fromJson(doc);
    return true;
}

bool CRadarConfig::validate() const
{
    return (interfaceType == "websocket" || interfaceType == "sim")
        && !serverAddress.empty()
        && in_bounds(reconnectDelaySeconds, true, RADAR_MAX_WAIT_SECONDS)
        && in_bounds(connectTimeoutSeconds, false, RADAR_MAX_WAIT_SECONDS)
        && in_bounds(surfaceRadius, false, MAX_NUMBER)
        && in_bounds(maxRangeUnits, false, MAX_NUMBER)
        && in_bounds(propagationSpeed, false, MAX_NUMBER)
        && eventQueueCapacity > 0
        && in_bounds(simPeriodSeconds, false, RADAR_MAX_WAIT_SECONDS)
        && simAngleStep >= 0 && simAngleStep < 360
        && in_bounds(simRangeFraction, true, MAX_NUMBER)
        && is_log_level(logLevel);
}

void CRadarConfig::sanitize()
{
    const CRadarConfig defaults;

    if (interfaceType != "websocket" && interfaceType != "sim")
    {
        spdlog::warn("CRadarConfig: Unknown interface '{}'. Switching to {}.", interfaceType, defaults.interfaceType);
        interfaceType = defaults.interfaceType;
    }
    if (serverAddress.empty())
    {
        spdlog::warn("CRadarConfig: Empty server address. Using {}.", defaults.serverAddress);
        serverAddress = defaults.serverAddress;
    }

    bound("reconnectDelaySeconds", reconnectDelaySeconds, defaults.reconnectDelaySeconds, true, RADAR_MAX_WAIT_SECONDS);
    bound("connectTimeoutSeconds", connectTimeoutSeconds, defaults.connectTimeoutSeconds, false, RADAR_MAX_WAIT_SECONDS);
    bound("surfaceRadius", surfaceRadius, defaults.surfaceRadius, false, MAX_NUMBER);
    bound("maxRangeUnits", maxRangeUnits, defaults.maxRangeUnits, false, MAX_NUMBER);
    bound("propagationSpeed", propagationSpeed, defaults.propagationSpeed, false, MAX_NUMBER);
    bound("simPeriodSeconds", simPeriodSeconds, defaults.simPeriodSeconds, false, RADAR_MAX_WAIT_SECONDS);
    bound("simRangeFraction", simRangeFraction, defaults.simRangeFraction, true, MAX_NUMBER);

    if (eventQueueCapacity == 0)
    {
        spdlog::warn("CRadarConfig: eventQueueCapacity must be positive. Using {}.", defaults.eventQueueCapacity);
        eventQueueCapacity = defaults.eventQueueCapacity;
    }
    if (simAngleStep < 0 || simAngleStep >= 360)
        simAngleStep = wrap_angle_step(simAngleStep);

    if (!is_log_level(logLevel))
    {
        spdlog::warn("CRadarConfig: Unknown log level '{}'. Using {}.", logLevel, defaults.logLevel);
        logLevel = defaults.logLevel;
    }
}

void CRadarConfig::applyLogLevel() const
{
    spdlog::set_level(spdlog::level::from_str(logLevel));
}

// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarDecoder.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>

namespace {

    const char* const KEY_SCAN_ANGLE = "scanAngle";
    const char* const KEY_PULSE_DURATION = "pulseDuration";
    const char* const KEY_ECHO_RESPONSES = "echoResponses";
    const char* const KEY_ECHO_TIME = "time";
    const char* const KEY_ECHO_POWER = "power";

    bool has_integer(const nlohmann::json& _obj, const char* _key)
    {
        const auto it = _obj.find(_key);
        return it != _obj.end() && it->is_number_integer();
    }

    bool has_number(const nlohmann::json& _obj, const char* _key)
    {
        const auto it = _obj.find(_key);
        return it != _obj.end() && it->is_number();
    }

    // Saturates unsigned values that do not fit
    std::int64_t as_int64(const nlohmann::json& _value)
    {
        if (_value.is_number_unsigned() &&
            _value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return std::numeric_limits<std::int64_t>::max();

        return _value.get<std::int64_t>();
    }

}

ERadarDecodeError CRadarDecoder::decode(const std::string& _raw, SRadarScan& _out_scan)
{
    const nlohmann::json doc = nlohmann::json::parse(_raw, nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return ERadarDecodeError::Malformed;

    // Structure first, so that a missing field always wins over a bad value
    if (!has_integer(doc, KEY_SCAN_ANGLE) || !has_integer(doc, KEY_PULSE_DURATION))
        return ERadarDecodeError::Malformed;

    const auto echoes_it = doc.find(KEY_ECHO_RESPONSES);
    if (echoes_it == doc.end() || !echoes_it->is_array())
        return ERadarDecodeError::Malformed;

    for (const auto& echo : *echoes_it)
    {
        if (!echo.is_object() || !has_number(echo, KEY_ECHO_TIME) || !has_number(echo, KEY_ECHO_POWER))
            return ERadarDecodeError::Malformed;
    }

    const auto angle = as_int64(doc.at(KEY_SCAN_ANGLE));
    if (angle < 0 || angle >= 360)
        return ERadarDecodeError::OutOfRange;

    const auto pulse = as_int64(doc.at(KEY_PULSE_DURATION));
    if (pulse < 0 || pulse > std::numeric_limits<int>::max())
        return ERadarDecodeError::OutOfRange;

    SRadarScan scan;
    scan.scanAngleDegrees = static_cast<int>(angle);
    scan.pulseDurationMicroseconds = static_cast<int>(pulse);
    scan.echoes.reserve(echoes_it->size());

    for (const auto& echo : *echoes_it)
    {
        SRadarEcho e;
        e.roundTripSeconds = echo.at(KEY_ECHO_TIME).get<double>();
        e.power = echo.at(KEY_ECHO_POWER).get<double>();

        if (e.roundTripSeconds < 0. || e.power < 0. || e.power > 1.)
            return ERadarDecodeError::OutOfRange;

        scan.echoes.push_back(e);
    }

    _out_scan = std::move(scan);
    return ERadarDecodeError::None;
}

std::string CRadarDecoder::encode(const SRadarScan& _scan)
{
    nlohmann::json doc;
    doc[KEY_SCAN_ANGLE] = _scan.scanAngleDegrees;
    doc[KEY_PULSE_DURATION] = _scan.pulseDurationMicroseconds;
    doc[KEY_ECHO_RESPONSES] = nlohmann::json::array();

    for (const auto& echo : _scan.echoes)
    {
        doc[KEY_ECHO_RESPONSES].push_back({
            { KEY_ECHO_TIME, echo.roundTripSeconds },
            { KEY_ECHO_POWER, echo.power } });
    }

    return doc.dump();
}

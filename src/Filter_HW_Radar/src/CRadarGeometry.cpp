// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarGeometry.h"
#include <cmath>

double CRadarGeometry::oneWayDistance(double _round_trip_seconds, double _propagation_speed)
{
    return (_round_trip_seconds * _propagation_speed) / 2.;
}

double CRadarGeometry::rangeFraction(double _distance, double _max_range_units)
{
    return _distance / _max_range_units;
}

bool CRadarGeometry::computePosition(const SRadarScan& _scan,
    double _surface_radius,
    double _max_range_units,
    double _propagation_speed,
    SRadarPosition& _out_position)
{
    if (_scan.echoes.empty())
        return false;

    const SRadarEcho& echo = _scan.echoes.front();

    const double r = rangeFraction(oneWayDistance(echo.roundTripSeconds, _propagation_speed), _max_range_units);
    const double angle_rad = _scan.scanAngleDegrees * RADAR_DEG2RAD;

    _out_position.x = r * _surface_radius * std::cos(angle_rad) + _surface_radius;
    _out_position.y = r * _surface_radius * std::sin(angle_rad) + _surface_radius;

    return true;
}

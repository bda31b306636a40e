// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

/*
 * Range-bearing to display coordinates.
 *
 * The display surface is a square canvas of side 2 * surface_radius, with the
 * sensor at its center. Only the first echo of a scan is projected (closest
 * reflection); further echoes are ignored.
 *
 *   distance = round_trip_time * propagation_speed / 2
 *   r        = distance / max_range           (not clamped)
 *   x        = r * R * cos(angle) + R
 *   y        = r * R * sin(angle) + R
 */

#ifndef CRADAR_GEOMETRY_H_
#define CRADAR_GEOMETRY_H_

#include "CRadarTypes.h"

class CRadarGeometry
{
public:
    CRadarGeometry() = delete;

    /// Returns false when the scan carries no echo (no target at this angle).
    static bool computePosition(const SRadarScan& _scan,
        double _surface_radius,
        double _max_range_units,
        double _propagation_speed,
        SRadarPosition& _out_position);

    static double oneWayDistance(double _round_trip_seconds, double _propagation_speed);
    static double rangeFraction(double _distance, double _max_range_units);
};

#endif // CRADAR_GEOMETRY_H_

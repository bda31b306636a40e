// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

/*
 * Wire format of one scan report (JSON text frame):
 *
 *   { "scanAngle": int, "pulseDuration": int,
 *     "echoResponses": [ { "time": float, "power": float }, ... ] }
 *
 *   scanAngle      - sweep angle in degrees, [0, 360)
 *   pulseDuration  - pulse length in microseconds
 *   time           - two-way propagation time in seconds
 *   power          - normalized reflectivity, [0, 1]
 */

#ifndef CRADAR_DECODER_H_
#define CRADAR_DECODER_H_

#include "CRadarTypes.h"

class CRadarDecoder
{
public:
    CRadarDecoder() = delete;

    /// Parses one inbound message. _out_scan is only written on success.
    static ERadarDecodeError decode(const std::string& _raw, SRadarScan& _out_scan);

    static std::string encode(const SRadarScan& _scan);
};

#endif // CRADAR_DECODER_H_

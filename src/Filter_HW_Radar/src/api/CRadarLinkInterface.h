// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_LINK_INTERFACE_H_
#define CRADAR_LINK_INTERFACE_H_

#include "CRadarTypes.h"

/*
 * One message-oriented session with the radar sensor.
 *
 * connect(), receive() and close() are called from the acquisition thread only.
 * cancel() may be called from any thread: it unblocks a pending connect() or
 * receive(), and every following call fails with Closed until reset().
 */
class CRadarLinkInterface
{
public:
    virtual ~CRadarLinkInterface() = default;

    virtual ERadarConnectionError connect(const std::string& _address) = 0;

    /// Blocks until one whole message is available.
    virtual ERadarConnectionError receive(std::string& _out_message) = 0;

    virtual void close() = 0;
    virtual void cancel() = 0;
    virtual void reset() = 0;
};

#endif // CRADAR_LINK_INTERFACE_H_

// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_WEBSOCKET_INTERFACE_H_
#define CRADAR_WEBSOCKET_INTERFACE_H_

#include "api/CRadarLinkInterface.h"
#include <memory>

class CRadarWebSocketInterface : public CRadarLinkInterface
{
public:
    explicit CRadarWebSocketInterface(double _connect_timeout_seconds);
    CRadarWebSocketInterface(const CRadarWebSocketInterface&) = delete;
    CRadarWebSocketInterface(CRadarWebSocketInterface&&) = delete;
    CRadarWebSocketInterface& operator=(const CRadarWebSocketInterface&) = delete;
    CRadarWebSocketInterface& operator=(CRadarWebSocketInterface&&) = delete;
    ~CRadarWebSocketInterface() override;

    ERadarConnectionError connect(const std::string& _address) override;
    ERadarConnectionError receive(std::string& _out_message) override;
    void close() override;
    void cancel() override;
    void reset() override;

    /// Splits "ws://host[:port][/target]". Port defaults to 80, target to "/".
    static bool parseAddress(const std::string& _address,
        std::string& _out_host,
        std::string& _out_port,
        std::string& _out_target);

private:
    struct impl;
    std::unique_ptr<impl> m_impl;
};

#endif // CRADAR_WEBSOCKET_INTERFACE_H_

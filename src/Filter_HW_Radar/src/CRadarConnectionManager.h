// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

/*
 * Acquisition loop of the radar scope.
 *
 * The manager owns the sensor link and a worker thread which runs:
 *
 *   Disconnected -> Connecting -> Connected -> Disconnected -> (delay) -> Connecting -> ...
 *
 * Every inbound message is decoded and projected on the display surface. The result
 * is published as an event on a bounded FIFO, together with the connectivity changes.
 * The rendering side drains the FIFO on its own thread with dispatchEvents().
 *
 * Connection failures and session losses are never fatal: the loop waits the
 * reconnect delay and tries again, until stop(). A message that fails to decode
 * is logged and skipped; the session stays open.
 */

#ifndef CRADAR_CONNECTION_MANAGER_H_
#define CRADAR_CONNECTION_MANAGER_H_

#include "CRadarTypes.h"
#include "CRadarConfig.h"
#include "CRadarEventQueue.h"
#include "CRadarDisplayPort.h"
#include "api/CRadarLinkInterface.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

class CRadarConnectionManager
{
public:
    /// Creates the link selected in the configuration.
    explicit CRadarConnectionManager(const CRadarConfig& _config);
    CRadarConnectionManager(const CRadarConfig& _config, std::unique_ptr<CRadarLinkInterface> _link);
    CRadarConnectionManager(const CRadarConnectionManager&) = delete;
    CRadarConnectionManager& operator=(const CRadarConnectionManager&) = delete;
    ~CRadarConnectionManager();

    bool start();
    void stop();

    bool isRunning() const { return m_bRunning; }
    ERadarConnectivity getState() const { return m_State; }

    /// Delivers the pending events to _port on the calling thread. Returns the number of events delivered.
    size_t dispatchEvents(CRadarDisplayPort& _port);
    CRadarEventQueue& events() { return m_Events; }

    std::uint64_t getConnectAttemptCount() const { return m_nConnectAttempts; }
    std::uint64_t getReportCount() const { return m_nReports; }
    std::uint64_t getDecodeErrorCount() const { return m_nDecodeErrors; }

    const CRadarConfig& getConfig() const { return m_Config; }

private:
    void run();
    void runSession();
    void handleMessage(const std::string& _message);

    void setState(ERadarConnectivity _state);
    void publish(const SRadarEvent& _event);

    /// Returns false if stop() interrupted the wait.
    bool waitReconnectDelay();

private:
    const CRadarConfig                   m_Config;
    std::unique_ptr<CRadarLinkInterface> m_pLink;
    CRadarEventQueue                     m_Events;

    std::atomic<bool>               m_bRunning{ false };
    std::atomic<ERadarConnectivity> m_State{ ERadarConnectivity::Disconnected };

    std::atomic<std::uint64_t> m_nConnectAttempts{ 0 };
    std::atomic<std::uint64_t> m_nReports{ 0 };
    std::atomic<std::uint64_t> m_nDecodeErrors{ 0 };

    std::mutex              m_mutex;
    std::condition_variable m_cv;
    std::thread             m_thread;
};

#endif // CRADAR_CONNECTION_MANAGER_H_

// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarConnectionManager.h"
#include "CRadarDecoder.h"
#include "CRadarGeometry.h"
#include "CRadarUtils.h"
#include <spdlog/spdlog.h>
#include <chrono>

namespace {

    const size_t MAX_LOGGED_MESSAGE = 128;

    std::string shorten(const std::string& _message)
    {
        if (_message.size() <= MAX_LOGGED_MESSAGE)
            return _message;
        return _message.substr(0, MAX_LOGGED_MESSAGE) + "...";
    }

    CRadarConfig sanitized(const CRadarConfig& _config)
    {
        CRadarConfig config = _config;
        config.sanitize();
        return config;
    }

}

CRadarConnectionManager::CRadarConnectionManager(const CRadarConfig& _config) :
    CRadarConnectionManager(_config, CRadarUtils::createLink(_config))
{
}

CRadarConnectionManager::CRadarConnectionManager(const CRadarConfig& _config, std::unique_ptr<CRadarLinkInterface> _link) :
    m_Config(sanitized(_config)),
    m_pLink(std::move(_link)),
    m_Events(_config.eventQueueCapacity)
{
}

CRadarConnectionManager::~CRadarConnectionManager()
{
    stop();
}

bool CRadarConnectionManager::start()
{
    if (m_thread.joinable())
    {
        spdlog::warn("CRadarConnectionManager: Already started");
        return false;
    }

    if (m_pLink == nullptr)
    {
        spdlog::error("CRadarConnectionManager: No sensor link. Can't start.");
        return false;
    }

    m_pLink->reset();
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_bRunning = true;
    }
    m_thread = std::thread(&CRadarConnectionManager::run, this);

    spdlog::info("CRadarConnectionManager::start() successful, server {}", m_Config.serverAddress);
    return true;
}

void CRadarConnectionManager::stop()
{
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        m_bRunning = false;
    }
    m_cv.notify_all();

    // Unblock a pending connect or receive
    if (m_pLink != nullptr)
        m_pLink->cancel();

    if (m_thread.joinable())
    {
        m_thread.join();
        spdlog::info("CRadarConnectionManager: Stopped");
    }

    m_State = ERadarConnectivity::Disconnected;
}

size_t CRadarConnectionManager::dispatchEvents(CRadarDisplayPort& _port)
{
    size_t count = 0;
    SRadarEvent event;

    while (m_Events.tryPop(event))
    {
        if (event.type == ERadarEventType::ConnectivityChanged)
            _port.onConnectivityChanged(event.state);
        else
            _port.onScanUpdate(event.angleDegrees, event.hasPosition ? &event.position : nullptr);

        ++count;
    }

    return count;
}

void CRadarConnectionManager::run()
{
    while (m_bRunning)
    {
        setState(ERadarConnectivity::Connecting);
        ++m_nConnectAttempts;

        const ERadarConnectionError err = m_pLink->connect(m_Config.serverAddress);
        if (err == ERadarConnectionError::None)
        {
            setState(ERadarConnectivity::Connected);
            runSession();
        }
        else if (m_bRunning)
        {
            spdlog::warn("CRadarConnectionManager: Can't connect to {} ({})", m_Config.serverAddress, toString(err));
        }

        m_pLink->close();

        if (!m_bRunning)
            break;

        setState(ERadarConnectivity::Disconnected);
        spdlog::info("CRadarConnectionManager: Retrying in {} s", m_Config.reconnectDelaySeconds);

        if (!waitReconnectDelay())
            break;
    }

    m_State = ERadarConnectivity::Disconnected;
}

void CRadarConnectionManager::runSession()
{
    std::string message;

    while (m_bRunning)
    {
        const ERadarConnectionError err = m_pLink->receive(message);
        if (err != ERadarConnectionError::None)
        {
            if (m_bRunning)
                spdlog::warn("CRadarConnectionManager: Session lost ({})", toString(err));
            return;
        }

        handleMessage(message);
    }
}

void CRadarConnectionManager::handleMessage(const std::string& _message)
{
    SRadarScan scan;
    const ERadarDecodeError err = CRadarDecoder::decode(_message, scan);
    if (err != ERadarDecodeError::None)
    {
        ++m_nDecodeErrors;
        spdlog::warn("CRadarConnectionManager: Message dropped ({}): {}", toString(err), shorten(_message));
        return;
    }

    SRadarEvent event;
    event.type = ERadarEventType::ReportReceived;
    event.state = ERadarConnectivity::Connected;
    event.angleDegrees = scan.scanAngleDegrees;
    event.hasPosition = CRadarGeometry::computePosition(scan,
        m_Config.surfaceRadius,
        m_Config.maxRangeUnits,
        m_Config.propagationSpeed,
        event.position);

    ++m_nReports;
    publish(event);
}

void CRadarConnectionManager::setState(ERadarConnectivity _state)
{
    m_State = _state;

    if (_state == ERadarConnectivity::Connected)
        spdlog::info("CRadarConnectionManager: Connected");
    else if (_state == ERadarConnectivity::Disconnected)
        spdlog::info("CRadarConnectionManager: Disconnected");
    else
        spdlog::debug("CRadarConnectionManager: Connecting to {}", m_Config.serverAddress);

    SRadarEvent event;
    event.type = ERadarEventType::ConnectivityChanged;
    event.state = _state;
    publish(event);
}

void CRadarConnectionManager::publish(const SRadarEvent& _event)
{
    // stop() clears the flag under the same lock: nothing is pushed after it returns from there
    std::lock_guard<std::mutex> guard(m_mutex);
    if (!m_bRunning)
        return;

    m_Events.push(_event);
}

bool CRadarConnectionManager::waitReconnectDelay()
{
    const std::chrono::microseconds delay = toWaitDuration(m_Config.reconnectDelaySeconds);

    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_cv.wait_for(lock, delay, [this] { return !m_bRunning; });
}

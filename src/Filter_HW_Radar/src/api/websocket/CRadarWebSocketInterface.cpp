// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarWebSocketInterface.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cctype>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct CRadarWebSocketInterface::impl
{
    explicit impl(std::chrono::microseconds _timeout) :
        ioc(std::make_unique<net::io_context>()),
        timeout(_timeout)
    {}

    // Declared before the stream: the stream must go first
    std::unique_ptr<net::io_context> ioc;
    std::unique_ptr<websocket::stream<beast::tcp_stream>> ws;
    beast::flat_buffer buffer;

    std::atomic<bool> cancelled{ false };
    const std::chrono::microseconds timeout;

    bool run(const bool& _done);
};

// Runs the queued operation until its handler set _done, or until cancel() stopped the context.
// After a cancellation the context is not run again before reset(), which discards the stale handlers.
bool CRadarWebSocketInterface::impl::run(const bool& _done)
{
    ioc->restart();
    if (cancelled)
        return false;

    ioc->run();
    return _done;
}

CRadarWebSocketInterface::CRadarWebSocketInterface(double _connect_timeout_seconds) :
    m_impl(std::make_unique<impl>(toWaitDuration(_connect_timeout_seconds)))
{
}

CRadarWebSocketInterface::~CRadarWebSocketInterface()
{
    m_impl->ws.reset();
}

bool CRadarWebSocketInterface::parseAddress(const std::string& _address,
    std::string& _out_host,
    std::string& _out_port,
    std::string& _out_target)
{
    const std::string scheme = "ws://";
    if (_address.compare(0, scheme.size(), scheme) != 0)
        return false;

    const std::string rest = _address.substr(scheme.size());
    const size_t slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    const std::string target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    if (authority.empty())
        return false;

    std::string host;
    std::string port = "80";

    if (authority[0] == '[')
    {
        // IPv6 literal
        const size_t bracket = authority.find(']');
        if (bracket == std::string::npos)
            return false;

        host = authority.substr(1, bracket - 1);
        const std::string tail = authority.substr(bracket + 1);
        if (!tail.empty())
        {
            if (tail[0] != ':')
                return false;
            port = tail.substr(1);
        }
    }
    else
    {
        const size_t colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != std::string::npos)
            port = authority.substr(colon + 1);
    }

    if (host.empty() || port.empty() || port.size() > 5)
        return false;

    for (const char c : port)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }

    const int port_nr = std::stoi(port);
    if (port_nr < 1 || port_nr > 65535)
        return false;

    _out_host = host;
    _out_port = port;
    _out_target = target;
    return true;
}

ERadarConnectionError CRadarWebSocketInterface::connect(const std::string& _address)
{
    if (m_impl->cancelled)
        return ERadarConnectionError::Closed;

    close();

    std::string host, port, target;
    if (!parseAddress(_address, host, port, target))
    {
        spdlog::error("CRadarWebSocketInterface: Invalid server address '{}'", _address);
        return ERadarConnectionError::Unreachable;
    }

    m_impl->ws = std::make_unique<websocket::stream<beast::tcp_stream>>(*m_impl->ioc);

    auto& ws = *m_impl->ws;
    const auto timeout = m_impl->timeout;
    const std::string handshake_host = host + ":" + port;

    tcp::resolver resolver(*m_impl->ioc);
    beast::error_code result;
    bool done = false;

    // The timeout covers TCP connect and handshake. Name resolution runs in the system resolver,
    // which cancel() does not interrupt; numeric addresses resolve without a lookup.
    resolver.async_resolve(host, port,
        [&](const beast::error_code& ec, const tcp::resolver::results_type& endpoints)
        {
            if (ec)
            {
                result = ec;
                done = true;
                return;
            }

            beast::get_lowest_layer(ws).expires_after(timeout);
            beast::get_lowest_layer(ws).async_connect(endpoints,
                [&](const beast::error_code& ec_connect, const tcp::endpoint&)
                {
                    if (ec_connect)
                    {
                        result = ec_connect;
                        done = true;
                        return;
                    }

                    // The websocket stream keeps its own timers from here on
                    beast::get_lowest_layer(ws).expires_never();
                    ws.set_option(websocket::stream_base::timeout{ timeout, websocket::stream_base::none(), false });

                    ws.async_handshake(handshake_host, target,
                        [&](const beast::error_code& ec_handshake)
                        {
                            result = ec_handshake;
                            done = true;
                        });
                });
        });

    if (!m_impl->run(done))
        return ERadarConnectionError::Closed;

    if (result)
    {
        spdlog::warn("CRadarWebSocketInterface: Connection to {} failed: {}", _address, result.message());
        m_impl->ws.reset();

        if (result == beast::error::timeout)
            return ERadarConnectionError::Timeout;
        return ERadarConnectionError::Unreachable;
    }

    spdlog::info("CRadarWebSocketInterface: Connected to {}", _address);
    return ERadarConnectionError::None;
}

ERadarConnectionError CRadarWebSocketInterface::receive(std::string& _out_message)
{
    if (m_impl->cancelled || !m_impl->ws)
        return ERadarConnectionError::Closed;

    beast::error_code result;
    bool done = false;

    m_impl->buffer.clear();
    m_impl->ws->async_read(m_impl->buffer,
        [&](const beast::error_code& ec, std::size_t)
        {
            result = ec;
            done = true;
        });

    if (!m_impl->run(done))
        return ERadarConnectionError::Closed;

    if (result)
    {
        if (result == websocket::error::closed)
            spdlog::info("CRadarWebSocketInterface: Session closed by peer");
        else
            spdlog::warn("CRadarWebSocketInterface: Read failed: {}", result.message());

        if (result == beast::error::timeout)
            return ERadarConnectionError::Timeout;
        return ERadarConnectionError::Closed;
    }

    _out_message = beast::buffers_to_string(m_impl->buffer.data());
    m_impl->buffer.consume(m_impl->buffer.size());
    return ERadarConnectionError::None;
}

void CRadarWebSocketInterface::close()
{
    if (!m_impl->ws)
        return;

    if (!m_impl->cancelled && m_impl->ws->is_open())
    {
        bool done = false;
        m_impl->ws->async_close(websocket::close_code::normal,
            [&](const beast::error_code& ec)
            {
                if (ec)
                    spdlog::debug("CRadarWebSocketInterface: Close handshake failed: {}", ec.message());
                done = true;
            });

        (void)m_impl->run(done);
    }

    m_impl->ws.reset();
}

void CRadarWebSocketInterface::cancel()
{
    m_impl->cancelled = true;
    m_impl->ioc->stop();
}

void CRadarWebSocketInterface::reset()
{
    m_impl->ws.reset();
    m_impl->buffer.clear();

    // Drops the handlers left behind by a cancelled operation
    m_impl->ioc = std::make_unique<net::io_context>();
    m_impl->cancelled = false;
}

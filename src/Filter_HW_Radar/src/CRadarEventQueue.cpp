// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#include "CRadarEventQueue.h"

CRadarEventQueue::CRadarEventQueue(size_t _capacity) :
    m_Capacity(_capacity > 0 ? _capacity : 1)
{
}

void CRadarEventQueue::push(const SRadarEvent& _event)
{
    {
        std::lock_guard<std::mutex> guard(m_mutex);
        if (m_Events.size() >= m_Capacity)
        {
            m_Events.pop_front();
            ++m_Dropped;
        }
        m_Events.push_back(_event);
    }
    m_cv.notify_one();
}

bool CRadarEventQueue::tryPop(SRadarEvent& _out_event)
{
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_Events.empty())
        return false;

    _out_event = m_Events.front();
    m_Events.pop_front();
    return true;
}

bool CRadarEventQueue::waitPop(SRadarEvent& _out_event, std::chrono::milliseconds _timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, _timeout, [this] { return !m_Events.empty(); }))
        return false;

    _out_event = m_Events.front();
    m_Events.pop_front();
    return true;
}

void CRadarEventQueue::clear()
{
    std::lock_guard<std::mutex> guard(m_mutex);
    m_Events.clear();
}

size_t CRadarEventQueue::size() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_Events.size();
}

size_t CRadarEventQueue::droppedCount() const
{
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_Dropped;
}

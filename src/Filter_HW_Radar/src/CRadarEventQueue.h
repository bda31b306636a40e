// Copyright (c) 2025 CyberCortex Robotics SRL. All rights reserved
// Author: Sorin Mihai Grigorescu

#ifndef CRADAR_EVENT_QUEUE_H_
#define CRADAR_EVENT_QUEUE_H_

#include "CRadarTypes.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

/*
 * Handoff between the acquisition thread (producer) and the rendering thread (consumer).
 * Events come out in the order they went in. When the consumer falls behind, the
 * oldest events are dropped so that the newest sweep is always available.
 */
class CRadarEventQueue
{
public:
    explicit CRadarEventQueue(size_t _capacity);
    CRadarEventQueue(const CRadarEventQueue&) = delete;
    CRadarEventQueue& operator=(const CRadarEventQueue&) = delete;
    ~CRadarEventQueue() = default;

    void push(const SRadarEvent& _event);

    bool tryPop(SRadarEvent& _out_event);
    bool waitPop(SRadarEvent& _out_event, std::chrono::milliseconds _timeout);

    void clear();

    size_t size() const;
    size_t capacity() const { return m_Capacity; }
    size_t droppedCount() const;

private:
    const size_t            m_Capacity;
    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::deque<SRadarEvent> m_Events;
    size_t                  m_Dropped = 0;
};

#endif // CRADAR_EVENT_QUEUE_H_

//=============================================================================
// Thread.cpp
//=============================================================================
#include "Thread.hpp"

#include <QDateTime>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "Diagnostics.hpp"

const char* toString(ThreadEvent event) noexcept
{
    switch (event)
    {
        case ThreadEvent::Start:
            return "Start";
        case ThreadEvent::Stop:
            return "Stop";
        case ThreadEvent::Idle:
            return "Idle";
        case ThreadEvent::Update:
            return "Update";
    }
    return "Unknown";
}

bool detail::ThreadListenerTable::remove(ThreadEvent event, int id)
{
    auto& list = lists[size_t(event)];
    auto  it   = std::find_if(list.begin(), list.end(), [id](const ThreadListenerEntry& e) { return e.id == id; });
    if (it == list.end())
        return false;

    list.erase(it);
    return true;
}

bool ListenerHandle::unsubscribe()
{
    auto table = m_table.lock();
    if (!table)
        return false;

    const bool removed = table->remove(m_event, m_id);
    m_table.reset();
    return removed;
}

Thread::Thread(Clock clock)
    : m_id{QUuid::createUuid()},
      m_clock{std::move(clock)},
      m_listeners{std::make_shared<detail::ThreadListenerTable>()}
{
    if (!m_clock)
        m_clock = [] { return int64_t(QDateTime::currentMSecsSinceEpoch()); };

    m_timer.setTimerType(Qt::PreciseTimer);
    m_timer.setInterval(kDefaultIntervalMs);

    QObject::connect(&m_timer, &QTimer::timeout, [this]() { tick(); });
}

Thread::~Thread() noexcept
{
    m_timer.stop();
}

void Thread::start()
{
    if (m_running)
    {
        diag::warn("Thread: start() called while already running.", {}, DiagCode::ThreadAlreadyActive);
        return;
    }

    const int64_t now = m_clock();

    m_last      = now;
    m_frameRate = 0;
    m_deltaTime = 0.0;
    m_window.clear();
    m_running = true;

    dispatch(ThreadEvent::Start, snapshot(now));

    // A Start listener may have stopped us.
    if (m_running)
        m_timer.start();
}

void Thread::stop()
{
    if (!m_running)
    {
        diag::warn("Thread: stop() called while not running.", {}, DiagCode::ThreadAlreadyInactive);
        return;
    }

    m_timer.stop();
    m_running = false;

    const ThreadTick t = snapshot(m_last);
    dispatch(ThreadEvent::Stop, t);
    dispatch(ThreadEvent::Idle, t);
}

void Thread::tick()
{
    if (!m_running)
        return;

    const int64_t now   = m_clock();
    const double  delta = std::min(double(now - m_last), m_maxDeltaMs);

    m_deltaTime = delta / 1000.0 * m_simulationRate;
    m_last      = now;

    while (!m_window.empty() && m_window.front() <= now - kFrameWindowMs)
        m_window.pop_front();

    m_window.push_back(now);
    m_frameRate = int(m_window.size());

    dispatch(ThreadEvent::Update, snapshot(now));
}

ThreadTick Thread::snapshot(int64_t now) const noexcept
{
    ThreadTick t              = {};
    t.timestamp               = now;
    t.deltaTime               = m_deltaTime;
    t.frameRate               = m_frameRate;
    t.lastRegisteredTimestamp = m_last;
    t.simulationUpdateRate    = m_simulationRate;
    return t;
}

ListenerHandle Thread::addEventListener(ThreadEvent event, ThreadListener fn)
{
    return add(event, std::move(fn), false);
}

ListenerHandle Thread::once(ThreadEvent event, ThreadListener fn)
{
    return add(event, std::move(fn), true);
}

ListenerHandle Thread::add(ThreadEvent event, ThreadListener fn, bool once)
{
    if (!fn)
        return {};

    detail::ThreadListenerEntry entry = {};
    entry.id                          = m_listeners->nextId++;
    entry.once                        = once;
    entry.fn                          = std::move(fn);

    const int id = entry.id;
    m_listeners->lists[size_t(event)].push_back(std::move(entry));

    return ListenerHandle(m_listeners, event, id);
}

bool Thread::removeEventListener(ThreadEvent event, int id)
{
    return m_listeners->remove(event, id);
}

void Thread::clearEventListeners(ThreadEvent event)
{
    m_listeners->lists[size_t(event)].clear();
}

void Thread::clearEventListeners()
{
    for (auto& list : m_listeners->lists)
        list.clear();
}

size_t Thread::listenerCount(ThreadEvent event) const noexcept
{
    return m_listeners->lists[size_t(event)].size();
}

void Thread::dispatch(ThreadEvent event, const ThreadTick& tick)
{
    // Listeners may add/remove while we iterate; the snapshot is what fires.
    const std::vector<detail::ThreadListenerEntry> snapshot = m_listeners->lists[size_t(event)];

    for (const detail::ThreadListenerEntry& entry : snapshot)
    {
        if (entry.once)
            m_listeners->remove(event, entry.id);

        entry.fn(tick);
    }
}

bool Thread::setSimulationUpdateRate(double rate)
{
    if (!std::isfinite(rate) || rate <= 0.0)
    {
        diag::error("Thread: Invalid simulation update rate.",
                    {"Value: " + std::to_string(rate), "Keeping: " + std::to_string(m_simulationRate)},
                    DiagCode::ThreadInvalidSimulationRate);
        return false;
    }

    m_simulationRate = rate;
    return true;
}

bool Thread::setMaxDeltaMs(double ms)
{
    if (!std::isfinite(ms) || ms <= 0.0)
    {
        diag::error("Thread: Invalid max delta.",
                    {"Value: " + std::to_string(ms), "Keeping: " + std::to_string(m_maxDeltaMs)},
                    DiagCode::ThreadInvalidMaxDelta);
        return false;
    }

    m_maxDeltaMs = ms;
    return true;
}

bool Thread::setTimerInterval(int ms)
{
    if (ms <= 0)
    {
        diag::error("Thread: Invalid timer interval.",
                    {"Value: " + std::to_string(ms), "Keeping: " + std::to_string(m_timer.interval())},
                    DiagCode::ThreadInvalidInterval);
        return false;
    }

    m_timer.setInterval(ms);
    return true;
}

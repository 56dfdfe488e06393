//=============================================================================
// Thread.hpp
//=============================================================================
#pragma once

#include <QTimer>
#include <QUuid>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

/**
 * @brief Scheduler events, in the order a run produces them.
 */
enum class ThreadEvent : uint8_t
{
    Start  = 0,
    Stop   = 1,
    Idle   = 2,
    Update = 3
};

constexpr size_t kThreadEventCount = 4;

[[nodiscard]] const char* toString(ThreadEvent event) noexcept;

/**
 * @brief Snapshot passed to every listener.
 */
struct ThreadTick
{
    int64_t timestamp               = 0; // ms
    double  deltaTime               = 0.0;
    int     frameRate               = 0;
    int64_t lastRegisteredTimestamp = 0; // ms
    double  simulationUpdateRate    = 60.0;
};

using ThreadListener = std::function<void(const ThreadTick&)>;

namespace detail
{
    struct ThreadListenerEntry
    {
        int            id   = 0;
        bool           once = false;
        ThreadListener fn;
    };

    struct ThreadListenerTable
    {
        std::array<std::vector<ThreadListenerEntry>, kThreadEventCount> lists;

        int nextId = 1;

        bool remove(ThreadEvent event, int id);
    };
} // namespace detail

/**
 * @brief Returned by addEventListener(); unsubscribe() is safe after the Thread is gone.
 */
class ListenerHandle
{
public:
    ListenerHandle() = default;

    [[nodiscard]] int id() const noexcept
    {
        return m_id;
    }

    [[nodiscard]] ThreadEvent event() const noexcept
    {
        return m_event;
    }

    /// Returns false if the listener (or its Thread) no longer exists.
    bool unsubscribe();

private:
    friend class Thread;

    ListenerHandle(std::weak_ptr<detail::ThreadListenerTable> table, ThreadEvent event, int id)
        : m_table{std::move(table)}, m_event{event}, m_id{id}
    {
    }

    std::weak_ptr<detail::ThreadListenerTable> m_table;

    ThreadEvent m_event = ThreadEvent::Update;
    int         m_id    = 0;
};

/**
 * @brief Cooperative frame scheduler on the GUI thread.
 *
 * A precise QTimer calls tick(). Each tick measures the elapsed time with
 * the injected clock (clamped to maxDeltaMs), scales it to simulation
 * steps, counts ticks over the last second and dispatches Update.
 *
 * Nothing here spawns an OS thread; the name is the scheduler's role.
 */
class Thread
{
public:
    using Clock = std::function<int64_t()>;

    static constexpr int     kDefaultIntervalMs   = 16;
    static constexpr double  kDefaultSimulationHz = 60.0;
    static constexpr double  kDefaultMaxDeltaMs   = 250.0;
    static constexpr int64_t kFrameWindowMs       = 1000;

    /// An empty clock means wall-clock milliseconds.
    explicit Thread(Clock clock = {});
    ~Thread() noexcept;

    Thread(const Thread&)            = delete;
    Thread& operator=(const Thread&) = delete;

    void start();
    void stop();

    /// One scheduler step. Called by the timer; public for deterministic driving.
    void tick();

    // ------------------------------------------------------------
    // Listeners
    // ------------------------------------------------------------
    ListenerHandle addEventListener(ThreadEvent event, ThreadListener fn);

    /// Removed before its first (and only) call.
    ListenerHandle once(ThreadEvent event, ThreadListener fn);

    bool removeEventListener(ThreadEvent event, int id);
    void clearEventListeners(ThreadEvent event);
    void clearEventListeners();

    [[nodiscard]] size_t listenerCount(ThreadEvent event) const noexcept;

    // ------------------------------------------------------------
    // Settings
    // ------------------------------------------------------------
    bool setSimulationUpdateRate(double rate);
    bool setMaxDeltaMs(double ms);
    bool setTimerInterval(int ms);

    // ------------------------------------------------------------
    // State
    // ------------------------------------------------------------
    [[nodiscard]] bool isRunning() const noexcept
    {
        return m_running;
    }

    [[nodiscard]] int frameRate() const noexcept
    {
        return m_frameRate;
    }

    [[nodiscard]] double deltaTime() const noexcept
    {
        return m_deltaTime;
    }

    [[nodiscard]] int64_t lastRegisteredTimestamp() const noexcept
    {
        return m_last;
    }

    [[nodiscard]] double simulationUpdateRate() const noexcept
    {
        return m_simulationRate;
    }

    [[nodiscard]] double maxDeltaMs() const noexcept
    {
        return m_maxDeltaMs;
    }

    [[nodiscard]] int timerInterval() const noexcept
    {
        return m_timer.interval();
    }

    [[nodiscard]] const QUuid& id() const noexcept
    {
        return m_id;
    }

private:
    ListenerHandle add(ThreadEvent event, ThreadListener fn, bool once);
    void           dispatch(ThreadEvent event, const ThreadTick& tick);
    ThreadTick     snapshot(int64_t now) const noexcept;

private:
    QUuid  m_id;
    Clock  m_clock;
    QTimer m_timer;

    std::shared_ptr<detail::ThreadListenerTable> m_listeners;

    std::deque<int64_t> m_window;

    double  m_simulationRate = kDefaultSimulationHz;
    double  m_maxDeltaMs     = kDefaultMaxDeltaMs;
    double  m_deltaTime      = 0.0;
    int     m_frameRate      = 0;
    int64_t m_last           = 0;
    bool    m_running        = false;
};

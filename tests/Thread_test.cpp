#include <gtest/gtest.h>
#include <limits>
#include <vector>

#include "TestSupport.hpp"
#include "Thread.hpp"

namespace
{
    struct FakeClock
    {
        int64_t now = 10'000;

        Thread::Clock fn()
        {
            return [this] { return now; };
        }
    };
} // namespace

TEST(Thread, Defaults)
{
    FakeClock clock;
    Thread    thread(clock.fn());

    EXPECT_FALSE(thread.isRunning());
    EXPECT_DOUBLE_EQ(thread.simulationUpdateRate(), 60.0);
    EXPECT_DOUBLE_EQ(thread.maxDeltaMs(), 250.0);
    EXPECT_EQ(thread.frameRate(), 0);
    EXPECT_DOUBLE_EQ(thread.deltaTime(), 0.0);
    EXPECT_EQ(thread.timerInterval(), Thread::kDefaultIntervalMs);
    EXPECT_FALSE(thread.id().isNull());
}

TEST(Thread, StartStopDispatchInOrder)
{
    FakeClock                clock;
    Thread                   thread(clock.fn());
    std::vector<ThreadEvent> seen;

    for (ThreadEvent e : {ThreadEvent::Start, ThreadEvent::Stop, ThreadEvent::Idle})
        thread.addEventListener(e, [&seen, e](const ThreadTick&) { seen.push_back(e); });

    thread.start();
    EXPECT_TRUE(thread.isRunning());
    EXPECT_EQ(thread.lastRegisteredTimestamp(), clock.now);

    thread.stop();
    EXPECT_FALSE(thread.isRunning());

    EXPECT_EQ(seen, (std::vector<ThreadEvent>{ThreadEvent::Start, ThreadEvent::Stop, ThreadEvent::Idle}));
}

TEST(Thread, DoubleStartAndStopWarn)
{
    DiagCapture diag;
    FakeClock   clock;
    Thread      thread(clock.fn());

    int starts = 0;
    thread.addEventListener(ThreadEvent::Start, [&](const ThreadTick&) { ++starts; });

    thread.stop();
    EXPECT_EQ(diag.count(DiagCode::ThreadAlreadyInactive), 1u);

    thread.start();
    thread.start();
    EXPECT_EQ(starts, 1);
    EXPECT_EQ(diag.count(DiagCode::ThreadAlreadyActive), 1u);

    thread.stop();
}

TEST(Thread, TickWhileIdleDoesNothing)
{
    FakeClock clock;
    Thread    thread(clock.fn());

    int updates = 0;
    thread.addEventListener(ThreadEvent::Update, [&](const ThreadTick&) { ++updates; });

    thread.tick();
    EXPECT_EQ(updates, 0);
    EXPECT_EQ(thread.frameRate(), 0);
}

TEST(Thread, FrameRateCountsTicksInLastSecond)
{
    FakeClock clock;
    Thread    thread(clock.fn());
    thread.start();

    for (int i = 0; i < 10; ++i)
    {
        clock.now += 50;
        thread.tick();
    }
    EXPECT_EQ(thread.frameRate(), 10);

    // 1000 ms after the first tick it is evicted (window is (now-1000, now]).
    clock.now += 550;
    thread.tick();
    EXPECT_EQ(thread.frameRate(), 10);

    clock.now += 2000;
    thread.tick();
    EXPECT_EQ(thread.frameRate(), 1);

    thread.stop();
}

TEST(Thread, DeltaTimeIsScaledToSimulationRate)
{
    FakeClock clock;
    Thread    thread(clock.fn());
    thread.start();

    clock.now += 16;
    thread.tick();
    EXPECT_NEAR(thread.deltaTime(), 16.0 / 1000.0 * 60.0, 1e-9);

    ASSERT_TRUE(thread.setSimulationUpdateRate(120.0));
    clock.now += 16;
    thread.tick();
    EXPECT_NEAR(thread.deltaTime(), 16.0 / 1000.0 * 120.0, 1e-9);

    thread.stop();
}

TEST(Thread, LongGapIsClampedToMaxDelta)
{
    FakeClock clock;
    Thread    thread(clock.fn());
    thread.start();

    clock.now += 5000;
    thread.tick();

    EXPECT_NEAR(thread.deltaTime(), 250.0 / 1000.0 * 60.0, 1e-9);
    EXPECT_EQ(thread.lastRegisteredTimestamp(), clock.now);

    thread.stop();
}

TEST(Thread, UpdateCarriesTickSnapshot)
{
    FakeClock clock;
    Thread    thread(clock.fn());

    ThreadTick last = {};
    thread.addEventListener(ThreadEvent::Update, [&](const ThreadTick& t) { last = t; });

    thread.start();
    clock.now += 20;
    thread.tick();

    EXPECT_EQ(last.timestamp, clock.now);
    EXPECT_EQ(last.lastRegisteredTimestamp, clock.now);
    EXPECT_EQ(last.frameRate, 1);
    EXPECT_NEAR(last.deltaTime, 20.0 / 1000.0 * 60.0, 1e-9);
    EXPECT_DOUBLE_EQ(last.simulationUpdateRate, 60.0);

    thread.stop();
}

TEST(Thread, InvalidSettingsKeepPreviousValue)
{
    DiagCapture diag;
    Thread      thread;

    EXPECT_FALSE(thread.setSimulationUpdateRate(0.0));
    EXPECT_FALSE(thread.setSimulationUpdateRate(std::numeric_limits<double>::infinity()));
    EXPECT_DOUBLE_EQ(thread.simulationUpdateRate(), 60.0);
    EXPECT_EQ(diag.count(DiagCode::ThreadInvalidSimulationRate), 2u);

    EXPECT_FALSE(thread.setMaxDeltaMs(-5.0));
    EXPECT_FALSE(thread.setMaxDeltaMs(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_DOUBLE_EQ(thread.maxDeltaMs(), 250.0);
    EXPECT_EQ(diag.count(DiagCode::ThreadInvalidMaxDelta), 2u);

    EXPECT_FALSE(thread.setTimerInterval(0));
    EXPECT_EQ(thread.timerInterval(), Thread::kDefaultIntervalMs);
    EXPECT_TRUE(thread.setTimerInterval(8));
    EXPECT_EQ(thread.timerInterval(), 8);
}

TEST(Thread, OnceListenerFiresOnce)
{
    FakeClock clock;
    Thread    thread(clock.fn());

    int calls = 0;
    thread.once(ThreadEvent::Update, [&](const ThreadTick&) { ++calls; });
    EXPECT_EQ(thread.listenerCount(ThreadEvent::Update), 1u);

    thread.start();
    clock.now += 10;
    thread.tick();
    clock.now += 10;
    thread.tick();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(thread.listenerCount(ThreadEvent::Update), 0u);

    thread.stop();
}

TEST(Thread, HandleUnsubscribes)
{
    FakeClock clock;
    Thread    thread(clock.fn());

    int            calls  = 0;
    ListenerHandle handle = thread.addEventListener(ThreadEvent::Update, [&](const ThreadTick&) { ++calls; });

    EXPECT_TRUE(handle.unsubscribe());
    EXPECT_FALSE(handle.unsubscribe());

    thread.start();
    clock.now += 10;
    thread.tick();
    EXPECT_EQ(calls, 0);

    thread.stop();
}

TEST(Thread, HandleOutlivesThread)
{
    ListenerHandle handle;
    {
        Thread thread;
        handle = thread.addEventListener(ThreadEvent::Start, [](const ThreadTick&) {});
    }

    EXPECT_FALSE(handle.unsubscribe());
}

TEST(Thread, RemoveAndClearListeners)
{
    Thread thread;

    const ListenerHandle a = thread.addEventListener(ThreadEvent::Update, [](const ThreadTick&) {});
    thread.addEventListener(ThreadEvent::Update, [](const ThreadTick&) {});
    thread.addEventListener(ThreadEvent::Start, [](const ThreadTick&) {});

    EXPECT_TRUE(thread.removeEventListener(ThreadEvent::Update, a.id()));
    EXPECT_FALSE(thread.removeEventListener(ThreadEvent::Update, a.id()));
    EXPECT_EQ(thread.listenerCount(ThreadEvent::Update), 1u);

    thread.clearEventListeners(ThreadEvent::Update);
    EXPECT_EQ(thread.listenerCount(ThreadEvent::Update), 0u);
    EXPECT_EQ(thread.listenerCount(ThreadEvent::Start), 1u);

    thread.clearEventListeners();
    EXPECT_EQ(thread.listenerCount(ThreadEvent::Start), 0u);
}

TEST(Thread, ListenersMayChangeTheTableDuringDispatch)
{
    FakeClock        clock;
    Thread           thread(clock.fn());
    std::vector<int> order;

    thread.addEventListener(ThreadEvent::Update, [&](const ThreadTick&) {
        order.push_back(1);
        thread.addEventListener(ThreadEvent::Update, [&](const ThreadTick&) { order.push_back(3); });
    });
    thread.addEventListener(ThreadEvent::Update, [&](const ThreadTick&) { order.push_back(2); });

    thread.start();
    clock.now += 10;
    thread.tick();

    // The listener added mid-dispatch runs from the next tick on.
    EXPECT_EQ(order, (std::vector<int>{1, 2}));

    thread.stop();
}

/**
 * @file test_timer_scheduler.cpp
 * @brief 단일 스레드 타이머 스케줄러 테스트 (수동 시계)
 */

#include <gtest/gtest.h>

#include "Logging/LogManager.h"
#include "Scheduling/TimerScheduler.h"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace HybridLink;
using namespace std::chrono_literals;
using Scheduling::INVALID_TIMER;
using Scheduling::ScopedTimer;
using Scheduling::TimerScheduler;
using Scheduling::TimerToken;

class TimerSchedulerTest : public ::testing::Test {
protected:
    BasicTypes::SteadyTime now_ = BasicTypes::SteadyTime{} + 1h;
    TimerScheduler scheduler_{[this] { return now_; }};

    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
    }

    void Advance(BasicTypes::Duration d) { now_ += d; }
};

TEST_F(TimerSchedulerTest, FiresOnlyAfterDelay) {
    int fired = 0;
    TimerToken token = scheduler_.Schedule(1000ms, [&] { ++fired; });
    ASSERT_NE(token, INVALID_TIMER);
    EXPECT_TRUE(scheduler_.IsPending(token));

    Advance(999ms);
    EXPECT_EQ(scheduler_.RunDue(), 0u);
    EXPECT_EQ(fired, 0);

    Advance(1ms);
    EXPECT_EQ(scheduler_.RunDue(), 1u);
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(scheduler_.IsPending(token));

    // 한 번만 실행
    Advance(10s);
    EXPECT_EQ(scheduler_.RunDue(), 0u);
    EXPECT_EQ(fired, 1);
}

TEST_F(TimerSchedulerTest, RunsInDeadlineOrder) {
    std::vector<std::string> order;
    scheduler_.Schedule(300ms, [&] { order.push_back("c"); });
    scheduler_.Schedule(100ms, [&] { order.push_back("a"); });
    scheduler_.Schedule(200ms, [&] { order.push_back("b"); });

    auto next = scheduler_.NextDeadline();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, now_ + 100ms);

    Advance(1s);
    EXPECT_EQ(scheduler_.RunDue(), 3u);
    EXPECT_EQ(order, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_FALSE(scheduler_.NextDeadline().has_value());
}

TEST_F(TimerSchedulerTest, CancelPreventsCallback) {
    bool fired = false;
    TimerToken token = scheduler_.Schedule(10ms, [&] { fired = true; });

    EXPECT_TRUE(scheduler_.Cancel(token));
    EXPECT_FALSE(scheduler_.Cancel(token));
    EXPECT_EQ(scheduler_.PendingCount(), 0u);

    Advance(1s);
    scheduler_.RunDue();
    EXPECT_FALSE(fired);
}

TEST_F(TimerSchedulerTest, CallbackMayCancelLaterTimer) {
    bool second_fired = false;
    TimerToken second = INVALID_TIMER;
    scheduler_.Schedule(10ms, [&] { scheduler_.Cancel(second); });
    second = scheduler_.Schedule(20ms, [&] { second_fired = true; });

    Advance(1s);
    EXPECT_EQ(scheduler_.RunDue(), 1u);
    EXPECT_FALSE(second_fired);
}

TEST_F(TimerSchedulerTest, EmptyCallbackIsRejected) {
    EXPECT_EQ(scheduler_.Schedule(10ms, nullptr), INVALID_TIMER);
    EXPECT_EQ(scheduler_.PendingCount(), 0u);
}

TEST_F(TimerSchedulerTest, NegativeDelayRunsImmediately) {
    int fired = 0;
    scheduler_.Schedule(-5s, [&] { ++fired; });
    EXPECT_EQ(scheduler_.RunDue(), 1u);
    EXPECT_EQ(fired, 1);
}

TEST_F(TimerSchedulerTest, TimerScheduledDuringRunWaitsForNextRun) {
    int inner = 0;
    scheduler_.Schedule(0ms, [&] {
        scheduler_.Schedule(0ms, [&] { ++inner; });
    });

    EXPECT_EQ(scheduler_.RunDue(), 1u);
    EXPECT_EQ(inner, 0);
    EXPECT_EQ(scheduler_.PendingCount(), 1u);

    EXPECT_EQ(scheduler_.RunDue(), 1u);
    EXPECT_EQ(inner, 1);
}

TEST_F(TimerSchedulerTest, ThrowingCallbackDoesNotStopOthers) {
    bool later_fired = false;
    scheduler_.Schedule(10ms, [] { throw std::runtime_error("boom"); });
    scheduler_.Schedule(20ms, [&] { later_fired = true; });

    Advance(1s);
    EXPECT_NO_THROW(scheduler_.RunDue());
    EXPECT_TRUE(later_fired);
    EXPECT_EQ(scheduler_.PendingCount(), 0u);
}

// =============================================================================
// ScopedTimer
// =============================================================================

TEST_F(TimerSchedulerTest, ScopedTimerCancelsOnDestruction) {
    bool fired = false;
    {
        ScopedTimer timer(scheduler_, scheduler_.Schedule(10ms, [&] { fired = true; }));
        EXPECT_TRUE(timer.IsPending());
    }
    EXPECT_EQ(scheduler_.PendingCount(), 0u);

    Advance(1s);
    scheduler_.RunDue();
    EXPECT_FALSE(fired);
}

TEST_F(TimerSchedulerTest, ScopedTimerMoveTransfersOwnership) {
    ScopedTimer outer;
    EXPECT_FALSE(outer.IsPending());
    {
        ScopedTimer inner(scheduler_, scheduler_.Schedule(10ms, [] {}));
        TimerToken token = inner.Token();
        outer = std::move(inner);
        EXPECT_EQ(outer.Token(), token);
        EXPECT_EQ(inner.Token(), INVALID_TIMER);
    }
    // inner 소멸은 타이머를 건드리지 않는다
    EXPECT_TRUE(outer.IsPending());

    outer.Reset();
    EXPECT_FALSE(outer.IsPending());
    EXPECT_EQ(scheduler_.PendingCount(), 0u);
}

TEST_F(TimerSchedulerTest, ScopedTimerReleaseKeepsTimer) {
    int fired = 0;
    TimerToken released = INVALID_TIMER;
    {
        ScopedTimer timer(scheduler_, scheduler_.Schedule(10ms, [&] { ++fired; }));
        released = timer.Release();
    }
    EXPECT_TRUE(scheduler_.IsPending(released));

    Advance(10ms);
    EXPECT_EQ(scheduler_.RunDue(), 1u);
    EXPECT_EQ(fired, 1);
}

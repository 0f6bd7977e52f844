#ifndef HYBRIDLINK_SCHEDULING_TIMER_SCHEDULER_H
#define HYBRIDLINK_SCHEDULING_TIMER_SCHEDULER_H

/**
 * @file TimerScheduler.h
 * @brief 단일 스레드 지연 콜백 스케줄러
 *
 * 호스트 이벤트 루프가 주기적으로 RunDue() 를 호출해 기한이 지난 콜백을
 * 실행한다. 시계는 주입 가능 (테스트에서 수동 시계 사용).
 */

#include "Common/BasicTypes.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace HybridLink::Scheduling {

using BasicTypes::Duration;
using BasicTypes::SteadyTime;

using TimerToken = uint64_t;
constexpr TimerToken INVALID_TIMER = 0;

using ClockFunction = std::function<SteadyTime()>;

class TimerScheduler {
public:
  using Callback = std::function<void()>;

  explicit TimerScheduler(ClockFunction clock = nullptr);
  TimerScheduler(const TimerScheduler &) = delete;
  TimerScheduler &operator=(const TimerScheduler &) = delete;

  /**
   * @brief delay 후 한 번 실행될 콜백 등록
   * @return 취소용 토큰 (콜백이 비어 있으면 INVALID_TIMER)
   */
  TimerToken Schedule(Duration delay, Callback callback);

  /**
   * @return 대기 중이던 타이머를 취소했으면 true
   */
  bool Cancel(TimerToken token);
  bool IsPending(TimerToken token) const;

  /**
   * @brief 기한이 지난 콜백을 기한 순서로 실행
   * @details 콜백 안에서 새로 등록된 타이머는 다음 호출에서 실행된다
   * @return 실행한 콜백 수
   */
  size_t RunDue();

  size_t PendingCount() const { return timers_.size(); }
  std::optional<SteadyTime> NextDeadline() const;
  SteadyTime Now() const { return clock_(); }

private:
  struct Entry {
    SteadyTime deadline;
    Callback callback;
  };

  ClockFunction clock_;
  TimerToken next_token_ = 1;
  std::map<TimerToken, Entry> timers_;
};

/**
 * @brief 소멸 시 타이머를 취소하는 소유 핸들
 */
class ScopedTimer {
public:
  ScopedTimer() = default;
  ScopedTimer(TimerScheduler &scheduler, TimerToken token)
      : scheduler_(&scheduler), token_(token) {}
  ~ScopedTimer() { Reset(); }

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;
  ScopedTimer(ScopedTimer &&other) noexcept
      : scheduler_(other.scheduler_), token_(other.Release()) {}
  ScopedTimer &operator=(ScopedTimer &&other) noexcept {
    if (this != &other) {
      Reset();
      scheduler_ = other.scheduler_;
      token_ = other.Release();
    }
    return *this;
  }

  // 대기 중인 타이머 취소
  void Reset() {
    if (scheduler_ && token_ != INVALID_TIMER)
      scheduler_->Cancel(token_);
    token_ = INVALID_TIMER;
  }

  // 취소하지 않고 소유권만 포기
  TimerToken Release() {
    TimerToken token = token_;
    token_ = INVALID_TIMER;
    return token;
  }

  TimerToken Token() const { return token_; }
  bool IsPending() const {
    return scheduler_ && token_ != INVALID_TIMER &&
           scheduler_->IsPending(token_);
  }

private:
  TimerScheduler *scheduler_ = nullptr;
  TimerToken token_ = INVALID_TIMER;
};

} // namespace HybridLink::Scheduling

#endif // HYBRIDLINK_SCHEDULING_TIMER_SCHEDULER_H

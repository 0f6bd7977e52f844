#include "Scheduling/TimerScheduler.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace HybridLink::Scheduling {

TimerScheduler::TimerScheduler(ClockFunction clock) : clock_(std::move(clock)) {
  if (!clock_)
    clock_ = [] { return std::chrono::steady_clock::now(); };
}

TimerToken TimerScheduler::Schedule(Duration delay, Callback callback) {
  if (!callback)
    return INVALID_TIMER;
  if (delay.count() < 0)
    delay = Duration::zero();

  TimerToken token = next_token_++;
  timers_.emplace(token, Entry{clock_() + delay, std::move(callback)});
  return token;
}

bool TimerScheduler::Cancel(TimerToken token) {
  return timers_.erase(token) > 0;
}

bool TimerScheduler::IsPending(TimerToken token) const {
  return timers_.find(token) != timers_.end();
}

std::optional<SteadyTime> TimerScheduler::NextDeadline() const {
  if (timers_.empty())
    return std::nullopt;
  auto it = std::min_element(timers_.begin(), timers_.end(),
                             [](const auto &a, const auto &b) {
                               return a.second.deadline < b.second.deadline;
                             });
  return it->second.deadline;
}

size_t TimerScheduler::RunDue() {
  const SteadyTime now = clock_();

  std::vector<std::pair<SteadyTime, TimerToken>> due;
  for (const auto &kv : timers_) {
    if (kv.second.deadline <= now)
      due.emplace_back(kv.second.deadline, kv.first);
  }
  std::sort(due.begin(), due.end());

  size_t fired = 0;
  for (const auto &item : due) {
    // 앞선 콜백이 취소했을 수 있다
    auto it = timers_.find(item.second);
    if (it == timers_.end())
      continue;

    Callback callback = std::move(it->second.callback);
    timers_.erase(it);
    ++fired;

    try {
      callback();
    } catch (const std::exception &e) {
      LogManager::getInstance().Error("timer callback {} failed: {}",
                                      item.second, e.what());
    }
  }
  return fired;
}

} // namespace HybridLink::Scheduling

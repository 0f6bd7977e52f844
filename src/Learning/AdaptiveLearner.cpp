#include "Learning/AdaptiveLearner.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cmath>

namespace HybridLink::Learning {

AdaptiveLearner::AdaptiveLearner(LearnerSettings settings)
    : settings_(settings) {
  if (settings_.history_size == 0)
    settings_.history_size = 1;
  if (settings_.promotion_threshold < 1)
    settings_.promotion_threshold = 1;
}

void AdaptiveLearner::Observe(const LearningKey &key, double raw) {
  ValueHistory &history = histories_[key];
  history.values.push_back(raw);
  while (history.values.size() > settings_.history_size)
    history.values.pop_front();
}

void AdaptiveLearner::Promote(ValueHistory &history, const LearningKey &key,
                              double divisor, LearnSource source) {
  history.learned_divisor = divisor;
  history.source = source;
  history.learned_at = BasicTypes::GetCurrentTimestamp();

  LogManager::getInstance().logModule(
      LogCategory::LEARNER, LogLevel::INFO,
      "learned divisor {} for {}/{} via {} ({})", divisor, key.device,
      key.capability, Enums::ProtocolPathToString(key.path),
      source == LearnSource::VOTE ? "history vote" : "repeated corrections");
}

// =============================================================================
// 규칙 A - 반복 보정
// =============================================================================

std::optional<double>
AdaptiveLearner::ReportCorrection(const LearningKey &key, double divisor) {
  if (divisor <= 0.0 || divisor == 1.0)
    return std::nullopt;

  ValueHistory &history = histories_[key];
  int count = ++history.correction_tally[divisor];

  if (count >= settings_.promotion_threshold &&
      history.learned_divisor != divisor) {
    Promote(history, key, divisor, LearnSource::CORRECTIONS);
    return divisor;
  }
  return std::nullopt;
}

// =============================================================================
// 규칙 B - 이력 다수결
// =============================================================================

std::optional<double>
AdaptiveLearner::DetectByVote(const LearningKey &key,
                              const Profile::ConversionRule &rule) {
  auto it = histories_.find(key);
  if (it == histories_.end())
    return std::nullopt;

  ValueHistory &history = it->second;
  if (history.learned_divisor ||
      history.values.size() < settings_.vote_min_samples ||
      rule.candidate_divisors.empty()) {
    return std::nullopt;
  }

  std::vector<double> candidates = rule.candidate_divisors;
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()),
                   candidates.end());

  const Profile::Range &typical = rule.Typical();
  double best_divisor = 1.0;
  size_t best_score = 0;

  // 오름차순이므로 동점이면 먼저 나온 작은 divisor 가 남는다
  for (double divisor : candidates) {
    size_t score = static_cast<size_t>(
        std::count_if(history.values.begin(), history.values.end(),
                      [&](double raw) {
                        return typical.Contains(rule.ApplyDivisor(raw, divisor));
                      }));
    if (score > best_score) {
      best_score = score;
      best_divisor = divisor;
    }
  }

  if (best_score == 0)
    return std::nullopt;
  if (static_cast<double>(best_score) <
      settings_.vote_ratio * static_cast<double>(history.values.size()))
    return std::nullopt;
  if (best_divisor == 1.0)
    return std::nullopt;

  Promote(history, key, best_divisor, LearnSource::VOTE);
  return best_divisor;
}

// =============================================================================
// 조회 / 초기화
// =============================================================================

std::optional<double>
AdaptiveLearner::GetLearnedDivisor(const LearningKey &key) const {
  auto it = histories_.find(key);
  if (it == histories_.end())
    return std::nullopt;
  return it->second.learned_divisor;
}

void AdaptiveLearner::SetLearnedDivisor(const LearningKey &key,
                                        double divisor) {
  ValueHistory &history = histories_[key];
  history.learned_divisor = divisor;
  history.source = LearnSource::IMPORTED;
  history.learned_at = BasicTypes::GetCurrentTimestamp();
}

bool AdaptiveLearner::Reset(const DeviceId &device,
                            const CapabilityId &capability) {
  bool erased = false;
  for (ProtocolPath path : {ProtocolPath::CLUSTER, ProtocolPath::DATAPOINT}) {
    if (histories_.erase(LearningKey{device, capability, path}) > 0)
      erased = true;
  }
  if (erased) {
    LogManager::getInstance().logModule(LogCategory::LEARNER, LogLevel::INFO,
                                        "learning reset for {}/{}", device,
                                        capability);
  }
  return erased;
}

size_t AdaptiveLearner::ResetDevice(const DeviceId &device) {
  size_t removed = 0;
  for (auto it = histories_.begin(); it != histories_.end();) {
    if (it->first.device == device) {
      it = histories_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::optional<HistoryStats>
AdaptiveLearner::GetStats(const LearningKey &key) const {
  auto it = histories_.find(key);
  if (it == histories_.end())
    return std::nullopt;

  HistoryStats stats;
  stats.history_size = it->second.values.size();
  stats.learned_divisor = it->second.learned_divisor;
  stats.source = it->second.source;
  stats.correction_tally = it->second.correction_tally;
  return stats;
}

std::vector<LearnedEntry> AdaptiveLearner::LearnedDivisors() const {
  std::vector<LearnedEntry> entries;
  for (const auto &kv : histories_) {
    if (kv.second.learned_divisor) {
      entries.push_back(LearnedEntry{kv.first.device, kv.first.capability,
                                     kv.first.path,
                                     *kv.second.learned_divisor});
    }
  }
  std::sort(entries.begin(), entries.end(),
            [](const LearnedEntry &a, const LearnedEntry &b) {
              if (a.device != b.device)
                return a.device < b.device;
              if (a.capability != b.capability)
                return a.capability < b.capability;
              return a.path < b.path;
            });
  return entries;
}

// =============================================================================
// 영속화
// =============================================================================

nlohmann::json AdaptiveLearner::Export() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &entry : LearnedDivisors()) {
    out.push_back({{"device", entry.device},
                   {"capability", entry.capability},
                   {"path", Enums::ProtocolPathToString(entry.path)},
                   {"divisor", entry.divisor}});
  }
  return out;
}

size_t AdaptiveLearner::Import(const nlohmann::json &entries) {
  if (!entries.is_array())
    return 0;

  size_t imported = 0;
  for (const auto &entry : entries) {
    if (!entry.is_object())
      continue;
    auto device = entry.find("device");
    auto capability = entry.find("capability");
    auto divisor = entry.find("divisor");
    if (device == entry.end() || !device->is_string() ||
        capability == entry.end() || !capability->is_string() ||
        divisor == entry.end() || !divisor->is_number()) {
      LogManager::getInstance().log(LogCategory::LEARNER, LogLevel::WARN,
                                    "skipping malformed learned divisor: " +
                                        entry.dump());
      continue;
    }
    ProtocolPath path = ProtocolPath::DATAPOINT;
    auto path_field = entry.find("path");
    if (path_field != entry.end() &&
        (!path_field->is_string() ||
         !Enums::StringToProtocolPath(path_field->get<std::string>(), path))) {
      LogManager::getInstance().log(LogCategory::LEARNER, LogLevel::WARN,
                                    "skipping learned divisor with unknown "
                                    "path: " + entry.dump());
      continue;
    }
    double d = divisor->get<double>();
    if (!(d > 0.0) || !std::isfinite(d)) {
      LogManager::getInstance().log(LogCategory::LEARNER, LogLevel::WARN,
                                    "skipping invalid divisor: " + entry.dump());
      continue;
    }
    SetLearnedDivisor(LearningKey{device->get<std::string>(),
                                  capability->get<std::string>(), path},
                      d);
    ++imported;
  }
  return imported;
}

} // namespace HybridLink::Learning

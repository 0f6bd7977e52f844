#ifndef HYBRIDLINK_LEARNING_ADAPTIVE_LEARNER_H
#define HYBRIDLINK_LEARNING_ADAPTIVE_LEARNER_H

/**
 * @file AdaptiveLearner.h
 * @brief (device, capability, 경로) 별 raw 값 이력으로 스케일 divisor 학습
 *
 * cluster 경로와 DataPoint 경로는 같은 capability 라도 기본 스케일이 다르므로
 * 이력과 학습 divisor 를 경로별로 따로 둔다.
 *
 * 학습 규칙:
 *   A. 같은 divisor 보정이 promotion_threshold 회 이상 성공하면 확정
 *   B. 이력이 vote_min_samples 이상이고 확정 divisor 가 없으면, 후보 divisor
 *      별로 typical 범위에 들어가는 raw 수를 세어 최다 득표(동점이면 작은
 *      divisor)가 이력의 vote_ratio 이상이고 1 이 아니면 즉시 확정
 *
 * 단일 스레드 전용. DeviceSession 이 소유한다.
 */

#include "Common/BasicTypes.h"
#include "Common/Constants.h"
#include "Common/Enums.h"
#include "Profile/ConversionRule.h"

#include <nlohmann/json.hpp>

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace HybridLink::Learning {

using BasicTypes::CapabilityId;
using BasicTypes::DeviceId;
using BasicTypes::Timestamp;
using Enums::ProtocolPath;

struct LearnerSettings {
  size_t history_size = Constants::LEARNER_HISTORY_SIZE;
  int promotion_threshold = Constants::LEARNER_PROMOTION_THRESHOLD;
  size_t vote_min_samples = Constants::LEARNER_VOTE_MIN_SAMPLES;
  double vote_ratio = Constants::LEARNER_VOTE_RATIO;
};

struct LearningKey {
  DeviceId device;
  CapabilityId capability;
  ProtocolPath path = ProtocolPath::DATAPOINT;

  bool operator==(const LearningKey &other) const {
    return device == other.device && capability == other.capability &&
           path == other.path;
  }
};

struct LearningKeyHash {
  size_t operator()(const LearningKey &key) const {
    size_t h1 = std::hash<std::string>{}(key.device);
    size_t h2 = std::hash<std::string>{}(key.capability);
    size_t h = h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    return h ^ (static_cast<size_t>(key.path) + 0x9e3779b97f4a7c15ULL +
                (h << 6) + (h >> 2));
  }
};

enum class LearnSource : uint8_t { NONE = 0, CORRECTIONS = 1, VOTE = 2, IMPORTED = 3 };

struct ValueHistory {
  std::deque<double> values;
  std::optional<double> learned_divisor;
  std::map<double, int> correction_tally;
  LearnSource source = LearnSource::NONE;
  Timestamp learned_at{};
};

struct LearnedEntry {
  DeviceId device;
  CapabilityId capability;
  ProtocolPath path = ProtocolPath::DATAPOINT;
  double divisor = 1.0;
};

struct HistoryStats {
  size_t history_size = 0;
  std::optional<double> learned_divisor;
  LearnSource source = LearnSource::NONE;
  std::map<double, int> correction_tally;
};

class AdaptiveLearner {
public:
  explicit AdaptiveLearner(LearnerSettings settings = {});

  /**
   * @brief raw 관측값을 이력에 추가 (이력은 처음 관측 시 생성)
   */
  void Observe(const LearningKey &key, double raw);

  /**
   * @brief divisor 보정 성공 보고 (규칙 A)
   * @return 이번 보고로 확정되면 확정된 divisor
   */
  std::optional<double> ReportCorrection(const LearningKey &key,
                                         double divisor);

  /**
   * @brief 이력 다수결로 divisor 탐지 (규칙 B)
   * @return 이번 호출로 확정되면 확정된 divisor
   */
  std::optional<double> DetectByVote(const LearningKey &key,
                                     const Profile::ConversionRule &rule);

  std::optional<double> GetLearnedDivisor(const LearningKey &key) const;
  void SetLearnedDivisor(const LearningKey &key, double divisor);

  // 두 경로의 이력을 모두 지운다
  bool Reset(const DeviceId &device, const CapabilityId &capability);
  size_t ResetDevice(const DeviceId &device);

  std::optional<HistoryStats> GetStats(const LearningKey &key) const;
  size_t TrackedKeys() const { return histories_.size(); }
  std::vector<LearnedEntry> LearnedDivisors() const;

  // [{device, capability, path, divisor}, ...]
  // path 가 없는 항목은 DataPoint 경로로 읽는다
  nlohmann::json Export() const;
  size_t Import(const nlohmann::json &entries);

  const LearnerSettings &Settings() const { return settings_; }

private:
  void Promote(ValueHistory &history, const LearningKey &key, double divisor,
               LearnSource source);

  LearnerSettings settings_;
  std::unordered_map<LearningKey, ValueHistory, LearningKeyHash> histories_;
};

} // namespace HybridLink::Learning

#endif // HYBRIDLINK_LEARNING_ADAPTIVE_LEARNER_H

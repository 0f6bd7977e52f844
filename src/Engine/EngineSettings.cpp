#include "Engine/EngineSettings.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <chrono>

namespace HybridLink::Engine {

namespace {

void RejectSetting(const std::string &key, const std::string &value) {
  LogManager::getInstance().log("config", LogLevel::WARN,
                                "잘못된 설정값 무시: " + key + "=" + value);
}

} // namespace

EngineSettings EngineSettings::FromConfig(const ConfigManager &config) {
  EngineSettings settings;

  // =========================================================================
  // 프로토콜 중재
  // =========================================================================
  int window_sec = config.getInt(
      "OBSERVATION_WINDOW_SEC",
      static_cast<int>(Constants::OBSERVATION_WINDOW.count()));
  if (window_sec > 0)
    settings.arbitrator.window = std::chrono::seconds(window_sec);
  else
    RejectSetting("OBSERVATION_WINDOW_SEC", std::to_string(window_sec));

  double factor = config.getDouble("ARBITRATION_MAJORITY_FACTOR",
                                   Constants::ARBITRATION_MAJORITY_FACTOR);
  if (factor >= 1.0)
    settings.arbitrator.majority_factor = factor;
  else
    RejectSetting("ARBITRATION_MAJORITY_FACTOR", std::to_string(factor));

  int max_age = config.getInt(
      "AFFINITY_MAX_AGE_HOURS",
      static_cast<int>(Constants::AFFINITY_MAX_AGE.count()));
  if (max_age > 0)
    settings.arbitrator.max_restore_age = std::chrono::hours(max_age);
  else
    RejectSetting("AFFINITY_MAX_AGE_HOURS", std::to_string(max_age));

  // =========================================================================
  // 학습기
  // =========================================================================
  int history = config.getInt("LEARNER_HISTORY_SIZE",
                              static_cast<int>(Constants::LEARNER_HISTORY_SIZE));
  if (history > 0)
    settings.learner.history_size = static_cast<size_t>(history);
  else
    RejectSetting("LEARNER_HISTORY_SIZE", std::to_string(history));

  int threshold = config.getInt("LEARNER_PROMOTION_THRESHOLD",
                                Constants::LEARNER_PROMOTION_THRESHOLD);
  if (threshold > 0)
    settings.learner.promotion_threshold = threshold;
  else
    RejectSetting("LEARNER_PROMOTION_THRESHOLD", std::to_string(threshold));

  int min_samples =
      config.getInt("LEARNER_VOTE_MIN_SAMPLES",
                    static_cast<int>(Constants::LEARNER_VOTE_MIN_SAMPLES));
  if (min_samples > 0)
    settings.learner.vote_min_samples = static_cast<size_t>(min_samples);
  else
    RejectSetting("LEARNER_VOTE_MIN_SAMPLES", std::to_string(min_samples));

  double ratio =
      config.getDouble("LEARNER_VOTE_RATIO", Constants::LEARNER_VOTE_RATIO);
  if (ratio > 0.0 && ratio <= 1.0)
    settings.learner.vote_ratio = ratio;
  else
    RejectSetting("LEARNER_VOTE_RATIO", std::to_string(ratio));

  if (settings.learner.vote_min_samples > settings.learner.history_size) {
    LogManager::getInstance().log(
        "config", LogLevel::WARN,
        "LEARNER_VOTE_MIN_SAMPLES 가 LEARNER_HISTORY_SIZE 보다 커서 다수결 "
        "학습이 동작하지 않음");
  }

  // =========================================================================
  // 프로필
  // =========================================================================
  settings.profile_file = config.get("PROFILE_FILE");
  settings.load_builtin_profiles =
      config.getBool("LOAD_BUILTIN_PROFILES", true);

  return settings;
}

nlohmann::json EngineSettings::ToJson() const {
  return nlohmann::json{
      {"observationWindowSec",
       std::chrono::duration_cast<std::chrono::seconds>(arbitrator.window)
           .count()},
      {"majorityFactor", arbitrator.majority_factor},
      {"affinityMaxAgeHours", arbitrator.max_restore_age.count()},
      {"learnerHistorySize", learner.history_size},
      {"learnerPromotionThreshold", learner.promotion_threshold},
      {"learnerVoteMinSamples", learner.vote_min_samples},
      {"learnerVoteRatio", learner.vote_ratio},
      {"profileFile", profile_file},
      {"loadBuiltinProfiles", load_builtin_profiles}};
}

} // namespace HybridLink::Engine

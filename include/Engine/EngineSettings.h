#ifndef HYBRIDLINK_ENGINE_ENGINE_SETTINGS_H
#define HYBRIDLINK_ENGINE_ENGINE_SETTINGS_H

/**
 * @file EngineSettings.h
 * @brief HybridEngine 설정값 묶음
 *
 * 설정 키 (hybridlink.env / 환경변수):
 *   OBSERVATION_WINDOW_SEC       관측 창 길이 (기본 900)
 *   ARBITRATION_MAJORITY_FACTOR  경로 판정 배수 (기본 2)
 *   AFFINITY_MAX_AGE_HOURS       복원 가능한 결정의 최대 나이 (기본 24)
 *   LEARNER_HISTORY_SIZE         (기본 20)
 *   LEARNER_PROMOTION_THRESHOLD  (기본 3)
 *   LEARNER_VOTE_MIN_SAMPLES     (기본 5)
 *   LEARNER_VOTE_RATIO           (기본 0.5)
 *   PROFILE_FILE                 추가 프로필 JSON 경로 (선택)
 */

#include "Learning/AdaptiveLearner.h"
#include "Protocol/ProtocolArbitrator.h"

#include <nlohmann/json.hpp>

#include <string>

class ConfigManager;

namespace HybridLink::Engine {

struct EngineSettings {
  Learning::LearnerSettings learner;
  Protocol::ArbitratorSettings arbitrator;
  std::string profile_file;
  bool load_builtin_profiles = true;

  /**
   * @brief ConfigManager 값으로 설정 구성
   * @details 범위를 벗어난 값은 WARN 로그 후 기본값 유지
   */
  static EngineSettings FromConfig(const ConfigManager &config);

  nlohmann::json ToJson() const;
};

} // namespace HybridLink::Engine

#endif // HYBRIDLINK_ENGINE_ENGINE_SETTINGS_H

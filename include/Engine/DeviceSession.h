#ifndef HYBRIDLINK_ENGINE_DEVICE_SESSION_H
#define HYBRIDLINK_ENGINE_DEVICE_SESSION_H

/**
 * @file DeviceSession.h
 * @brief 디바이스 하나의 런타임 상태 (프로필, 학습기, 프로토콜 중재기)
 *
 * 세션이 모든 디바이스별 상태를 단독 소유한다. 제거 시 관측 창 타이머를
 * 취소한다.
 */

#include "Codec/CommandBuilder.h"
#include "Common/Structs.h"
#include "Engine/EngineSettings.h"
#include "Learning/AdaptiveLearner.h"
#include "Profile/CapabilityProfile.h"
#include "Protocol/ProtocolArbitrator.h"
#include "Scheduling/TimerScheduler.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>

namespace HybridLink::Engine {

using BasicTypes::DeviceId;
using BasicTypes::DpValue;
using Enums::ProtocolPath;
using Structs::CapabilityUpdate;
using Structs::DataPointRecord;

class DeviceSession {
public:
  DeviceSession(DeviceId device_id, Profile::DeviceFingerprint fingerprint,
                std::optional<Profile::CapabilityProfile> profile,
                Scheduling::TimerScheduler &scheduler,
                const EngineSettings &settings);
  ~DeviceSession();

  DeviceSession(const DeviceSession &) = delete;
  DeviceSession &operator=(const DeviceSession &) = delete;

  const DeviceId &Id() const { return device_id_; }
  const Profile::DeviceFingerprint &Fingerprint() const { return fingerprint_; }
  const std::optional<Profile::CapabilityProfile> &ActiveProfile() const {
    return profile_;
  }
  bool IsMapped() const { return profile_.has_value(); }

  Protocol::ProtocolArbitrator &Arbitrator() { return *arbitrator_; }
  const Protocol::ProtocolArbitrator &Arbitrator() const { return *arbitrator_; }
  Learning::AdaptiveLearner &Learner() { return learner_; }
  const Learning::AdaptiveLearner &Learner() const { return learner_; }
  Codec::CommandBuilder &Commands() { return commands_; }

  /**
   * @brief 경로/키에 대응하는 capability 매핑
   * @details DataPoint 는 프로필이 있으면 프로필만 (신뢰도 1.0), 없으면
   *          관례 테이블 추론 (0.4). cluster 는 ClusterMap
   */
  std::optional<Profile::ResolvedMapping> Resolve(ProtocolPath path,
                                                  uint32_t key) const;

  /**
   * @brief 이미 해석된 값 하나 관측 (중재기 + 학습기)
   * @param raw 값이 없으면 이벤트 수만 센다
   */
  CapabilityUpdate Observe(ProtocolPath path, uint32_t key,
                           const std::optional<DpValue> &raw);

  /**
   * @brief 디코딩 전 DataPoint 레코드 하나 처리
   */
  CapabilityUpdate ProcessRecord(const DataPointRecord &record);

  // 관측 창 타이머 취소
  void Teardown();

  nlohmann::json Status() const;

private:
  CapabilityUpdate Evaluate(ProtocolPath path, uint32_t key,
                            const std::optional<Profile::ResolvedMapping> &mapping,
                            const DpValue &raw);
  void AssignQuality(CapabilityUpdate &update) const;
  const Profile::CapabilityProfile *ProfilePtr() const {
    return profile_ ? &*profile_ : nullptr;
  }

  DeviceId device_id_;
  Profile::DeviceFingerprint fingerprint_;
  std::optional<Profile::CapabilityProfile> profile_;
  Learning::AdaptiveLearner learner_;
  Codec::CommandBuilder commands_;
  std::unique_ptr<Protocol::ProtocolArbitrator> arbitrator_;

  BasicTypes::Timestamp created_at_;
  size_t updates_ = 0;
  size_t rejected_ = 0;
  size_t unmapped_ = 0;
  size_t type_mismatches_ = 0;
};

} // namespace HybridLink::Engine

#endif // HYBRIDLINK_ENGINE_DEVICE_SESSION_H

#ifndef HYBRIDLINK_PROTOCOL_PROTOCOL_ARBITRATOR_H
#define HYBRIDLINK_PROTOCOL_PROTOCOL_ARBITRATOR_H

/**
 * @file ProtocolArbitrator.h
 * @brief 디바이스 하나의 프로토콜 경로(cluster / DataPoint / hybrid) 판정
 *
 * 상태: OBSERVING -> DECIDED (종료 상태)
 *
 * 초기화 후 관측 창(기본 15분) 동안 경로별 이벤트 수를 센다. 창이 끝나면
 * C = cluster 이벤트 수, T = DataPoint 이벤트 수로
 *   T > 2C  -> DATAPOINT_ONLY
 *   C > 2T  -> CLUSTER_ONLY
 *   그 외   -> HYBRID
 * 로 한 번만 결정한다. 결정 후 이벤트는 세지 않는다.
 */

#include "Common/BasicTypes.h"
#include "Common/Constants.h"
#include "Common/Enums.h"
#include "Profile/CapabilityProfile.h"
#include "Scheduling/TimerScheduler.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <vector>

namespace HybridLink::Protocol {

using BasicTypes::CapabilityId;
using BasicTypes::DeviceId;
using BasicTypes::Duration;
using BasicTypes::Timestamp;
using Enums::ArbitrationState;
using Enums::ProtocolAffinity;
using Enums::ProtocolPath;

struct ArbitratorSettings {
  Duration window = Constants::OBSERVATION_WINDOW;
  double majority_factor = Constants::ARBITRATION_MAJORITY_FACTOR;
  std::chrono::hours max_restore_age = Constants::AFFINITY_MAX_AGE;
};

/**
 * @brief 관측 중 발견한 capability 와 경로별 근거 수
 */
struct DiscoveredCapability {
  CapabilityId capability;
  size_t cluster_hits = 0;
  size_t datapoint_hits = 0;
  double confidence = 0.0; // 가장 높은 근거의 신뢰도
};

/**
 * @brief 저장/복원용 결정 기록
 */
struct PersistedAffinity {
  ProtocolAffinity affinity = ProtocolAffinity::UNDECIDED;
  Timestamp decided_at{};
  int version = Constants::PERSISTED_STATE_VERSION;
};

struct AffinityReport {
  DeviceId device_id;
  ArbitrationState state = ArbitrationState::OBSERVING;
  ProtocolAffinity affinity = ProtocolAffinity::UNDECIDED;
  size_t cluster_hits = 0;
  size_t datapoint_hits = 0;
  std::optional<Timestamp> last_cluster_hit;
  std::optional<Timestamp> last_datapoint_hit;
  std::optional<Timestamp> decided_at;
  bool restored = false;
  std::vector<DiscoveredCapability> discovered;

  nlohmann::json ToJson() const;
};

class ProtocolArbitrator {
public:
  ProtocolArbitrator(DeviceId device_id, Profile::DeviceFingerprint fingerprint,
                     Scheduling::TimerScheduler &scheduler,
                     ArbitratorSettings settings = {});
  ~ProtocolArbitrator() = default;

  // 타이머 콜백이 this 를 잡는다
  ProtocolArbitrator(const ProtocolArbitrator &) = delete;
  ProtocolArbitrator &operator=(const ProtocolArbitrator &) = delete;

  /**
   * @brief 관측 창 시작 (이미 결정됐거나 시작했으면 무시)
   */
  void Start();

  /**
   * @brief 저장된 결정 복원
   * @details 버전이 같고 max_restore_age 이내인 결정만 받아들인다.
   *          복원되면 관측 창 타이머는 취소된다
   */
  bool RestoreDecision(const PersistedAffinity &persisted,
                       Timestamp now = BasicTypes::GetCurrentTimestamp());

  /**
   * @brief 이벤트 하나 관측
   * @param key cluster id 또는 DataPoint id
   * @param profile DataPoint id 해석에 쓸 프로필 (없으면 관례 테이블)
   * @return 관측 중이라 집계됐으면 true
   */
  bool ObserveEvent(ProtocolPath path, uint32_t key,
                    const Profile::CapabilityProfile *profile = nullptr);

  /**
   * @brief 관측 종료 및 판정 (두 번째 호출부터는 기존 결정 반환)
   */
  ProtocolAffinity Decide();

  // 타이머 취소 (디바이스 제거 시)
  void Cancel() { window_timer_.Reset(); }

  static ProtocolAffinity Classify(size_t cluster_hits, size_t datapoint_hits,
                                   double majority_factor);

  ArbitrationState State() const { return state_; }
  ProtocolAffinity Affinity() const { return affinity_; }
  bool IsDecided() const { return state_ == ArbitrationState::DECIDED; }
  bool IsWindowPending() const { return window_timer_.IsPending(); }
  size_t ClusterHits() const { return cluster_hits_; }
  size_t DataPointHits() const { return datapoint_hits_; }

  std::optional<PersistedAffinity> Persisted() const;
  AffinityReport Report() const;

private:
  void Discover(const CapabilityId &capability, ProtocolPath path,
                double confidence);
  void CheckKnownProtocol() const;

  DeviceId device_id_;
  Profile::DeviceFingerprint fingerprint_;
  Scheduling::TimerScheduler &scheduler_;
  ArbitratorSettings settings_;

  ArbitrationState state_ = ArbitrationState::OBSERVING;
  ProtocolAffinity affinity_ = ProtocolAffinity::UNDECIDED;
  size_t cluster_hits_ = 0;
  size_t datapoint_hits_ = 0;
  std::optional<Timestamp> last_cluster_hit_;
  std::optional<Timestamp> last_datapoint_hit_;
  std::optional<Timestamp> decided_at_;
  bool restored_ = false;
  bool started_ = false;

  std::map<CapabilityId, DiscoveredCapability> discovered_;
  Scheduling::ScopedTimer window_timer_;
};

} // namespace HybridLink::Protocol

#endif // HYBRIDLINK_PROTOCOL_PROTOCOL_ARBITRATOR_H

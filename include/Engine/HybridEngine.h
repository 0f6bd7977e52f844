#ifndef HYBRIDLINK_ENGINE_HYBRID_ENGINE_H
#define HYBRIDLINK_ENGINE_HYBRID_ENGINE_H

/**
 * @file HybridEngine.h
 * @brief 다중 디바이스 진입점
 *
 * 역할:
 * - 프로필 레지스트리 구성 (내장 프로필 + PROFILE_FILE)
 * - 디바이스별 DeviceSession 생명주기 관리
 * - 프로토콜 이벤트 / DataPoint 프레임을 세션으로 전달
 * - 학습 divisor 와 프로토콜 결정의 영속 상태 문서 입출력
 *
 * 단일 스레드 전용. 호스트 루프가 RunDueTimers() 를 주기적으로 호출해야
 * 관측 창이 닫힌다.
 */

#include "Common/Structs.h"
#include "Engine/DeviceSession.h"
#include "Engine/EngineSettings.h"
#include "Profile/ProfileRegistry.h"
#include "Scheduling/TimerScheduler.h"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace HybridLink::Engine {

using BasicTypes::ByteBuffer;
using BasicTypes::DataPointId;
using Enums::DpType;
using Enums::ErrorCode;
using Structs::NormalizationResult;

class HybridEngine {
public:
  explicit HybridEngine(EngineSettings settings = {},
                        Scheduling::ClockFunction clock = nullptr);
  ~HybridEngine();

  HybridEngine(const HybridEngine &) = delete;
  HybridEngine &operator=(const HybridEngine &) = delete;

  /**
   * @brief 프로필 레지스트리 채우기
   * @return 등록된 프로필 수
   */
  size_t LoadProfiles();

  Profile::ProfileRegistry &Registry() { return registry_; }
  Scheduling::TimerScheduler &Scheduler() { return scheduler_; }
  size_t RunDueTimers() { return scheduler_.RunDue(); }
  const EngineSettings &Settings() const { return settings_; }

  // ==========================================================================
  // 디바이스 생명주기
  // ==========================================================================

  /**
   * @brief 세션 생성 + 관측 창 시작
   * @details 같은 id 가 있으면 기존 세션을 정리하고 새로 만든다.
   *          가져온 영속 상태가 있으면 이때 적용된다
   */
  bool InitializeDevice(const DeviceId &device_id,
                        const Profile::DeviceFingerprint &fingerprint);
  bool RemoveDevice(const DeviceId &device_id);
  bool HasDevice(const DeviceId &device_id) const;
  size_t DeviceCount() const { return sessions_.size(); }
  std::vector<DeviceId> DeviceIds() const;

  // ==========================================================================
  // 이벤트 처리
  // ==========================================================================

  /**
   * @brief 프로토콜 이벤트 하나 (cluster 속성 보고 또는 해석된 DataPoint)
   */
  CapabilityUpdate ObserveProtocolEvent(const DeviceId &device_id,
                                        ProtocolPath path, uint32_t key,
                                        const std::optional<DpValue> &raw =
                                            std::nullopt);

  /**
   * @brief 0xEF00 채널 프레임 디코딩 후 레코드별 처리
   */
  std::vector<CapabilityUpdate> ProcessDataPointFrame(const DeviceId &device_id,
                                                      const ByteBuffer &input);
  std::vector<CapabilityUpdate> ProcessDataPointFrame(const DeviceId &device_id,
                                                      const std::string &input);

  // 디바이스로 보낼 set 명령 (세션별 트랜잭션 번호 사용)
  std::optional<ByteBuffer> BuildDataPointCommand(const DeviceId &device_id,
                                                  DataPointId id, DpType type,
                                                  const DpValue &value);

  // ==========================================================================
  // 조회
  // ==========================================================================
  std::optional<Protocol::AffinityReport>
  GetProtocolAffinity(const DeviceId &device_id) const;
  std::optional<Profile::CapabilityProfile>
  ResolveProfile(const Profile::DeviceFingerprint &fingerprint) const {
    return registry_.Resolve(fingerprint);
  }
  nlohmann::json GetDeviceStatus(const DeviceId &device_id) const;
  nlohmann::json GetEngineStatus() const;

  // ==========================================================================
  // 학습 초기화
  // ==========================================================================
  bool ResetLearning(const DeviceId &device_id,
                     const BasicTypes::CapabilityId &capability);
  size_t ResetLearning(const DeviceId &device_id);

  // ==========================================================================
  // 영속 상태
  // ==========================================================================

  /**
   * @brief {version, learnedDivisors: [...], affinities: [...]}
   */
  nlohmann::json ExportState() const;

  /**
   * @brief 영속 상태 적용
   * @details 등록된 디바이스는 즉시, 나머지는 InitializeDevice 때 적용
   * @return 문서 구조가 잘못되면 INVALID_STATE_DOCUMENT
   */
  ErrorCode ImportState(const nlohmann::json &document);

  // ==========================================================================
  // 상태 없는 연산
  // ==========================================================================
  static std::vector<DataPointRecord> DecodeFrame(const ByteBuffer &input);
  static std::optional<ByteBuffer> EncodeDataPoint(DataPointId id, DpType type,
                                                   const DpValue &value);
  static NormalizationResult Normalize(const DpValue &raw,
                                       const Profile::ConversionRule &rule);

private:
  DeviceSession *FindSession(const DeviceId &device_id);
  const DeviceSession *FindSession(const DeviceId &device_id) const;
  void ApplyPendingState(DeviceSession &session);
  CapabilityUpdate UnknownDevice(const DeviceId &device_id) const;

  EngineSettings settings_;
  Scheduling::TimerScheduler scheduler_;
  Profile::ProfileRegistry registry_;

  // InitializeDevice 전에 가져온 상태
  std::map<DeviceId, Protocol::PersistedAffinity> pending_affinities_;
  std::map<DeviceId, nlohmann::json> pending_divisors_;

  // 세션은 scheduler_ 보다 먼저 파괴되어야 한다
  std::unordered_map<DeviceId, std::unique_ptr<DeviceSession>> sessions_;
};

} // namespace HybridLink::Engine

#endif // HYBRIDLINK_ENGINE_HYBRID_ENGINE_H

#ifndef HYBRIDLINK_PROFILE_PROFILE_REGISTRY_H
#define HYBRIDLINK_PROFILE_PROFILE_REGISTRY_H

/**
 * @file ProfileRegistry.h
 * @brief fingerprint -> CapabilityProfile 레지스트리
 * @details 읽기 위주 공유 객체. 런타임 등록은 unique lock, 조회는 shared lock.
 */

#include "Profile/CapabilityProfile.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace HybridLink {
namespace Profile {

class ProfileRegistry {
public:
  ProfileRegistry() = default;
  ProfileRegistry(const ProfileRegistry &) = delete;
  ProfileRegistry &operator=(const ProfileRegistry &) = delete;

  /**
   * @brief 내장 프로필 등록
   * @return 등록된 프로필 수
   */
  size_t LoadBuiltinProfiles();

  /**
   * @brief 프로필 등록 (같은 fingerprint 면 덮어쓴다)
   */
  void Register(const DeviceFingerprint &fingerprint,
                CapabilityProfile profile);
  bool Unregister(const DeviceFingerprint &fingerprint);

  /**
   * @brief 대소문자 무시 정확 일치 조회
   * @return 등록되지 않았으면 std::nullopt (unmapped)
   */
  std::optional<CapabilityProfile>
  Resolve(const DeviceFingerprint &fingerprint) const;

  /**
   * @brief JSON 프로필 문서 로드
   * @details {"profiles": [...]} 또는 배열. 잘못된 항목은 건너뛰고 WARN 로그
   * @return 등록된 프로필 수
   */
  size_t LoadProfiles(const nlohmann::json &document);
  size_t LoadProfilesFromFile(const std::string &path);

  /**
   * @brief DataPoint id 관례로 capability 추론 (신뢰도 0.4)
   */
  static std::optional<ResolvedMapping> InferFromDataPoint(DataPointId id);

  size_t Size() const;
  std::vector<DeviceFingerprint> Fingerprints() const;

private:
  static std::optional<std::pair<DeviceFingerprint, CapabilityProfile>>
  ParseProfileEntry(const nlohmann::json &entry, std::string &error);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string,
                     std::pair<DeviceFingerprint, CapabilityProfile>>
      profiles_;
};

} // namespace Profile
} // namespace HybridLink

#endif // HYBRIDLINK_PROFILE_PROFILE_REGISTRY_H

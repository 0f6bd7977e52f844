#ifndef HYBRIDLINK_PROFILE_CAPABILITY_PROFILE_H
#define HYBRIDLINK_PROFILE_CAPABILITY_PROFILE_H

#include "Common/BasicTypes.h"
#include "Profile/ConversionRule.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace HybridLink {
namespace Profile {

using BasicTypes::CapabilityId;
using BasicTypes::DataPointId;

/**
 * @brief 디바이스 식별자 (vendor id + model id), 대소문자 무시 비교
 */
struct DeviceFingerprint {
  std::string vendor_id;
  std::string model_id;

  DeviceFingerprint() = default;
  DeviceFingerprint(std::string vendor, std::string model)
      : vendor_id(std::move(vendor)), model_id(std::move(model)) {}

  // 소문자 "vendor|model"
  std::string Key() const;
  std::string ToString() const { return model_id + "|" + vendor_id; }
};

struct DataPointMapping {
  CapabilityId capability;
  ConversionRule rule;
};

/**
 * @brief fingerprint 하나에 대한 capability 구성
 */
struct CapabilityProfile {
  std::string name;
  std::string product_type;
  std::vector<CapabilityId> capabilities; // 순서 유지, 중복 없음
  std::map<DataPointId, DataPointMapping> data_points;
  nlohmann::json options = nlohmann::json::object();

  bool HasCapability(const CapabilityId &capability) const;

  // 이미 있으면 무시
  void AddCapability(const CapabilityId &capability);

  // capability 목록에 함께 추가
  void MapDataPoint(DataPointId id, const CapabilityId &capability,
                    ConversionRule rule);

  const DataPointMapping *FindDataPoint(DataPointId id) const;

  /**
   * @brief data_points 가 참조하지만 capabilities 에 없는 항목
   */
  std::vector<CapabilityId> MissingCapabilities() const;

  nlohmann::json ToJson() const;
};

/**
 * @brief 프로필/관례 테이블에서 찾은 매핑과 그 신뢰도
 */
struct ResolvedMapping {
  CapabilityId capability;
  ConversionRule rule;
  double confidence = 0.0;
};

} // namespace Profile
} // namespace HybridLink

#endif // HYBRIDLINK_PROFILE_CAPABILITY_PROFILE_H

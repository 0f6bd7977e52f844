#ifndef HYBRIDLINK_PROFILE_KNOWN_MAPPINGS_H
#define HYBRIDLINK_PROFILE_KNOWN_MAPPINGS_H

/**
 * @file KnownMappings.h
 * @brief 정적 매핑 테이블들
 *
 * - ClusterMap           : 표준 cluster id -> capability + 규칙
 * - DataPointConventions : DataPoint id 관례 (프로필 없을 때 추론용, 신뢰도 0.4)
 * - KnownProtocols       : 모델/제조사 -> 예상 프로토콜 경로
 */

#include "Common/BasicTypes.h"
#include "Common/Enums.h"
#include "Profile/CapabilityProfile.h"

#include <optional>
#include <string>
#include <vector>

namespace HybridLink {
namespace Profile {

using BasicTypes::ClusterId;

// =========================================================================
// ClusterMap
// =========================================================================

struct ClusterMapping {
  ClusterId cluster = 0;
  CapabilityId capability;
  ConversionRule rule;
};

class ClusterMap {
public:
  static std::optional<ResolvedMapping> Lookup(ClusterId cluster);
  static const std::vector<ClusterMapping> &All();
};

// =========================================================================
// DataPointConventions
// =========================================================================

class DataPointConventions {
public:
  /**
   * @brief 커뮤니티 관례상 DataPoint id 가 보통 의미하는 capability
   * @details 같은 id 가 제품마다 다른 의미를 갖는 경우가 많아 신뢰도는 낮다
   */
  static std::optional<ResolvedMapping> Lookup(DataPointId id);
};

// =========================================================================
// KnownProtocols
// =========================================================================

struct ProtocolHint {
  Enums::ProtocolAffinity expected = Enums::ProtocolAffinity::UNDECIDED;
  std::string notes;
};

class KnownProtocols {
public:
  static std::optional<ProtocolHint> Lookup(const DeviceFingerprint &fingerprint);
};

} // namespace Profile
} // namespace HybridLink

#endif // HYBRIDLINK_PROFILE_KNOWN_MAPPINGS_H

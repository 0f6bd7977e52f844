#ifndef HYBRIDLINK_PROFILE_BUILTIN_PROFILES_H
#define HYBRIDLINK_PROFILE_BUILTIN_PROFILES_H

#include "Profile/CapabilityProfile.h"

#include <utility>
#include <vector>

namespace HybridLink {
namespace Profile {

// 커뮤니티 진단으로 확인된 DataPoint 매핑
std::vector<std::pair<DeviceFingerprint, CapabilityProfile>> BuiltinProfiles();

} // namespace Profile
} // namespace HybridLink

#endif // HYBRIDLINK_PROFILE_BUILTIN_PROFILES_H

#include "Profile/CapabilityProfile.h"

#include <algorithm>
#include <cctype>

namespace HybridLink {
namespace Profile {

namespace {
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}
} // namespace

std::string DeviceFingerprint::Key() const {
  return ToLower(vendor_id) + "|" + ToLower(model_id);
}

bool CapabilityProfile::HasCapability(const CapabilityId &capability) const {
  return std::find(capabilities.begin(), capabilities.end(), capability) !=
         capabilities.end();
}

void CapabilityProfile::AddCapability(const CapabilityId &capability) {
  if (!HasCapability(capability))
    capabilities.push_back(capability);
}

void CapabilityProfile::MapDataPoint(DataPointId id,
                                     const CapabilityId &capability,
                                     ConversionRule rule) {
  AddCapability(capability);
  data_points[id] = DataPointMapping{capability, std::move(rule)};
}

const DataPointMapping *CapabilityProfile::FindDataPoint(DataPointId id) const {
  auto it = data_points.find(id);
  return it == data_points.end() ? nullptr : &it->second;
}

std::vector<CapabilityId> CapabilityProfile::MissingCapabilities() const {
  std::vector<CapabilityId> missing;
  for (const auto &kv : data_points) {
    const auto &cap = kv.second.capability;
    if (!HasCapability(cap) &&
        std::find(missing.begin(), missing.end(), cap) == missing.end()) {
      missing.push_back(cap);
    }
  }
  return missing;
}

nlohmann::json CapabilityProfile::ToJson() const {
  nlohmann::json j;
  j["name"] = name;
  j["productType"] = product_type;
  j["capabilities"] = capabilities;
  nlohmann::json dps = nlohmann::json::object();
  for (const auto &kv : data_points) {
    nlohmann::json entry = kv.second.rule.ToJson();
    entry["capability"] = kv.second.capability;
    dps[std::to_string(kv.first)] = entry;
  }
  j["dataPoints"] = dps;
  j["options"] = options;
  return j;
}

} // namespace Profile
} // namespace HybridLink

#include "Profile/ProfileRegistry.h"
#include "Logging/LogManager.h"
#include "Profile/BuiltinProfiles.h"
#include "Profile/KnownMappings.h"
#include "Profile/ProductRules.h"

#include <fstream>
#include <mutex>

namespace HybridLink {
namespace Profile {

using json = nlohmann::json;

size_t ProfileRegistry::LoadBuiltinProfiles() {
  size_t count = 0;
  for (auto &entry : BuiltinProfiles()) {
    Register(entry.first, std::move(entry.second));
    ++count;
  }
  LogManager::getInstance().log(LogCategory::REGISTRY, LogLevel::INFO,
                                "builtin profiles loaded: " +
                                    std::to_string(count));
  return count;
}

void ProfileRegistry::Register(const DeviceFingerprint &fingerprint,
                               CapabilityProfile profile) {
  for (const auto &cap : profile.MissingCapabilities()) {
    LogManager::getInstance().logModule(
        LogCategory::REGISTRY, LogLevel::WARN,
        "profile {} maps capability '{}' that is not declared",
        fingerprint.ToString(), cap);
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  profiles_[fingerprint.Key()] =
      std::make_pair(fingerprint, std::move(profile));
}

bool ProfileRegistry::Unregister(const DeviceFingerprint &fingerprint) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return profiles_.erase(fingerprint.Key()) > 0;
}

std::optional<CapabilityProfile>
ProfileRegistry::Resolve(const DeviceFingerprint &fingerprint) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = profiles_.find(fingerprint.Key());
  if (it == profiles_.end())
    return std::nullopt;
  return it->second.second;
}

std::optional<ResolvedMapping>
ProfileRegistry::InferFromDataPoint(DataPointId id) {
  return DataPointConventions::Lookup(id);
}

size_t ProfileRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return profiles_.size();
}

std::vector<DeviceFingerprint> ProfileRegistry::Fingerprints() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<DeviceFingerprint> result;
  result.reserve(profiles_.size());
  for (const auto &kv : profiles_)
    result.push_back(kv.second.first);
  return result;
}

// =============================================================================
// JSON 로딩
// =============================================================================

std::optional<std::pair<DeviceFingerprint, CapabilityProfile>>
ProfileRegistry::ParseProfileEntry(const json &entry, std::string &error) {
  if (!entry.is_object()) {
    error = "entry is not an object";
    return std::nullopt;
  }

  auto vendor = entry.find("vendorId");
  auto model = entry.find("modelId");
  if (vendor == entry.end() || !vendor->is_string() || model == entry.end() ||
      !model->is_string()) {
    error = "vendorId/modelId missing";
    return std::nullopt;
  }

  DeviceFingerprint fingerprint(vendor->get<std::string>(),
                                model->get<std::string>());
  CapabilityProfile profile;

  try {
    profile.name = entry.value("name", fingerprint.ToString());
    profile.product_type = entry.value("productType", std::string("unknown"));

    if (entry.contains("capabilities")) {
      const json &caps = entry.at("capabilities");
      if (!caps.is_array()) {
        error = "capabilities must be an array";
        return std::nullopt;
      }
      for (const auto &cap : caps)
        profile.AddCapability(cap.get<std::string>());
    }
    const bool derive_capabilities = !entry.contains("capabilities");

    if (entry.contains("dataPoints")) {
      const json &dps = entry.at("dataPoints");
      if (!dps.is_object()) {
        error = "dataPoints must be an object";
        return std::nullopt;
      }
      for (auto it = dps.begin(); it != dps.end(); ++it) {
        int id = std::stoi(it.key());
        if (id < 0 || id > 0xFF) {
          error = "data point id out of range: " + it.key();
          return std::nullopt;
        }
        const json &spec = it.value();
        if (!spec.is_object() || !spec.contains("capability")) {
          error = "data point " + it.key() + " has no capability";
          return std::nullopt;
        }
        std::string capability = spec.at("capability").get<std::string>();
        ConversionRule base =
            ProductRules::Find(profile.product_type, capability)
                .value_or(ConversionRule{});
        auto rule = ConversionRule::FromJson(spec, base);
        if (!rule) {
          error = "invalid conversion rule for data point " + it.key();
          return std::nullopt;
        }
        if (derive_capabilities)
          profile.AddCapability(capability);
        profile.data_points[static_cast<DataPointId>(id)] =
            DataPointMapping{capability, std::move(*rule)};
      }
    }

    if (entry.contains("options"))
      profile.options = entry.at("options");
  } catch (const json::exception &e) {
    error = e.what();
    return std::nullopt;
  } catch (const std::logic_error &e) {
    error = e.what();
    return std::nullopt;
  }

  return std::make_pair(std::move(fingerprint), std::move(profile));
}

size_t ProfileRegistry::LoadProfiles(const json &document) {
  const json *entries = &document;
  if (document.is_object() && document.contains("profiles"))
    entries = &document.at("profiles");

  if (!entries->is_array()) {
    LogManager::getInstance().log(LogCategory::REGISTRY, LogLevel::WARN,
                                  "profile document has no profile list");
    return 0;
  }

  size_t loaded = 0;
  size_t index = 0;
  for (const auto &entry : *entries) {
    std::string error;
    auto parsed = ParseProfileEntry(entry, error);
    if (!parsed) {
      LogManager::getInstance().logModule(LogCategory::REGISTRY, LogLevel::WARN,
                                          "skipping profile entry #{}: {}",
                                          index, error);
    } else {
      Register(parsed->first, std::move(parsed->second));
      ++loaded;
    }
    ++index;
  }

  LogManager::getInstance().logModule(LogCategory::REGISTRY, LogLevel::INFO,
                                      "{} of {} profile entries loaded",
                                      loaded, index);
  return loaded;
}

size_t ProfileRegistry::LoadProfilesFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LogManager::getInstance().log(LogCategory::REGISTRY, LogLevel::WARN,
                                  "profile file not found: " + path);
    return 0;
  }

  json document = json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    LogManager::getInstance().log(LogCategory::REGISTRY, LogLevel::LOG_ERROR,
                                  "profile file is not valid JSON: " + path);
    return 0;
  }
  return LoadProfiles(document);
}

} // namespace Profile
} // namespace HybridLink

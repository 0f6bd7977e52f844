#include "Profile/KnownMappings.h"
#include "Common/Constants.h"
#include "Profile/ProductRules.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace HybridLink {
namespace Profile {

namespace {

std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

ConversionRule NamedRule(const std::string &name) {
  auto transform = FindNamedTransform(name);
  return transform ? ConversionRule::Custom(std::move(*transform))
                   : ConversionRule{};
}

} // namespace

// =============================================================================
// ClusterMap
// =============================================================================

const std::vector<ClusterMapping> &ClusterMap::All() {
  static const std::vector<ClusterMapping> mappings = [] {
    std::vector<ClusterMapping> m;
    // genPowerCfg batteryPercentageRemaining (0-200)
    m.push_back({0x0001, "measure_battery",
                 ProductRules::WithDivisor("climate_sensor", "measure_battery",
                                           2)});
    m.push_back({0x0006, "onoff", ConversionRule::BitExtract(0)});
    m.push_back({0x0008, "dim", ProductRules::WithDivisor("light", "dim", 254)});
    m.push_back({0x0102, "windowcoverings_set",
                 ProductRules::WithDivisor("curtain", "windowcoverings_set",
                                           100)});
    m.push_back({0x0201, "measure_temperature",
                 ProductRules::WithDivisor("thermostat", "measure_temperature",
                                           100)});
    m.push_back({0x0400, "measure_luminance", NamedRule("zcl_illuminance")});
    m.push_back({0x0402, "measure_temperature",
                 ProductRules::WithDivisor("climate_sensor",
                                           "measure_temperature", 100)});
    m.push_back({0x0403, "measure_pressure",
                 ProductRules::WithDivisor("climate_sensor", "measure_pressure",
                                           1)});
    m.push_back({0x0405, "measure_humidity",
                 ProductRules::WithDivisor("climate_sensor", "measure_humidity",
                                           100)});
    m.push_back({0x0406, "alarm_motion", ConversionRule::BitExtract(0)});
    // IAS zone status bit0 = alarm1
    m.push_back({0x0500, "alarm_contact", ConversionRule::BitExtract(0)});
    // seMetering currentSummationDelivered (Wh)
    m.push_back({0x0702, "meter_power",
                 ProductRules::WithDivisor("plug", "meter_power", 1000)});
    m.push_back({0x0B04, "measure_power",
                 ProductRules::WithDivisor("plug", "measure_power", 1)});
    return m;
  }();
  return mappings;
}

std::optional<ResolvedMapping> ClusterMap::Lookup(ClusterId cluster) {
  const auto &all = All();
  auto it = std::find_if(all.begin(), all.end(), [cluster](const auto &m) {
    return m.cluster == cluster;
  });
  if (it == all.end())
    return std::nullopt;
  return ResolvedMapping{it->capability, it->rule,
                         Constants::CONFIDENCE_REGISTRY};
}

// =============================================================================
// DataPointConventions
// =============================================================================

std::optional<ResolvedMapping> DataPointConventions::Lookup(DataPointId id) {
  static const std::map<DataPointId, std::pair<CapabilityId, ConversionRule>>
      conventions = {
          {1, {"measure_temperature",
               ProductRules::WithDivisor("climate_sensor",
                                         "measure_temperature", 10)}},
          {2, {"measure_humidity",
               ProductRules::WithDivisor("climate_sensor", "measure_humidity",
                                         1)}},
          {3, {"measure_humidity",
               ProductRules::WithDivisor("climate_sensor", "measure_humidity",
                                         1)}},
          {4, {"measure_battery",
               ProductRules::WithDivisor("climate_sensor", "measure_battery",
                                         1)}},
          {5, {"measure_battery",
               ProductRules::WithDivisor("climate_sensor", "measure_battery",
                                         1)}},
          {6, {"measure_humidity",
               ProductRules::WithDivisor("climate_sensor", "measure_humidity",
                                         1)}},
          {7, {"measure_luminance",
               ProductRules::WithDivisor("motion_sensor", "measure_luminance",
                                         1)}},
          {12, {"measure_luminance",
                ProductRules::WithDivisor("motion_sensor", "measure_luminance",
                                          1)}},
          {14, {"measure_battery", NamedRule("battery_state")}},
          {15, {"measure_battery",
                ProductRules::WithDivisor("climate_sensor", "measure_battery",
                                          1)}},
          {16, {"target_temperature",
                ProductRules::WithDivisor("thermostat", "target_temperature",
                                          10)}},
          {17, {"measure_current",
                ProductRules::WithDivisor("plug", "measure_current", 1000)}},
          {18, {"measure_temperature",
                ProductRules::WithDivisor("climate_sensor",
                                          "measure_temperature", 10)}},
          {20, {"alarm_tamper", ConversionRule::BitExtract(0)}},
          {21, {"measure_voltage",
                ProductRules::WithDivisor("plug", "measure_voltage", 1000)}},
          {22, {"measure_co2",
                ProductRules::WithDivisor("air_quality", "measure_co2", 1)}},
          {23, {"measure_voc",
                ProductRules::WithDivisor("air_quality", "measure_voc", 1)}},
          {24, {"measure_temperature",
                ProductRules::WithDivisor("climate_sensor",
                                          "measure_temperature", 10)}},
          {101, {"alarm_motion", ConversionRule::BitExtract(0)}},
          {103, {"alarm_contact", ConversionRule::BitExtract(0)}},
          {104, {"alarm_water", ConversionRule::BitExtract(0)}},
          {105, {"alarm_smoke", ConversionRule::BitExtract(0)}},
      };

  auto it = conventions.find(id);
  if (it == conventions.end())
    return std::nullopt;
  return ResolvedMapping{it->second.first, it->second.second,
                         Constants::CONFIDENCE_INFERRED};
}

// =============================================================================
// KnownProtocols
// =============================================================================

std::optional<ProtocolHint>
KnownProtocols::Lookup(const DeviceFingerprint &fingerprint) {
  using Enums::ProtocolAffinity;
  static const std::map<std::string, ProtocolHint> by_model = {
      {"TS0601", {ProtocolAffinity::DATAPOINT_ONLY, "DataPoint device (0xEF00)"}},
      {"TS0001", {ProtocolAffinity::CLUSTER_ONLY, "Single switch"}},
      {"TS0002", {ProtocolAffinity::CLUSTER_ONLY, "2-gang switch"}},
      {"TS0003", {ProtocolAffinity::CLUSTER_ONLY, "3-gang switch"}},
      {"TS0004", {ProtocolAffinity::CLUSTER_ONLY, "4-gang switch"}},
      {"TS0011", {ProtocolAffinity::CLUSTER_ONLY, "1-gang no neutral"}},
      {"TS0012", {ProtocolAffinity::CLUSTER_ONLY, "2-gang no neutral"}},
      {"TS0013", {ProtocolAffinity::CLUSTER_ONLY, "3-gang no neutral"}},
      {"TS0014", {ProtocolAffinity::CLUSTER_ONLY, "4-gang no neutral"}},
      {"TS011F", {ProtocolAffinity::HYBRID, "Smart plug/outlet"}},
      {"TS0115", {ProtocolAffinity::HYBRID, "USB outlet"}},
      {"TS0041", {ProtocolAffinity::CLUSTER_ONLY, "1-button scene"}},
      {"TS0042", {ProtocolAffinity::CLUSTER_ONLY, "2-button scene"}},
      {"TS0043", {ProtocolAffinity::CLUSTER_ONLY, "3-button scene"}},
      {"TS0044", {ProtocolAffinity::CLUSTER_ONLY, "4-button scene"}},
      {"TS0201", {ProtocolAffinity::CLUSTER_ONLY, "Climate sensor"}},
      {"TS0202", {ProtocolAffinity::CLUSTER_ONLY, "Motion sensor IAS"}},
      {"TS0203", {ProtocolAffinity::CLUSTER_ONLY, "Contact sensor IAS"}},
      {"TS0207", {ProtocolAffinity::CLUSTER_ONLY, "Water leak IAS"}},
      {"TS0215A", {ProtocolAffinity::HYBRID, "SOS/panic button"}},
      {"TS0501A", {ProtocolAffinity::CLUSTER_ONLY, "Dimmer"}},
      {"TS0501B", {ProtocolAffinity::CLUSTER_ONLY, "Dimmer"}},
      {"TS0502A", {ProtocolAffinity::CLUSTER_ONLY, "Color temp light"}},
      {"TS0502B", {ProtocolAffinity::CLUSTER_ONLY, "Color temp light"}},
      {"TS0503A", {ProtocolAffinity::CLUSTER_ONLY, "RGB light"}},
      {"TS0503B", {ProtocolAffinity::CLUSTER_ONLY, "RGB light"}},
      {"TS0504A", {ProtocolAffinity::CLUSTER_ONLY, "RGBW light"}},
      {"TS0504B", {ProtocolAffinity::CLUSTER_ONLY, "RGBW light"}},
      {"TS0505A", {ProtocolAffinity::CLUSTER_ONLY, "RGBCW light"}},
      {"TS0505B", {ProtocolAffinity::CLUSTER_ONLY, "RGBCW light"}},
  };

  auto it = by_model.find(ToUpper(fingerprint.model_id));
  if (it != by_model.end())
    return it->second;

  // _TZE 계열 제조사는 모델과 상관없이 DataPoint 전용
  std::string vendor = ToUpper(fingerprint.vendor_id);
  if (vendor.rfind("_TZE", 0) == 0) {
    return ProtocolHint{ProtocolAffinity::DATAPOINT_ONLY,
                        "DataPoint vendor prefix"};
  }
  return std::nullopt;
}

} // namespace Profile
} // namespace HybridLink

#include "Profile/ProductRules.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace HybridLink {
namespace Profile {

namespace {

struct RuleSpec {
  double min;
  double max;
  double typical_min;
  double typical_max;
  const char *unit;
  std::vector<double> divisors;
  std::vector<double> multipliers;
  bool auto_correct;
};

using CapabilityTable = std::map<std::string, RuleSpec>;

const std::map<std::string, CapabilityTable> &Table() {
  static const std::map<std::string, CapabilityTable> table = {
      // 일반 플러그 / 콘센트
      {"plug",
       {
           {"measure_power", {0, 4000, 0, 3500, "W", {1, 10, 100, 1000}, {}, true}},
           {"measure_voltage", {80, 280, 100, 250, "V", {1, 10, 100}, {}, true}},
           {"measure_current", {0, 20, 0, 16, "A", {1, 10, 100, 1000}, {}, true}},
           // Wh -> kWh
           {"meter_power",
            {0, 100000, 0, 10000, "kWh", {1, 10, 100, 1000}, {0.001}, true}},
       }},
      // 30A 이상 고출력 플러그
      {"plug_high_power",
       {
           {"measure_power", {0, 8000, 0, 7000, "W", {1, 10, 100}, {}, true}},
           {"measure_current", {0, 40, 0, 32, "A", {1, 10, 100}, {}, true}},
       }},
      {"climate_sensor",
       {
           {"measure_temperature", {-40, 80, -10, 50, "°C", {1, 10, 100}, {}, true}},
           {"measure_humidity", {0, 100, 20, 95, "%", {1, 10}, {}, true}},
           {"measure_pressure", {800, 1200, 950, 1050, "hPa", {1, 10, 100}, {}, true}},
           // 0-200 으로 보고하는 기기가 있다
           {"measure_battery", {0, 100, 0, 100, "%", {1, 2}, {}, true}},
       }},
      {"thermostat",
       {
           {"measure_temperature", {-10, 50, 5, 35, "°C", {1, 10, 100}, {}, true}},
           {"target_temperature", {4, 35, 5, 30, "°C", {1, 10, 100}, {}, true}},
           {"dim", {0, 1, 0, 1, "%", {1, 100}, {}, true}},
       }},
      {"motion_sensor",
       {
           {"measure_luminance", {0, 100000, 0, 10000, "lux", {1, 10}, {}, true}},
           {"measure_battery", {0, 100, 0, 100, "%", {1, 2}, {}, true}},
           {"measure_distance", {0, 10, 0, 8, "m", {1, 100}, {}, true}},
       }},
      {"curtain",
       {
           {"windowcoverings_set", {0, 1, 0, 1, "%", {1, 100}, {}, true}},
           {"dim", {0, 1, 0, 1, "%", {1, 100}, {}, true}},
       }},
      {"light",
       {
           {"dim", {0, 1, 0, 1, "%", {1, 100, 254, 255, 1000}, {}, true}},
           {"light_temperature", {0, 1, 0, 1, "%", {1, 100, 255, 1000}, {}, true}},
           {"light_hue", {0, 1, 0, 1, "", {1, 360, 65535}, {}, true}},
           {"light_saturation", {0, 1, 0, 1, "", {1, 100, 254, 255}, {}, true}},
       }},
      {"air_quality",
       {
           {"measure_co2", {300, 5000, 400, 2000, "ppm", {1}, {}, false}},
           {"measure_pm25", {0, 500, 0, 150, "µg/m³", {1, 10}, {}, true}},
           {"measure_voc", {0, 1000, 0, 500, "ppb", {1, 10}, {}, true}},
       }},
  };
  return table;
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool ContainsAny(const std::string &haystack,
                 std::initializer_list<const char *> needles) {
  for (const char *n : needles) {
    if (haystack.find(n) != std::string::npos)
      return true;
  }
  return false;
}

} // namespace

std::optional<ConversionRule>
ProductRules::Find(const std::string &product_type,
                   const BasicTypes::CapabilityId &capability) {
  const auto &table = Table();
  auto product = table.find(product_type);
  if (product == table.end())
    return std::nullopt;
  auto entry = product->second.find(capability);
  if (entry == product->second.end())
    return std::nullopt;

  const RuleSpec &spec = entry->second;
  ConversionRule rule;
  rule.valid_range = Range(spec.min, spec.max);
  rule.typical_range = Range(spec.typical_min, spec.typical_max);
  rule.candidate_divisors = spec.divisors;
  rule.candidate_multipliers = spec.multipliers;
  rule.auto_correct = spec.auto_correct;
  rule.unit = spec.unit;
  return rule;
}

ConversionRule
ProductRules::WithDivisor(const std::string &product_type,
                          const BasicTypes::CapabilityId &capability,
                          double divisor) {
  ConversionRule rule = Find(product_type, capability).value_or(ConversionRule{});
  DivisorTransform t;
  t.divisor = divisor;
  rule.transform = t;
  return rule;
}

std::string ProductRules::DetectProductType(const std::string &driver_type,
                                            const std::string &vendor_id) {
  const std::string dt = ToLower(driver_type);
  const std::string mfr = ToLower(vendor_id);

  if (ContainsAny(dt, {"30a"}) || ContainsAny(mfr, {"f1bapcit"}))
    return "plug_high_power";
  if (ContainsAny(dt, {"plug", "outlet", "socket", "usb"}))
    return "plug";
  if (ContainsAny(dt, {"thermostat", "radiator", "valve", "trv"}))
    return "thermostat";
  if (ContainsAny(dt, {"climate", "temperature", "humidity"}))
    return "climate_sensor";
  if (ContainsAny(dt, {"motion", "presence", "radar", "pir"}))
    return "motion_sensor";
  if (ContainsAny(dt, {"curtain", "blind", "cover", "shutter"}))
    return "curtain";
  if (ContainsAny(dt, {"light", "bulb", "dimmer", "led"}))
    return "light";
  if (ContainsAny(dt, {"air_quality", "co2", "voc"}))
    return "air_quality";
  return "unknown";
}

std::vector<std::string> ProductRules::ProductTypes() {
  std::vector<std::string> types;
  for (const auto &kv : Table())
    types.push_back(kv.first);
  return types;
}

} // namespace Profile
} // namespace HybridLink

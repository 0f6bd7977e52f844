#include "Profile/BuiltinProfiles.h"
#include "Profile/ProductRules.h"

namespace HybridLink {
namespace Profile {

namespace {

CapabilityProfile ClimateMonitor() {
  CapabilityProfile p;
  p.name = "Climate Monitor Temp+Humidity";
  p.product_type = "climate_sensor";
  p.MapDataPoint(1, "measure_temperature",
                 ProductRules::WithDivisor(p.product_type,
                                           "measure_temperature", 10));
  p.MapDataPoint(2, "measure_humidity",
                 ProductRules::WithDivisor(p.product_type, "measure_humidity",
                                           1));
  p.MapDataPoint(4, "measure_battery",
                 ProductRules::WithDivisor(p.product_type, "measure_battery",
                                           1));
  p.options["settings"] = {{"9", "temp_unit_convert"}, {"10", "max_temp"},
                           {"11", "min_temp"},         {"12", "max_humidity"},
                           {"13", "min_humidity"}};
  return p;
}

CapabilityProfile SoilSensor(bool with_air_humidity) {
  CapabilityProfile p;
  p.name = with_air_humidity ? "Soil Tester Temp+Humidity"
                             : "Soil Sensor Variant";
  p.product_type = "climate_sensor";
  p.MapDataPoint(1, "measure_temperature",
                 ProductRules::WithDivisor(p.product_type,
                                           "measure_temperature", 10));
  p.MapDataPoint(2, "measure_humidity.soil",
                 ProductRules::WithDivisor(p.product_type, "measure_humidity",
                                           1));
  if (with_air_humidity) {
    p.MapDataPoint(3, "measure_humidity",
                   ProductRules::WithDivisor(p.product_type,
                                             "measure_humidity", 1));
    p.MapDataPoint(15, "alarm_battery", ConversionRule::BitExtract(0));
  }
  p.MapDataPoint(4, "measure_battery",
                 ProductRules::WithDivisor(p.product_type, "measure_battery",
                                           1));
  return p;
}

CapabilityProfile RadarPresence(const std::string &name) {
  CapabilityProfile p;
  p.name = name;
  p.product_type = "motion_sensor";
  p.MapDataPoint(1, "alarm_motion", ConversionRule::BitExtract(0));
  p.MapDataPoint(4, "measure_battery",
                 ProductRules::WithDivisor(p.product_type, "measure_battery",
                                           1));
  p.MapDataPoint(12, "measure_luminance",
                 ProductRules::WithDivisor(p.product_type,
                                           "measure_luminance", 1));
  p.options["settings"] = {{"9", "sensitivity"},
                           {"10", "near_detection"},
                           {"11", "far_detection"}};
  return p;
}

CapabilityProfile MeteringPlug() {
  CapabilityProfile p;
  p.name = "Smart Plug with Metering";
  p.product_type = "plug";
  p.MapDataPoint(1, "onoff", ConversionRule::BitExtract(0));
  p.MapDataPoint(18, "measure_current",
                 ProductRules::WithDivisor(p.product_type, "measure_current",
                                           1000));
  p.MapDataPoint(19, "measure_power",
                 ProductRules::WithDivisor(p.product_type, "measure_power",
                                           10));
  p.MapDataPoint(20, "measure_voltage",
                 ProductRules::WithDivisor(p.product_type, "measure_voltage",
                                           10));
  return p;
}

} // namespace

std::vector<std::pair<DeviceFingerprint, CapabilityProfile>> BuiltinProfiles() {
  return {
      {{"_TZE284_vvmbj46n", "TS0601"}, ClimateMonitor()},
      {{"_TZE284_oitavov2", "TS0601"}, SoilSensor(true)},
      {{"_TZE284_qa4yfxk2", "TS0601"}, SoilSensor(false)},
      {{"_TZE200_rhgsbacq", "TS0601"},
       RadarPresence("Presence Sensor Radar mmWave")},
      {{"_TZE200_ztc6ggyl", "TS0601"}, RadarPresence("Radar Presence Sensor")},
      {{"_TZ3000_okaz9tjs", "TS011F"}, MeteringPlug()},
  };
}

} // namespace Profile
} // namespace HybridLink

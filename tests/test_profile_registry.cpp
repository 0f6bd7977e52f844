/**
 * @file test_profile_registry.cpp
 * @brief 프로필 레지스트리 / 정적 매핑 테이블 / 변환 규칙 JSON 테스트
 */

#include <gtest/gtest.h>

#include "Common/Constants.h"
#include "Logging/LogManager.h"
#include "Profile/KnownMappings.h"
#include "Profile/ProductRules.h"
#include "Profile/ProfileRegistry.h"

#include <nlohmann/json.hpp>

#include <string>

using namespace HybridLink;
using Profile::CapabilityProfile;
using Profile::ConversionRule;
using Profile::DeviceFingerprint;
using Profile::ProfileRegistry;
using Profile::Range;
using json = nlohmann::json;

class ProfileRegistryTest : public ::testing::Test {
protected:
    ProfileRegistry registry_;

    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setLogLevel(LogLevel::DEBUG);
    }
};

// =============================================================================
// 내장 프로필 / 조회
// =============================================================================

TEST_F(ProfileRegistryTest, BuiltinProfilesLoad) {
    EXPECT_EQ(registry_.LoadBuiltinProfiles(), 6u);
    EXPECT_EQ(registry_.Size(), 6u);
    EXPECT_EQ(registry_.Fingerprints().size(), 6u);
}

TEST_F(ProfileRegistryTest, ResolveIsCaseInsensitiveExactMatch) {
    registry_.LoadBuiltinProfiles();

    auto profile = registry_.Resolve(DeviceFingerprint("_tze284_VVMBJ46N", "ts0601"));
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->name, "Climate Monitor Temp+Humidity");
    EXPECT_TRUE(profile->HasCapability("measure_temperature"));

    const auto* temperature = profile->FindDataPoint(1);
    ASSERT_NE(temperature, nullptr);
    EXPECT_EQ(temperature->capability, "measure_temperature");
    const auto& transform = std::get<Profile::DivisorTransform>(temperature->rule.transform);
    EXPECT_DOUBLE_EQ(transform.divisor, 10.0);
    EXPECT_EQ(temperature->rule.valid_range, Range(-40, 80));

    // 접두사 / 부분 일치는 unmapped
    EXPECT_FALSE(registry_.Resolve(DeviceFingerprint("_TZE284_vvmbj46", "TS0601")).has_value());
    EXPECT_FALSE(registry_.Resolve(DeviceFingerprint("_TZE284_vvmbj46n", "TS0601A")).has_value());
}

TEST_F(ProfileRegistryTest, RegisterOverwritesSameFingerprint) {
    CapabilityProfile first;
    first.name = "first";
    CapabilityProfile second;
    second.name = "second";

    registry_.Register(DeviceFingerprint("acme", "S1"), first);
    registry_.Register(DeviceFingerprint("ACME", "s1"), second);

    EXPECT_EQ(registry_.Size(), 1u);
    auto resolved = registry_.Resolve(DeviceFingerprint("acme", "S1"));
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->name, "second");

    EXPECT_TRUE(registry_.Unregister(DeviceFingerprint("Acme", "S1")));
    EXPECT_FALSE(registry_.Unregister(DeviceFingerprint("Acme", "S1")));
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(ProfileRegistryTest, MissingCapabilitiesAreReported) {
    CapabilityProfile profile;
    profile.AddCapability("onoff");
    profile.data_points[1] = Profile::DataPointMapping{"onoff", ConversionRule::BitExtract(0)};
    profile.data_points[2] = Profile::DataPointMapping{"measure_power", ConversionRule{}};

    auto missing = profile.MissingCapabilities();
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0], "measure_power");

    // 등록은 실패하지 않는다 (WARN 만)
    registry_.Register(DeviceFingerprint("acme", "P1"), profile);
    EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(ProfileRegistryTest, MapDataPointDeclaresCapabilityOnce) {
    CapabilityProfile profile;
    profile.MapDataPoint(2, "measure_humidity", ConversionRule{});
    profile.MapDataPoint(3, "measure_humidity", ConversionRule{});
    EXPECT_EQ(profile.capabilities.size(), 1u);
    EXPECT_TRUE(profile.MissingCapabilities().empty());
}

// =============================================================================
// JSON 로딩
// =============================================================================

TEST_F(ProfileRegistryTest, LoadProfilesSkipsInvalidEntries) {
    json document = {
        {"profiles", json::array({
            {{"vendorId", "_TZE200_abc"},
             {"modelId", "TS0601"},
             {"productType", "climate_sensor"},
             {"dataPoints", {{"1", {{"capability", "measure_temperature"}, {"divisor", 10}}},
                             {"4", {{"capability", "measure_battery"}, {"divisor", 1}}}}}},
            {{"modelId", "TS0601"}},
            {{"vendorId", "_TZE200_bad"},
             {"modelId", "TS0601"},
             {"dataPoints", {{"300", {{"capability", "x"}}}}}},
            {{"vendorId", "_TZE200_bad2"},
             {"modelId", "TS0601"},
             {"dataPoints", {{"1", {{"capability", "x"}, {"validRange", {5, 1}}}}}}},
            "not an object"
        })}};

    EXPECT_EQ(registry_.LoadProfiles(document), 1u);

    auto profile = registry_.Resolve(DeviceFingerprint("_TZE200_ABC", "TS0601"));
    ASSERT_TRUE(profile.has_value());
    // capabilities 가 없으면 dataPoints 에서 만든다
    EXPECT_EQ(profile->capabilities.size(), 2u);
    EXPECT_EQ(profile->product_type, "climate_sensor");

    // product rule 범위/후보가 기본값으로 들어간다
    const auto* temperature = profile->FindDataPoint(1);
    ASSERT_NE(temperature, nullptr);
    EXPECT_EQ(temperature->rule.valid_range, Range(-40, 80));
    ASSERT_TRUE(temperature->rule.typical_range.has_value());
    EXPECT_EQ(*temperature->rule.typical_range, Range(-10, 50));
    EXPECT_EQ(temperature->rule.candidate_divisors, (std::vector<double>{1, 10, 100}));
}

TEST_F(ProfileRegistryTest, LoadProfilesRejectsNonListDocument) {
    EXPECT_EQ(registry_.LoadProfiles(json{{"profiles", "none"}}), 0u);
    EXPECT_EQ(registry_.LoadProfiles(json(42)), 0u);
    EXPECT_EQ(registry_.Size(), 0u);
}

TEST_F(ProfileRegistryTest, LoadProfilesFromFile) {
    const std::string path = std::string(HYBRIDLINK_TEST_DATA_DIR) + "/profiles_test.json";
    EXPECT_EQ(registry_.LoadProfilesFromFile(path), 1u);

    auto profile = registry_.Resolve(DeviceFingerprint("_TZE204_test0001", "TS0601"));
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile->name, "Test Thermostat");
    const auto* mode = profile->FindDataPoint(2);
    ASSERT_NE(mode, nullptr);
    EXPECT_EQ(mode->rule.Kind(), Enums::ConversionKind::ENUM_MAP);

    EXPECT_EQ(registry_.LoadProfilesFromFile(path + ".missing"), 0u);
}

// =============================================================================
// 관례 / 정적 테이블
// =============================================================================

TEST_F(ProfileRegistryTest, InferFromDataPointHasLowConfidence) {
    auto inferred = ProfileRegistry::InferFromDataPoint(1);
    ASSERT_TRUE(inferred.has_value());
    EXPECT_EQ(inferred->capability, "measure_temperature");
    EXPECT_DOUBLE_EQ(inferred->confidence, Constants::CONFIDENCE_INFERRED);
    EXPECT_LT(inferred->confidence, Constants::CONFIDENCE_REGISTRY);

    auto motion = ProfileRegistry::InferFromDataPoint(101);
    ASSERT_TRUE(motion.has_value());
    EXPECT_EQ(motion->rule.Kind(), Enums::ConversionKind::BIT_EXTRACT);

    EXPECT_FALSE(ProfileRegistry::InferFromDataPoint(200).has_value());
}

TEST_F(ProfileRegistryTest, ClusterMapLookup) {
    auto temperature = Profile::ClusterMap::Lookup(0x0402);
    ASSERT_TRUE(temperature.has_value());
    EXPECT_EQ(temperature->capability, "measure_temperature");
    EXPECT_DOUBLE_EQ(temperature->confidence, Constants::CONFIDENCE_REGISTRY);

    EXPECT_FALSE(Profile::ClusterMap::Lookup(0x1234).has_value());
}

TEST_F(ProfileRegistryTest, KnownProtocolHints) {
    using Enums::ProtocolAffinity;

    auto tuya = Profile::KnownProtocols::Lookup(DeviceFingerprint("_TZE200_x", "TS0601"));
    ASSERT_TRUE(tuya.has_value());
    EXPECT_EQ(tuya->expected, ProtocolAffinity::DATAPOINT_ONLY);

    auto plug = Profile::KnownProtocols::Lookup(DeviceFingerprint("_TZ3000_x", "ts011f"));
    ASSERT_TRUE(plug.has_value());
    EXPECT_EQ(plug->expected, ProtocolAffinity::HYBRID);

    auto by_vendor = Profile::KnownProtocols::Lookup(DeviceFingerprint("_TZE204_y", "CUSTOM"));
    ASSERT_TRUE(by_vendor.has_value());
    EXPECT_EQ(by_vendor->expected, ProtocolAffinity::DATAPOINT_ONLY);

    EXPECT_FALSE(Profile::KnownProtocols::Lookup(DeviceFingerprint("acme", "X1")).has_value());
}

TEST_F(ProfileRegistryTest, DetectProductType) {
    using Profile::ProductRules;
    EXPECT_EQ(ProductRules::DetectProductType("smart plug 30A"), "plug_high_power");
    EXPECT_EQ(ProductRules::DetectProductType("usb outlet"), "plug");
    EXPECT_EQ(ProductRules::DetectProductType("radar presence"), "motion_sensor");
    EXPECT_EQ(ProductRules::DetectProductType("radiator valve"), "thermostat");
    EXPECT_EQ(ProductRules::DetectProductType("plug", "_TZ3000_f1bapcit"), "plug_high_power");
    EXPECT_EQ(ProductRules::DetectProductType("doorbell"), "unknown");

    EXPECT_FALSE(ProductRules::Find("plug", "measure_temperature").has_value());
    EXPECT_FALSE(ProductRules::Find("toaster", "measure_power").has_value());
}

// =============================================================================
// 변환 규칙 JSON
// =============================================================================

TEST_F(ProfileRegistryTest, ConversionRuleFromJson) {
    auto divisor = ConversionRule::FromJson(
        json{{"divisor", 100}, {"validRange", {0, 100}}, {"candidateDivisors", {10, 100}}});
    ASSERT_TRUE(divisor.has_value());
    EXPECT_EQ(divisor->Kind(), Enums::ConversionKind::DIVISOR);
    EXPECT_DOUBLE_EQ(divisor->ApplyScaling(3500), 35.0);
    EXPECT_TRUE(divisor->IsScaling());

    auto named = ConversionRule::FromJson(json{{"transform", "battery_state"}});
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(named->Kind(), Enums::ConversionKind::CUSTOM);
    EXPECT_FALSE(named->auto_correct);

    auto enumerated = ConversionRule::FromJson(json{{"enum", {{"0", "off"}, {"1", "on"}}}});
    ASSERT_TRUE(enumerated.has_value());
    EXPECT_EQ(enumerated->ToJson()["enum"]["1"], "on");

    EXPECT_FALSE(ConversionRule::FromJson(json{{"divisor", 0}}).has_value());
    EXPECT_FALSE(ConversionRule::FromJson(json{{"bit", 40}}).has_value());
    EXPECT_FALSE(ConversionRule::FromJson(json{{"transform", "nope"}}).has_value());
    EXPECT_FALSE(ConversionRule::FromJson(json{{"candidateDivisors", {10, -1}}}).has_value());
    EXPECT_FALSE(ConversionRule::FromJson(json{{"enum", {{"x", "off"}}}}).has_value());
    EXPECT_FALSE(ConversionRule::FromJson(json::array()).has_value());
}

#ifndef HYBRIDLINK_PROFILE_PRODUCT_RULES_H
#define HYBRIDLINK_PROFILE_PRODUCT_RULES_H

/**
 * @file ProductRules.h
 * @brief 제품 유형별 capability 값 범위와 보정 후보
 *
 * 제품 유형: plug, plug_high_power, climate_sensor, thermostat,
 *            motion_sensor, curtain, light, air_quality
 */

#include "Common/BasicTypes.h"
#include "Profile/ConversionRule.h"

#include <optional>
#include <string>
#include <vector>

namespace HybridLink {
namespace Profile {

class ProductRules {
public:
  /**
   * @return 항등 변환(divisor 1)에 범위/후보가 채워진 규칙
   */
  static std::optional<ConversionRule>
  Find(const std::string &product_type,
       const BasicTypes::CapabilityId &capability);

  /**
   * @brief product rule 에 기본 divisor 를 얹은 규칙 (없으면 범위 없는 규칙)
   */
  static ConversionRule WithDivisor(const std::string &product_type,
                                    const BasicTypes::CapabilityId &capability,
                                    double divisor);

  /**
   * @brief 드라이버 유형 / 제조사 문자열 키워드로 제품 유형 추정
   * @return 해당 없으면 "unknown"
   */
  static std::string DetectProductType(const std::string &driver_type,
                                       const std::string &vendor_id = "");

  static std::vector<std::string> ProductTypes();
};

} // namespace Profile
} // namespace HybridLink

#endif // HYBRIDLINK_PROFILE_PRODUCT_RULES_H

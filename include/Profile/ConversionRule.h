#ifndef HYBRIDLINK_PROFILE_CONVERSION_RULE_H
#define HYBRIDLINK_PROFILE_CONVERSION_RULE_H

/**
 * @file ConversionRule.h
 * @brief capability 별 값 변환 규칙
 *
 * 변환 방식은 닫힌 variant (divisor / multiplier / bit 추출 / enum 매핑 /
 * custom) 이고, 스케일링 방식(divisor, multiplier)만 범위 검증과 자동 보정의
 * 대상이 된다.
 */

#include "Common/BasicTypes.h"
#include "Common/Enums.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace HybridLink {
namespace Profile {

using BasicTypes::DpValue;
using BasicTypes::SemanticValue;

struct Range {
  double min = std::numeric_limits<double>::lowest();
  double max = std::numeric_limits<double>::max();

  Range() = default;
  Range(double lo, double hi) : min(lo), max(hi) {}

  bool Contains(double v) const { return v >= min && v <= max; }
  bool operator==(const Range &o) const { return min == o.min && max == o.max; }
};

// =========================================================================
// 변환 방식
// =========================================================================

struct DivisorTransform {
  double divisor = 1.0;
  double multiplier = 1.0;
  double offset = 0.0;
};

struct MultiplierTransform {
  double multiplier = 1.0;
  double offset = 0.0;
};

struct BitExtractTransform {
  uint8_t bit = 0;
};

struct EnumMapTransform {
  std::map<uint8_t, std::string> names;
};

struct CustomTransform {
  std::string name;
  std::function<std::optional<SemanticValue>(const DpValue &)> apply;
};

using ConversionTransform =
    std::variant<DivisorTransform, MultiplierTransform, BitExtractTransform,
                 EnumMapTransform, CustomTransform>;

// =========================================================================
// 규칙
// =========================================================================

struct ConversionRule {
  ConversionTransform transform = DivisorTransform{};
  Range valid_range;
  std::optional<Range> typical_range; // 없으면 valid_range 와 동일
  std::vector<double> candidate_divisors;
  std::vector<double> candidate_multipliers;
  bool auto_correct = true;
  bool signed_value = true;
  std::string unit;

  Enums::ConversionKind Kind() const;
  bool IsScaling() const {
    return std::holds_alternative<DivisorTransform>(transform) ||
           std::holds_alternative<MultiplierTransform>(transform);
  }
  const Range &Typical() const {
    return typical_range ? *typical_range : valid_range;
  }

  /**
   * @brief raw 수치에 기본 스케일링(divisor/multiplier/offset) 적용
   * @details 스케일링 방식이 아니면 raw 그대로
   */
  double ApplyScaling(double raw) const;

  // 보정 후보 적용: 기본 divisor 대신 주어진 divisor (multiplier/offset 유지)
  double ApplyDivisor(double raw, double divisor) const;
  double ApplyMultiplier(double raw, double multiplier) const;

  // ApplyMultiplier(raw, m) 와 같은 결과를 내는 ApplyDivisor 용 divisor
  double MultiplierAsDivisor(double multiplier) const;

  // 자주 쓰는 규칙 생성 헬퍼
  static ConversionRule Divisor(double divisor, Range valid,
                                std::vector<double> candidates = {},
                                std::string unit = "");
  static ConversionRule Identity(Range valid = {}, std::string unit = "");
  static ConversionRule BitExtract(uint8_t bit);
  static ConversionRule EnumMap(std::map<uint8_t, std::string> names);
  static ConversionRule Custom(CustomTransform transform);

  nlohmann::json ToJson() const;

  /**
   * @brief JSON 규칙 해석
   * @param base 누락된 필드의 기본값 (product rule 등)
   * @return 형식이 잘못되면 std::nullopt
   */
  static std::optional<ConversionRule> FromJson(const nlohmann::json &j,
                                                const ConversionRule &base);
  static std::optional<ConversionRule> FromJson(const nlohmann::json &j);
};

/**
 * @brief 이름으로 등록된 custom 변환 조회
 * @details "battery_state", "inverted_percent", "zcl_illuminance"
 */
std::optional<CustomTransform> FindNamedTransform(const std::string &name);

} // namespace Profile
} // namespace HybridLink

#endif // HYBRIDLINK_PROFILE_CONVERSION_RULE_H

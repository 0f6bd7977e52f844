#ifndef HYBRIDLINK_NORMALIZER_VALUE_NORMALIZER_H
#define HYBRIDLINK_NORMALIZER_VALUE_NORMALIZER_H

/**
 * @file ValueNormalizer.h
 * @brief raw DataPoint 값 -> 의미 단위 값 변환 및 범위 보정
 *
 * 처리 순서:
 *   1. 직접 변환 (bit 추출 / enum 매핑 / custom) 은 적용 후 바로 반환
 *   2. 기본 스케일링 결과가 valid 범위 안이면 그대로 (NONE)
 *   3. 후보 divisor 를 큰 것부터 (1 제외) 시도. typical 범위 착지를 우선,
 *      없으면 valid 범위에 처음 들어온 divisor (DIVISOR)
 *   4. 후보 multiplier 를 같은 방식으로 (MULTIPLIER)
 *   5. min 미만은 min 으로 clamp (CLAMPED_MIN), max 초과는 거부 (REJECTED)
 */

#include "Common/BasicTypes.h"
#include "Common/Structs.h"
#include "Learning/AdaptiveLearner.h"
#include "Profile/ConversionRule.h"

#include <optional>
#include <string>

namespace HybridLink::Normalizer {

using BasicTypes::CapabilityId;
using BasicTypes::DeviceId;
using BasicTypes::DpValue;
using Profile::ConversionRule;
using Structs::NormalizationResult;

class ValueNormalizer {
public:
  /**
   * @brief 상태 없는 정규화
   * @details 예외를 던지지 않는다. 해석할 수 없는 값은 REJECTED 로 돌려준다
   */
  static NormalizationResult Normalize(const DpValue &raw,
                                       const ConversionRule &rule);

  /**
   * @brief 학습기를 거치는 정규화
   *
   * raw 수치를 이력에 기록하고, 학습된 divisor 가 있으면 바로 적용한다
   * (valid 범위를 벗어날 때만 전체 탐색). 전체 탐색에서 divisor 보정이
   * 성공하면 학습기에 보고하고 (multiplier 보정은 같은 값을 내는 divisor 로
   * 환산), 마지막으로 이력 다수결을 시도한다.
   */
  static NormalizationResult NormalizeFor(Learning::AdaptiveLearner &learner,
                                          const Learning::LearningKey &key,
                                          const DpValue &raw,
                                          const ConversionRule &rule);

private:
  static NormalizationResult ApplyDirect(const DpValue &raw,
                                         const ConversionRule &rule);
  static NormalizationResult ApplyScaling(double raw,
                                          const ConversionRule &rule);
  static std::optional<double> SearchDivisor(double raw,
                                             const ConversionRule &rule,
                                             double &value);
  static std::optional<double> SearchMultiplier(double raw,
                                                const ConversionRule &rule,
                                                double &value);
  static NormalizationResult Rejected(double raw, std::string message);
};

} // namespace HybridLink::Normalizer

#endif // HYBRIDLINK_NORMALIZER_VALUE_NORMALIZER_H

#include "Normalizer/ValueNormalizer.h"
#include "Logging/LogManager.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <type_traits>
#include <vector>

namespace HybridLink::Normalizer {

using Enums::CorrectionKind;
using Profile::BitExtractTransform;
using Profile::CustomTransform;
using Profile::DivisorTransform;
using Profile::EnumMapTransform;
using Profile::MultiplierTransform;
using BasicTypes::SemanticValue;

namespace {

// bit 추출 / enum 매핑용 정수 해석. string 은 정수로 보지 않는다
std::optional<uint32_t> ToIntegral(const DpValue &raw) {
  return std::visit(
      [](auto &&arg) -> std::optional<uint32_t> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
          return arg ? 1u : 0u;
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return static_cast<uint32_t>(arg);
        } else if constexpr (std::is_same_v<T, uint32_t>) {
          return arg;
        } else if constexpr (std::is_same_v<T, BasicTypes::EnumValue>) {
          return static_cast<uint32_t>(arg.ordinal);
        } else if constexpr (std::is_same_v<T, BasicTypes::ByteBuffer>) {
          auto v = BasicTypes::DpValueToDouble(arg);
          if (!v)
            return std::nullopt;
          return static_cast<uint32_t>(*v);
        } else {
          return std::nullopt;
        }
      },
      raw);
}

// 내림차순, 중복 제거, 1 이하 제외
std::vector<double> LargestFirst(const std::vector<double> &candidates) {
  std::vector<double> sorted;
  for (double c : candidates) {
    if (c > 0.0 && c != 1.0 && std::isfinite(c))
      sorted.push_back(c);
  }
  std::sort(sorted.begin(), sorted.end(), std::greater<double>());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
  return sorted;
}

NormalizationResult Accepted(SemanticValue value, CorrectionKind kind,
                             double raw) {
  NormalizationResult result;
  result.is_valid = true;
  result.corrected_value = std::move(value);
  result.correction = kind;
  result.raw_numeric = raw;
  return result;
}

} // namespace

NormalizationResult ValueNormalizer::Rejected(double raw,
                                              std::string message) {
  NormalizationResult result;
  result.is_valid = false;
  result.correction = CorrectionKind::REJECTED;
  result.raw_numeric = raw;
  result.message = std::move(message);
  return result;
}

// =============================================================================
// 직접 변환
// =============================================================================

NormalizationResult ValueNormalizer::ApplyDirect(const DpValue &raw,
                                                 const ConversionRule &rule) {
  const double raw_numeric =
      BasicTypes::DpValueToDouble(raw).value_or(0.0);

  if (const auto *bit = std::get_if<BitExtractTransform>(&rule.transform)) {
    auto integral = ToIntegral(raw);
    if (!integral || bit->bit > 31)
      return Rejected(raw_numeric, "value has no bit representation");
    bool set = ((*integral >> bit->bit) & 0x1u) != 0;
    return Accepted(SemanticValue(set), CorrectionKind::NONE, raw_numeric);
  }

  if (const auto *en = std::get_if<EnumMapTransform>(&rule.transform)) {
    auto integral = ToIntegral(raw);
    if (integral && *integral <= 0xFF) {
      auto it = en->names.find(static_cast<uint8_t>(*integral));
      if (it != en->names.end())
        return Accepted(SemanticValue(it->second), CorrectionKind::NONE,
                        raw_numeric);
    }
    // 디코딩 단계에서 이미 이름이 붙은 경우
    if (const auto *ev = std::get_if<BasicTypes::EnumValue>(&raw)) {
      if (!ev->name.empty())
        return Accepted(SemanticValue(ev->name), CorrectionKind::NONE,
                        raw_numeric);
    }
    return Rejected(raw_numeric, "ordinal " + BasicTypes::DpValueToString(raw) +
                                     " has no enum name");
  }

  const auto &custom = std::get<CustomTransform>(rule.transform);
  if (!custom.apply)
    return Rejected(raw_numeric, "custom transform '" + custom.name +
                                     "' has no function");
  auto value = custom.apply(raw);
  if (!value)
    return Rejected(raw_numeric,
                    "custom transform '" + custom.name + "' rejected value");
  if (const double *d = std::get_if<double>(&*value)) {
    if (!std::isfinite(*d) || !rule.valid_range.Contains(*d))
      return Rejected(raw_numeric, "custom transform '" + custom.name +
                                       "' result out of range");
  }
  return Accepted(std::move(*value), CorrectionKind::NONE, raw_numeric);
}

// =============================================================================
// 보정 탐색
// =============================================================================

std::optional<double> ValueNormalizer::SearchDivisor(double raw,
                                                     const ConversionRule &rule,
                                                     double &value) {
  std::optional<double> fallback;
  double fallback_value = 0.0;
  const Profile::Range &typical = rule.Typical();

  for (double divisor : LargestFirst(rule.candidate_divisors)) {
    double v = rule.ApplyDivisor(raw, divisor);
    if (!rule.valid_range.Contains(v))
      continue;
    if (typical.Contains(v)) {
      value = v;
      return divisor;
    }
    if (!fallback) {
      fallback = divisor;
      fallback_value = v;
    }
  }

  if (fallback)
    value = fallback_value;
  return fallback;
}

std::optional<double>
ValueNormalizer::SearchMultiplier(double raw, const ConversionRule &rule,
                                  double &value) {
  std::optional<double> fallback;
  double fallback_value = 0.0;
  const Profile::Range &typical = rule.Typical();

  for (double multiplier : LargestFirst(rule.candidate_multipliers)) {
    double v = rule.ApplyMultiplier(raw, multiplier);
    if (!rule.valid_range.Contains(v))
      continue;
    if (typical.Contains(v)) {
      value = v;
      return multiplier;
    }
    if (!fallback) {
      fallback = multiplier;
      fallback_value = v;
    }
  }

  if (fallback)
    value = fallback_value;
  return fallback;
}

NormalizationResult ValueNormalizer::ApplyScaling(double raw,
                                                  const ConversionRule &rule) {
  const double candidate = rule.ApplyScaling(raw);
  if (!std::isfinite(candidate))
    return Rejected(raw, "scaled value is not finite");

  if (rule.valid_range.Contains(candidate))
    return Accepted(SemanticValue(candidate), CorrectionKind::NONE, raw);

  if (!rule.auto_correct) {
    return Rejected(raw, "value " + std::to_string(candidate) +
                             " out of range and auto correction is disabled");
  }

  double corrected = 0.0;
  if (auto divisor = SearchDivisor(raw, rule, corrected)) {
    NormalizationResult result =
        Accepted(SemanticValue(corrected), CorrectionKind::DIVISOR, raw);
    result.applied_divisor = *divisor;
    LogManager::getInstance().logModule(
        LogCategory::NORMALIZER, LogLevel::DEBUG,
        "corrected {} -> {} via divisor {}", raw, corrected, *divisor);
    return result;
  }

  if (auto multiplier = SearchMultiplier(raw, rule, corrected)) {
    NormalizationResult result =
        Accepted(SemanticValue(corrected), CorrectionKind::MULTIPLIER, raw);
    result.applied_multiplier = *multiplier;
    LogManager::getInstance().logModule(
        LogCategory::NORMALIZER, LogLevel::DEBUG,
        "corrected {} -> {} via multiplier {}", raw, corrected, *multiplier);
    return result;
  }

  if (candidate < rule.valid_range.min) {
    NormalizationResult result = Accepted(SemanticValue(rule.valid_range.min),
                                          CorrectionKind::CLAMPED_MIN, raw);
    result.message = "clamped " + std::to_string(candidate) + " to minimum";
    return result;
  }

  return Rejected(raw, "value " + std::to_string(candidate) +
                           " above maximum after all corrections");
}

// =============================================================================
// 공개 인터페이스
// =============================================================================

NormalizationResult ValueNormalizer::Normalize(const DpValue &raw,
                                               const ConversionRule &rule) {
  if (!rule.IsScaling())
    return ApplyDirect(raw, rule);

  auto numeric = BasicTypes::DpValueToDouble(raw);
  if (!numeric || !std::isfinite(*numeric))
    return Rejected(0.0, "non-numeric value for scaling rule: " +
                             BasicTypes::DpValueToString(raw));

  return ApplyScaling(*numeric, rule);
}

NormalizationResult ValueNormalizer::NormalizeFor(
    Learning::AdaptiveLearner &learner, const Learning::LearningKey &key,
    const DpValue &raw, const ConversionRule &rule) {
  if (!rule.IsScaling())
    return ApplyDirect(raw, rule);

  auto numeric = BasicTypes::DpValueToDouble(raw);
  if (!numeric || !std::isfinite(*numeric))
    return Normalize(raw, rule);

  learner.Observe(key, *numeric);

  if (rule.auto_correct) {
    if (auto learned = learner.GetLearnedDivisor(key)) {
      double v = rule.ApplyDivisor(*numeric, *learned);
      if (rule.valid_range.Contains(v)) {
        CorrectionKind kind = v == rule.ApplyScaling(*numeric)
                                  ? CorrectionKind::NONE
                                  : CorrectionKind::DIVISOR;
        NormalizationResult result = Accepted(SemanticValue(v), kind, *numeric);
        result.applied_divisor = *learned;
        result.via_learned_divisor = true;
        return result;
      }
      LogManager::getInstance().logModule(
          LogCategory::NORMALIZER, LogLevel::DEBUG,
          "learned divisor {} failed for {}/{} (raw {}), full search", *learned,
          key.device, key.capability, *numeric);
    }
  }

  NormalizationResult result = ApplyScaling(*numeric, rule);
  if (result.correction == CorrectionKind::DIVISOR && result.applied_divisor) {
    learner.ReportCorrection(key, *result.applied_divisor);
  } else if (result.correction == CorrectionKind::MULTIPLIER &&
             result.applied_multiplier) {
    // multiplier 보정은 같은 값을 내는 divisor 로 학습한다
    learner.ReportCorrection(
        key, rule.MultiplierAsDivisor(*result.applied_multiplier));
  }

  if (rule.auto_correct)
    learner.DetectByVote(key, rule);

  return result;
}

} // namespace HybridLink::Normalizer

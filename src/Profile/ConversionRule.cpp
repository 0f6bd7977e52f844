#include "Profile/ConversionRule.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace HybridLink {
namespace Profile {

using json = nlohmann::json;

namespace {

struct KindVisitor {
  Enums::ConversionKind operator()(const DivisorTransform &) const {
    return Enums::ConversionKind::DIVISOR;
  }
  Enums::ConversionKind operator()(const MultiplierTransform &) const {
    return Enums::ConversionKind::MULTIPLIER;
  }
  Enums::ConversionKind operator()(const BitExtractTransform &) const {
    return Enums::ConversionKind::BIT_EXTRACT;
  }
  Enums::ConversionKind operator()(const EnumMapTransform &) const {
    return Enums::ConversionKind::ENUM_MAP;
  }
  Enums::ConversionKind operator()(const CustomTransform &) const {
    return Enums::ConversionKind::CUSTOM;
  }
};

struct ToJsonVisitor {
  json &out;

  void operator()(const DivisorTransform &t) const {
    out["divisor"] = t.divisor;
    if (t.multiplier != 1.0)
      out["multiplier"] = t.multiplier;
    if (t.offset != 0.0)
      out["offset"] = t.offset;
  }
  void operator()(const MultiplierTransform &t) const {
    out["multiplier"] = t.multiplier;
    if (t.offset != 0.0)
      out["offset"] = t.offset;
  }
  void operator()(const BitExtractTransform &t) const { out["bit"] = t.bit; }
  void operator()(const EnumMapTransform &t) const {
    json names = json::object();
    for (const auto &kv : t.names)
      names[std::to_string(kv.first)] = kv.second;
    out["enum"] = names;
  }
  void operator()(const CustomTransform &t) const { out["transform"] = t.name; }
};

bool ReadRange(const json &j, Range &out) {
  if (!j.is_array() || j.size() != 2 || !j[0].is_number() ||
      !j[1].is_number())
    return false;
  double lo = j[0].get<double>();
  double hi = j[1].get<double>();
  if (lo > hi)
    return false;
  out = Range(lo, hi);
  return true;
}

bool ReadNumbers(const json &j, std::vector<double> &out) {
  if (!j.is_array())
    return false;
  std::vector<double> values;
  for (const auto &v : j) {
    if (!v.is_number())
      return false;
    double d = v.get<double>();
    if (d <= 0.0)
      return false;
    values.push_back(d);
  }
  out = std::move(values);
  return true;
}

std::optional<double> ToNumber(const DpValue &value) {
  return BasicTypes::DpValueToDouble(value);
}

} // namespace

Enums::ConversionKind ConversionRule::Kind() const {
  return std::visit(KindVisitor{}, transform);
}

double ConversionRule::ApplyScaling(double raw) const {
  if (const auto *d = std::get_if<DivisorTransform>(&transform)) {
    return raw / d->divisor * d->multiplier + d->offset;
  }
  if (const auto *m = std::get_if<MultiplierTransform>(&transform)) {
    return raw * m->multiplier + m->offset;
  }
  return raw;
}

double ConversionRule::ApplyDivisor(double raw, double divisor) const {
  if (const auto *d = std::get_if<DivisorTransform>(&transform)) {
    return raw / divisor * d->multiplier + d->offset;
  }
  if (const auto *m = std::get_if<MultiplierTransform>(&transform)) {
    return raw / divisor * m->multiplier + m->offset;
  }
  return raw / divisor;
}

double ConversionRule::ApplyMultiplier(double raw, double multiplier) const {
  if (const auto *d = std::get_if<DivisorTransform>(&transform)) {
    return raw * multiplier + d->offset;
  }
  if (const auto *m = std::get_if<MultiplierTransform>(&transform)) {
    return raw * multiplier + m->offset;
  }
  return raw * multiplier;
}

double ConversionRule::MultiplierAsDivisor(double multiplier) const {
  if (const auto *d = std::get_if<DivisorTransform>(&transform)) {
    return d->multiplier / multiplier;
  }
  if (const auto *m = std::get_if<MultiplierTransform>(&transform)) {
    return m->multiplier / multiplier;
  }
  return 1.0 / multiplier;
}

// =============================================================================
// 생성 헬퍼
// =============================================================================

ConversionRule ConversionRule::Divisor(double divisor, Range valid,
                                       std::vector<double> candidates,
                                       std::string unit) {
  ConversionRule rule;
  DivisorTransform t;
  t.divisor = divisor;
  rule.transform = t;
  rule.valid_range = valid;
  rule.candidate_divisors = std::move(candidates);
  rule.unit = std::move(unit);
  return rule;
}

ConversionRule ConversionRule::Identity(Range valid, std::string unit) {
  return Divisor(1.0, valid, {}, std::move(unit));
}

ConversionRule ConversionRule::BitExtract(uint8_t bit) {
  ConversionRule rule;
  rule.transform = BitExtractTransform{bit};
  rule.auto_correct = false;
  return rule;
}

ConversionRule ConversionRule::EnumMap(std::map<uint8_t, std::string> names) {
  ConversionRule rule;
  EnumMapTransform t;
  t.names = std::move(names);
  rule.transform = std::move(t);
  rule.auto_correct = false;
  return rule;
}

ConversionRule ConversionRule::Custom(CustomTransform transform) {
  ConversionRule rule;
  rule.transform = std::move(transform);
  rule.auto_correct = false;
  return rule;
}

// =============================================================================
// JSON
// =============================================================================

json ConversionRule::ToJson() const {
  json j = json::object();
  std::visit(ToJsonVisitor{j}, transform);

  if (valid_range.min != std::numeric_limits<double>::lowest() ||
      valid_range.max != std::numeric_limits<double>::max()) {
    j["validRange"] = {valid_range.min, valid_range.max};
  }
  if (typical_range)
    j["typicalRange"] = {typical_range->min, typical_range->max};
  if (!candidate_divisors.empty())
    j["candidateDivisors"] = candidate_divisors;
  if (!candidate_multipliers.empty())
    j["candidateMultipliers"] = candidate_multipliers;
  j["autoCorrect"] = auto_correct;
  if (!signed_value)
    j["signed"] = false;
  if (!unit.empty())
    j["unit"] = unit;
  return j;
}

std::optional<ConversionRule> ConversionRule::FromJson(const json &j) {
  return FromJson(j, ConversionRule{});
}

std::optional<ConversionRule> ConversionRule::FromJson(const json &j,
                                                       const ConversionRule &base) {
  if (!j.is_object())
    return std::nullopt;

  ConversionRule rule = base;

  try {
    if (j.contains("divisor")) {
      DivisorTransform t;
      t.divisor = j.at("divisor").get<double>();
      t.multiplier = j.value("multiplier", 1.0);
      t.offset = j.value("offset", 0.0);
      if (t.divisor == 0.0 || !std::isfinite(t.divisor))
        return std::nullopt;
      rule.transform = t;
    } else if (j.contains("multiplier")) {
      MultiplierTransform t;
      t.multiplier = j.at("multiplier").get<double>();
      t.offset = j.value("offset", 0.0);
      rule.transform = t;
    } else if (j.contains("bit")) {
      int bit = j.at("bit").get<int>();
      if (bit < 0 || bit > 31)
        return std::nullopt;
      rule.transform = BitExtractTransform{static_cast<uint8_t>(bit)};
      rule.auto_correct = false;
    } else if (j.contains("enum")) {
      const json &names = j.at("enum");
      if (!names.is_object())
        return std::nullopt;
      EnumMapTransform t;
      for (auto it = names.begin(); it != names.end(); ++it) {
        int ordinal = std::stoi(it.key());
        if (ordinal < 0 || ordinal > 0xFF || !it.value().is_string())
          return std::nullopt;
        t.names[static_cast<uint8_t>(ordinal)] = it.value().get<std::string>();
      }
      rule.transform = std::move(t);
      rule.auto_correct = false;
    } else if (j.contains("transform")) {
      auto named = FindNamedTransform(j.at("transform").get<std::string>());
      if (!named)
        return std::nullopt;
      rule.transform = std::move(*named);
      rule.auto_correct = false;
    }

    if (j.contains("validRange") && !ReadRange(j.at("validRange"),
                                               rule.valid_range))
      return std::nullopt;
    if (j.contains("typicalRange")) {
      Range typical;
      if (!ReadRange(j.at("typicalRange"), typical))
        return std::nullopt;
      rule.typical_range = typical;
    }
    if (j.contains("candidateDivisors") &&
        !ReadNumbers(j.at("candidateDivisors"), rule.candidate_divisors))
      return std::nullopt;
    if (j.contains("candidateMultipliers") &&
        !ReadNumbers(j.at("candidateMultipliers"), rule.candidate_multipliers))
      return std::nullopt;

    rule.auto_correct = j.value("autoCorrect", rule.auto_correct);
    rule.signed_value = j.value("signed", rule.signed_value);
    rule.unit = j.value("unit", rule.unit);
  } catch (const json::exception &) {
    return std::nullopt;
  } catch (const std::logic_error &) {
    // std::stoi 실패 (invalid_argument / out_of_range)
    return std::nullopt;
  }

  return rule;
}

// =============================================================================
// 이름 있는 custom 변환
// =============================================================================

std::optional<CustomTransform> FindNamedTransform(const std::string &name) {
  if (name == "battery_state") {
    // 0=low, 1=medium, 2=high 배터리 상태를 퍼센트로
    return CustomTransform{
        name, [](const DpValue &raw) -> std::optional<SemanticValue> {
          auto v = ToNumber(raw);
          if (!v)
            return std::nullopt;
          switch (static_cast<int>(*v)) {
          case 0:
            return SemanticValue(10.0);
          case 1:
            return SemanticValue(50.0);
          case 2:
            return SemanticValue(100.0);
          default:
            return std::nullopt;
          }
        }};
  }
  if (name == "inverted_percent") {
    // 0..100 위치를 뒤집어 0..1 비율로
    return CustomTransform{
        name, [](const DpValue &raw) -> std::optional<SemanticValue> {
          auto v = ToNumber(raw);
          if (!v || *v < 0.0 || *v > 100.0)
            return std::nullopt;
          return SemanticValue((100.0 - *v) / 100.0);
        }};
  }
  if (name == "zcl_illuminance") {
    // measuredValue = 10000 * log10(lux) + 1
    return CustomTransform{
        name, [](const DpValue &raw) -> std::optional<SemanticValue> {
          auto v = ToNumber(raw);
          if (!v || *v < 0.0 || *v > 0xFFFE)
            return std::nullopt;
          if (*v == 0.0)
            return SemanticValue(0.0);
          double lux = std::pow(10.0, (*v - 1.0) / 10000.0);
          return SemanticValue(std::round(lux));
        }};
  }
  return std::nullopt;
}

} // namespace Profile
} // namespace HybridLink

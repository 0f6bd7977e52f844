#include "Codec/TypeCodec.h"
#include "Logging/LogManager.h"
#include "Utils/ByteEncoding.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace HybridLink::Codec {

namespace {

void LogMismatch(const DataPointRecord &record, const std::string &reason) {
  LogManager::getInstance().logModule(
      LogCategory::CODEC, LogLevel::WARN,
      "type mismatch: dp={} type={} len={} - {}", static_cast<int>(record.id),
      Enums::DpTypeToString(record.type), record.payload.size(), reason);
}

} // namespace

std::optional<uint32_t> TypeCodec::ReadBigEndian(const ByteBuffer &payload) {
  if (payload.size() != 1 && payload.size() != 2 && payload.size() != 4)
    return std::nullopt;
  uint32_t value = 0;
  for (uint8_t b : payload)
    value = (value << 8) | b;
  return value;
}

ByteBuffer TypeCodec::WriteBigEndian32(uint32_t value) {
  return {static_cast<uint8_t>((value >> 24) & 0xFF),
          static_cast<uint8_t>((value >> 16) & 0xFF),
          static_cast<uint8_t>((value >> 8) & 0xFF),
          static_cast<uint8_t>(value & 0xFF)};
}

// =============================================================================
// 디코딩
// =============================================================================

std::optional<DpValue> TypeCodec::Decode(const DataPointRecord &record,
                                         const DecodeOptions &options) {
  const ByteBuffer &payload = record.payload;

  switch (record.type) {
  case DpType::RAW:
    return DpValue(std::in_place_index<0>, payload);

  case DpType::BOOLEAN:
    if (payload.empty()) {
      LogMismatch(record, "boolean without payload");
      return std::nullopt;
    }
    return DpValue(std::in_place_index<1>, payload[0] != 0);

  case DpType::INTEGER32: {
    auto raw = ReadBigEndian(payload);
    if (!raw) {
      LogMismatch(record, "integer width must be 1, 2 or 4 bytes");
      return std::nullopt;
    }
    int64_t value = 0;
    if (options.signed_value) {
      switch (payload.size()) {
      case 1:
        value = static_cast<int8_t>(*raw);
        break;
      case 2:
        value = static_cast<int16_t>(*raw);
        break;
      default:
        value = static_cast<int32_t>(*raw);
        break;
      }
    } else {
      value = static_cast<int64_t>(*raw);
    }
    return DpValue(std::in_place_index<2>, value);
  }

  case DpType::STRING:
    return DpValue(std::in_place_index<3>,
                   std::string(payload.begin(), payload.end()));

  case DpType::ENUMERATED: {
    if (payload.empty()) {
      LogMismatch(record, "enumerated without payload");
      return std::nullopt;
    }
    BasicTypes::EnumValue ev;
    ev.ordinal = payload[0];
    if (options.enum_names) {
      auto it = options.enum_names->find(ev.ordinal);
      if (it != options.enum_names->end())
        ev.name = it->second;
    }
    return DpValue(std::in_place_index<4>, ev);
  }

  case DpType::BITMAP: {
    auto raw = ReadBigEndian(payload);
    if (!raw) {
      LogMismatch(record, "bitmap width must be 1, 2 or 4 bytes");
      return std::nullopt;
    }
    return DpValue(std::in_place_index<5>, *raw);
  }
  }

  LogMismatch(record, "unknown type tag");
  return std::nullopt;
}

// =============================================================================
// 인코딩
// =============================================================================

std::optional<ByteBuffer> TypeCodec::Encode(DpType type, const DpValue &value,
                                            const EncodeOptions &options) {
  if (!Matches(type, value)) {
    LogManager::getInstance().logModule(
        LogCategory::CODEC, LogLevel::WARN,
        "encode rejected: value alternative does not match type {}",
        Enums::DpTypeToString(type));
    return std::nullopt;
  }

  switch (type) {
  case DpType::RAW:
    return std::get<ByteBuffer>(value);

  case DpType::BOOLEAN:
    return ByteBuffer{static_cast<uint8_t>(std::get<bool>(value) ? 1 : 0)};

  case DpType::INTEGER32: {
    int64_t v = std::get<int64_t>(value);
    // 디코딩이 같은 값을 돌려주는 범위만 허용
    const int64_t lo =
        options.signed_value ? std::numeric_limits<int32_t>::min() : 0;
    const int64_t hi =
        options.signed_value
            ? std::numeric_limits<int32_t>::max()
            : static_cast<int64_t>(std::numeric_limits<uint32_t>::max());
    if (v < lo || v > hi) {
      LogManager::getInstance().logModule(
          LogCategory::CODEC, LogLevel::WARN,
          "encode rejected: {} does not fit in {} 32 bits", v,
          options.signed_value ? "signed" : "unsigned");
      return std::nullopt;
    }
    return WriteBigEndian32(static_cast<uint32_t>(v));
  }

  case DpType::STRING: {
    const std::string &s = std::get<std::string>(value);
    return ByteBuffer(s.begin(), s.end());
  }

  case DpType::ENUMERATED:
    return ByteBuffer{std::get<BasicTypes::EnumValue>(value).ordinal};

  case DpType::BITMAP:
    return WriteBigEndian32(std::get<uint32_t>(value));
  }
  return std::nullopt;
}

std::optional<DpValue> TypeCodec::ParseValue(DpType type,
                                             const std::string &text) {
  try {
    switch (type) {
    case DpType::RAW: {
      auto bytes = Utils::HexDecode(text);
      if (!bytes)
        return std::nullopt;
      return DpValue(std::in_place_index<0>, *bytes);
    }
    case DpType::BOOLEAN: {
      std::string lower = text;
      std::transform(lower.begin(), lower.end(), lower.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      if (lower == "true" || lower == "1" || lower == "on")
        return DpValue(std::in_place_index<1>, true);
      if (lower == "false" || lower == "0" || lower == "off")
        return DpValue(std::in_place_index<1>, false);
      return std::nullopt;
    }
    case DpType::INTEGER32: {
      size_t consumed = 0;
      long long v = std::stoll(text, &consumed, 0);
      if (consumed != text.size())
        return std::nullopt;
      return DpValue(std::in_place_index<2>, static_cast<int64_t>(v));
    }
    case DpType::STRING:
      return DpValue(std::in_place_index<3>, text);
    case DpType::ENUMERATED: {
      size_t consumed = 0;
      unsigned long v = std::stoul(text, &consumed, 0);
      if (consumed != text.size() || v > 0xFF)
        return std::nullopt;
      BasicTypes::EnumValue ev;
      ev.ordinal = static_cast<uint8_t>(v);
      return DpValue(std::in_place_index<4>, ev);
    }
    case DpType::BITMAP: {
      size_t consumed = 0;
      unsigned long long v = std::stoull(text, &consumed, 0);
      if (consumed != text.size() || v > 0xFFFFFFFFULL)
        return std::nullopt;
      return DpValue(std::in_place_index<5>, static_cast<uint32_t>(v));
    }
    }
  } catch (const std::exception &e) {
    LogManager::getInstance().logModule(LogCategory::CODEC, LogLevel::DEBUG,
                                        "cannot parse '{}' as {}: {}", text,
                                        Enums::DpTypeToString(type), e.what());
  }
  return std::nullopt;
}

} // namespace HybridLink::Codec

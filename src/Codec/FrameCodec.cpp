#include "Codec/FrameCodec.h"
#include "Codec/TypeCodec.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"
#include "Utils/ByteEncoding.h"

namespace HybridLink::Codec {

namespace {
// JSON 안의 문자열 안의 JSON ... 을 무한히 따라가지 않도록 제한
constexpr int kMaxWrapDepth = 3;
} // namespace

// =============================================================================
// FrameReader
// =============================================================================

FrameReader::FrameReader(ByteBuffer buffer) : buffer_(std::move(buffer)) {
  exhausted_ = buffer_.empty();
}

std::optional<DataPointRecord> FrameReader::Next() {
  auto &logger = LogManager::getInstance();

  while (!exhausted_) {
    size_t remaining = buffer_.size() - offset_;
    if (remaining == 0) {
      exhausted_ = true;
      break;
    }

    if (remaining < Constants::DP_HEADER_SIZE) {
      discarded_bytes_ = remaining;
      exhausted_ = true;
      logger.logModule(LogCategory::CODEC, LogLevel::WARN,
                       "truncated header at offset {}: {} trailing bytes "
                       "discarded",
                       offset_, remaining);
      break;
    }

    uint8_t id = buffer_[offset_];
    uint8_t tag = buffer_[offset_ + 1];
    size_t length = (static_cast<size_t>(buffer_[offset_ + 2]) << 8) |
                    buffer_[offset_ + 3];

    if (remaining - Constants::DP_HEADER_SIZE < length) {
      discarded_bytes_ = remaining;
      exhausted_ = true;
      logger.logModule(LogCategory::CODEC, LogLevel::WARN,
                       "truncated payload for dp {}: declared {} bytes, {} "
                       "available - {} bytes discarded",
                       static_cast<int>(id), length,
                       remaining - Constants::DP_HEADER_SIZE, remaining);
      break;
    }

    size_t payload_start = offset_ + Constants::DP_HEADER_SIZE;
    offset_ = payload_start + length;

    if (!Enums::IsKnownDpType(tag)) {
      skipped_records_++;
      logger.logModule(LogCategory::CODEC, LogLevel::WARN,
                       "skipping dp {} with unknown type tag 0x{} ({} bytes)",
                       static_cast<int>(id),
                       BasicTypes::BytesToHex(ByteBuffer{tag}), length);
      continue;
    }

    DataPointRecord record;
    record.id = id;
    record.type = static_cast<DpType>(tag);
    record.payload.assign(
        buffer_.begin() + static_cast<std::ptrdiff_t>(payload_start),
        buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    return record;
  }

  return std::nullopt;
}

// =============================================================================
// 입력 정규화
// =============================================================================

bool FrameCodec::IsWellFormed(const ByteBuffer &bytes) {
  if (bytes.size() < Constants::DP_HEADER_SIZE)
    return false;
  if (!Enums::IsKnownDpType(bytes[1]))
    return false;
  size_t length = (static_cast<size_t>(bytes[2]) << 8) | bytes[3];
  return bytes.size() - Constants::DP_HEADER_SIZE >= length;
}

std::optional<ByteBuffer> FrameCodec::FromJson(const nlohmann::json &value,
                                               int depth) {
  if (depth > kMaxWrapDepth)
    return std::nullopt;

  if (value.is_array()) {
    ByteBuffer bytes;
    bytes.reserve(value.size());
    for (const auto &element : value) {
      if (!element.is_number_integer())
        return std::nullopt;
      int64_t b = element.get<int64_t>();
      if (b < 0 || b > 0xFF)
        return std::nullopt;
      bytes.push_back(static_cast<uint8_t>(b));
    }
    return bytes;
  }

  // {"data": [...]} 와 {"type": "Buffer", "data": [...]} 모두 처리
  if (value.is_object()) {
    auto it = value.find("data");
    if (it == value.end())
      return std::nullopt;
    return FromJson(*it, depth + 1);
  }

  if (value.is_string())
    return FromText(value.get<std::string>(), depth + 1);

  return std::nullopt;
}

std::optional<ByteBuffer> FrameCodec::FromText(const std::string &text,
                                               int depth) {
  if (text.empty() || depth > kMaxWrapDepth)
    return std::nullopt;

  ByteBuffer raw(text.begin(), text.end());
  if (IsWellFormed(raw))
    return raw;

  if (auto decoded = Utils::Base64Decode(text)) {
    if (IsWellFormed(*decoded))
      return decoded;
  }

  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_discarded() && (parsed.is_array() || parsed.is_object())) {
    auto bytes = FromJson(parsed, depth + 1);
    if (bytes && IsWellFormed(*bytes))
      return bytes;
  }

  if (auto decoded = Utils::HexDecode(text)) {
    if (IsWellFormed(*decoded))
      return decoded;
  }

  return std::nullopt;
}

ByteBuffer FrameCodec::NormalizeInput(const std::string &input) {
  if (input.empty())
    return {};

  if (auto bytes = FromText(input, 0))
    return *bytes;

  // UTF-8 fallback - 문자열 바이트 그대로
  LogManager::getInstance().logModule(
      LogCategory::CODEC, LogLevel::DEBUG,
      "no wrapper matched, using {} text bytes as-is", input.size());
  return ByteBuffer(input.begin(), input.end());
}

ByteBuffer FrameCodec::NormalizeInput(const ByteBuffer &input) {
  if (input.empty() || IsWellFormed(input))
    return input;
  return NormalizeInput(std::string(input.begin(), input.end()));
}

ByteBuffer FrameCodec::NormalizeInput(const nlohmann::json &input) {
  if (input.is_string())
    return NormalizeInput(input.get<std::string>());

  auto bytes = FromJson(input, 0);
  if (!bytes) {
    LogManager::getInstance().logModule(LogCategory::CODEC, LogLevel::WARN,
                                        "unsupported JSON frame wrapper: {}",
                                        input.dump());
    return {};
  }
  return *bytes;
}

// =============================================================================
// 디코딩
// =============================================================================

FrameReader FrameCodec::Decode(const ByteBuffer &input) {
  return FrameReader(NormalizeInput(input));
}

FrameReader FrameCodec::Decode(const std::string &input) {
  return FrameReader(NormalizeInput(input));
}

FrameReader FrameCodec::Decode(const nlohmann::json &input) {
  return FrameReader(NormalizeInput(input));
}

std::vector<DataPointRecord> FrameCodec::DecodeAll(const ByteBuffer &input) {
  std::vector<DataPointRecord> records;
  for (const auto &record : Decode(input))
    records.push_back(record);
  return records;
}

std::vector<DataPointRecord> FrameCodec::DecodeAll(const std::string &input) {
  std::vector<DataPointRecord> records;
  for (const auto &record : Decode(input))
    records.push_back(record);
  return records;
}

// =============================================================================
// 인코딩
// =============================================================================

std::optional<ByteBuffer> FrameCodec::Encode(DataPointId id, DpType type,
                                             const DpValue &value,
                                             const EncodeOptions &options) {
  auto payload = TypeCodec::Encode(type, value, options);
  if (!payload)
    return std::nullopt;

  DataPointRecord record;
  record.id = id;
  record.type = type;
  record.payload = std::move(*payload);
  return EncodeRecord(record);
}

std::optional<ByteBuffer> FrameCodec::EncodeRecord(
    const DataPointRecord &record) {
  if (record.payload.size() > Constants::DP_MAX_PAYLOAD) {
    LogManager::getInstance().logModule(
        LogCategory::CODEC, LogLevel::LOG_ERROR,
        "dp {} payload too large: {} bytes", static_cast<int>(record.id),
        record.payload.size());
    return std::nullopt;
  }

  ByteBuffer frame;
  frame.reserve(Constants::DP_HEADER_SIZE + record.payload.size());
  frame.push_back(record.id);
  frame.push_back(static_cast<uint8_t>(record.type));
  frame.push_back(static_cast<uint8_t>((record.payload.size() >> 8) & 0xFF));
  frame.push_back(static_cast<uint8_t>(record.payload.size() & 0xFF));
  frame.insert(frame.end(), record.payload.begin(), record.payload.end());
  return frame;
}

std::optional<ByteBuffer>
FrameCodec::EncodeBatch(const std::vector<DataPointRecord> &records) {
  ByteBuffer out;
  for (const auto &record : records) {
    auto frame = EncodeRecord(record);
    if (!frame)
      return std::nullopt;
    out.insert(out.end(), frame->begin(), frame->end());
  }
  return out;
}

} // namespace HybridLink::Codec

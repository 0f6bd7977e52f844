// include/Common/Enums.h
#ifndef HYBRIDLINK_COMMON_ENUMS_H
#define HYBRIDLINK_COMMON_ENUMS_H

#include <cstdint>
#include <string>

// 시스템 헤더가 INFO/DEBUG/WARN/ERROR 를 매크로로 정의하는 경우가 있다
#ifdef INFO
#undef INFO
#endif
#ifdef DEBUG
#undef DEBUG
#endif
#ifdef WARN
#undef WARN
#endif
#ifdef ERROR
#undef ERROR
#endif

namespace HybridLink {
namespace Enums {

// =========================================================================
// 로그 레벨 (LogLib::LogLevel 과 값이 동일해야 함)
// =========================================================================
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4,
  LOG_FATAL = 5,
  OFF = 255
};

// =========================================================================
// 로그 카테고리 - 모듈별 파일 분리용
// =========================================================================
enum class LogCategory : uint8_t {
  GENERAL = 0,
  CODEC = 1,
  REGISTRY = 2,
  NORMALIZER = 3,
  LEARNER = 4,
  ARBITRATOR = 5,
  ENGINE = 6,
  DATA_QUALITY = 7
};

// =========================================================================
// DataPoint 타입 태그 (와이어 값 그대로)
// =========================================================================
enum class DpType : uint8_t {
  RAW = 0x00,
  BOOLEAN = 0x01,
  INTEGER32 = 0x02,
  STRING = 0x03,
  ENUMERATED = 0x04,
  BITMAP = 0x05
};

// =========================================================================
// 이벤트 경로
// =========================================================================
enum class ProtocolPath : uint8_t { CLUSTER = 0, DATAPOINT = 1 };

enum class ProtocolAffinity : uint8_t {
  UNDECIDED = 0,
  CLUSTER_ONLY = 1,
  DATAPOINT_ONLY = 2,
  HYBRID = 3
};

enum class ArbitrationState : uint8_t { OBSERVING = 0, DECIDED = 1 };

// =========================================================================
// 정규화 결과 분류
// =========================================================================
enum class CorrectionKind : uint8_t {
  NONE = 0,
  DIVISOR = 1,
  MULTIPLIER = 2,
  CLAMPED_MIN = 3,
  REJECTED = 4
};

enum class ConversionKind : uint8_t {
  DIVISOR = 0,
  MULTIPLIER = 1,
  BIT_EXTRACT = 2,
  ENUM_MAP = 3,
  CUSTOM = 4
};

// =========================================================================
// 데이터 품질
// =========================================================================
enum class DataQuality : uint8_t {
  GOOD = 0,
  CORRECTED = 1,
  CLAMPED = 2,
  UNCERTAIN = 3,
  QUARANTINED = 4,
  UNMAPPED = 5
};

// =========================================================================
// 에러 코드
// =========================================================================
enum class ErrorCode : uint16_t {
  SUCCESS = 0,
  MALFORMED_FRAME = 10,
  UNKNOWN_DATAPOINT = 11,
  TYPE_MISMATCH = 12,
  OUT_OF_RANGE_UNCORRECTABLE = 20,
  UNMAPPED_FINGERPRINT = 30,
  UNKNOWN_DEVICE = 31,
  INVALID_ARGUMENT = 40,
  INVALID_STATE_DOCUMENT = 41
};

// =========================================================================
// 문자열 변환
// =========================================================================
inline std::string LogCategoryToString(LogCategory category) {
  switch (category) {
  case LogCategory::CODEC:
    return "codec";
  case LogCategory::REGISTRY:
    return "registry";
  case LogCategory::NORMALIZER:
    return "normalizer";
  case LogCategory::LEARNER:
    return "learner";
  case LogCategory::ARBITRATOR:
    return "arbitrator";
  case LogCategory::ENGINE:
    return "engine";
  case LogCategory::DATA_QUALITY:
    return "data_quality";
  case LogCategory::GENERAL:
  default:
    return "general";
  }
}

inline std::string DpTypeToString(DpType type) {
  switch (type) {
  case DpType::RAW:
    return "raw";
  case DpType::BOOLEAN:
    return "boolean";
  case DpType::INTEGER32:
    return "integer32";
  case DpType::STRING:
    return "string";
  case DpType::ENUMERATED:
    return "enumerated";
  case DpType::BITMAP:
    return "bitmap";
  }
  return "unknown";
}

inline bool IsKnownDpType(uint8_t tag) {
  return tag <= static_cast<uint8_t>(DpType::BITMAP);
}

inline bool StringToDpType(const std::string &name, DpType &out) {
  if (name == "raw" || name == "0") {
    out = DpType::RAW;
  } else if (name == "boolean" || name == "bool" || name == "1") {
    out = DpType::BOOLEAN;
  } else if (name == "integer32" || name == "value" || name == "2") {
    out = DpType::INTEGER32;
  } else if (name == "string" || name == "3") {
    out = DpType::STRING;
  } else if (name == "enumerated" || name == "enum" || name == "4") {
    out = DpType::ENUMERATED;
  } else if (name == "bitmap" || name == "5") {
    out = DpType::BITMAP;
  } else {
    return false;
  }
  return true;
}

inline std::string ProtocolPathToString(ProtocolPath path) {
  return path == ProtocolPath::CLUSTER ? "cluster" : "datapoint";
}

inline bool StringToProtocolPath(const std::string &name, ProtocolPath &out) {
  if (name == "cluster") {
    out = ProtocolPath::CLUSTER;
    return true;
  }
  if (name == "datapoint") {
    out = ProtocolPath::DATAPOINT;
    return true;
  }
  return false;
}

inline std::string ProtocolAffinityToString(ProtocolAffinity affinity) {
  switch (affinity) {
  case ProtocolAffinity::CLUSTER_ONLY:
    return "cluster_only";
  case ProtocolAffinity::DATAPOINT_ONLY:
    return "datapoint_only";
  case ProtocolAffinity::HYBRID:
    return "hybrid";
  case ProtocolAffinity::UNDECIDED:
  default:
    return "undecided";
  }
}

inline ProtocolAffinity StringToProtocolAffinity(const std::string &name) {
  if (name == "cluster_only")
    return ProtocolAffinity::CLUSTER_ONLY;
  if (name == "datapoint_only")
    return ProtocolAffinity::DATAPOINT_ONLY;
  if (name == "hybrid")
    return ProtocolAffinity::HYBRID;
  return ProtocolAffinity::UNDECIDED;
}

inline std::string ArbitrationStateToString(ArbitrationState state) {
  return state == ArbitrationState::DECIDED ? "decided" : "observing";
}

inline std::string CorrectionKindToString(CorrectionKind kind) {
  switch (kind) {
  case CorrectionKind::NONE:
    return "none";
  case CorrectionKind::DIVISOR:
    return "divisor";
  case CorrectionKind::MULTIPLIER:
    return "multiplier";
  case CorrectionKind::CLAMPED_MIN:
    return "clamped_min";
  case CorrectionKind::REJECTED:
    return "rejected";
  }
  return "unknown";
}

inline std::string DataQualityToString(DataQuality quality) {
  switch (quality) {
  case DataQuality::GOOD:
    return "good";
  case DataQuality::CORRECTED:
    return "corrected";
  case DataQuality::CLAMPED:
    return "clamped";
  case DataQuality::UNCERTAIN:
    return "uncertain";
  case DataQuality::QUARANTINED:
    return "quarantined";
  case DataQuality::UNMAPPED:
    return "unmapped";
  }
  return "unknown";
}

inline std::string ErrorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::SUCCESS:
    return "SUCCESS";
  case ErrorCode::MALFORMED_FRAME:
    return "MALFORMED_FRAME";
  case ErrorCode::UNKNOWN_DATAPOINT:
    return "UNKNOWN_DATAPOINT";
  case ErrorCode::TYPE_MISMATCH:
    return "TYPE_MISMATCH";
  case ErrorCode::OUT_OF_RANGE_UNCORRECTABLE:
    return "OUT_OF_RANGE_UNCORRECTABLE";
  case ErrorCode::UNMAPPED_FINGERPRINT:
    return "UNMAPPED_FINGERPRINT";
  case ErrorCode::UNKNOWN_DEVICE:
    return "UNKNOWN_DEVICE";
  case ErrorCode::INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case ErrorCode::INVALID_STATE_DOCUMENT:
    return "INVALID_STATE_DOCUMENT";
  }
  return "UNKNOWN_ERROR";
}

} // namespace Enums
} // namespace HybridLink

#endif // HYBRIDLINK_COMMON_ENUMS_H

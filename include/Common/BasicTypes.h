#ifndef HYBRIDLINK_COMMON_BASIC_TYPES_H
#define HYBRIDLINK_COMMON_BASIC_TYPES_H

/**
 * @file BasicTypes.h
 * @brief HybridLink 기본 타입 정의
 *
 * - DataPoint 값은 타입 태그 순서와 동일한 인덱스를 가진 variant 로 표현
 * - 정규화 결과는 별도 variant (double / bool / string)
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace HybridLink {
namespace BasicTypes {

// =========================================================================
// 식별자 타입들
// =========================================================================
using DeviceId = std::string;
using CapabilityId = std::string;
using DataPointId = uint8_t;
using ClusterId = uint16_t;
using ByteBuffer = std::vector<uint8_t>;

using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// =========================================================================
// DataPoint 값
// =========================================================================

/**
 * @brief enumerated 타입 값 - 서수 + (선택) 이름
 */
struct EnumValue {
  uint8_t ordinal = 0;
  std::string name;

  bool operator==(const EnumValue &other) const {
    return ordinal == other.ordinal && name == other.name;
  }
  bool operator!=(const EnumValue &other) const { return !(*this == other); }
};

/**
 * @brief 디코딩된 DataPoint 값
 * @details 인덱스가 DpType 와이어 값과 일치한다 (RAW=0 ... BITMAP=5)
 */
using DpValue = std::variant<ByteBuffer,  // raw
                             bool,        // boolean
                             int64_t,     // integer32 (signed/unsigned 모두 수용)
                             std::string, // string
                             EnumValue,   // enumerated
                             uint32_t     // bitmap
                             >;

/**
 * @brief 정규화된 의미 값 (온도, 퍼센트, 알람 등)
 */
using SemanticValue = std::variant<double, bool, std::string>;

// =========================================================================
// 유틸리티 함수들
// =========================================================================

inline Timestamp GetCurrentTimestamp() {
  return std::chrono::system_clock::now();
}

inline std::string TimestampToString(const Timestamp &timestamp) {
  auto time_t = std::chrono::system_clock::to_time_t(timestamp);
  std::tm tm_buf{};
#ifdef _WIN32
  gmtime_s(&tm_buf, &time_t);
#else
  gmtime_r(&time_t, &tm_buf);
#endif
  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

inline int64_t TimestampToEpochMs(const Timestamp &timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             timestamp.time_since_epoch())
      .count();
}

inline Timestamp EpochMsToTimestamp(int64_t epoch_ms) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
      std::chrono::milliseconds(epoch_ms)));
}

/**
 * @brief 바이트열을 "01 0A FF" 형태로 변환
 */
inline std::string BytesToHex(const ByteBuffer &bytes,
                              const std::string &separator = " ") {
  std::stringstream ss;
  ss << std::hex << std::uppercase << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0)
      ss << separator;
    ss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

inline std::string DpValueToString(const DpValue &value) {
  return std::visit(
      [](auto &&arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ByteBuffer>) {
          return BytesToHex(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
          return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return arg;
        } else if constexpr (std::is_same_v<T, EnumValue>) {
          return arg.name.empty() ? std::to_string(arg.ordinal)
                                  : arg.name + "(" +
                                        std::to_string(arg.ordinal) + ")";
        } else {
          return std::to_string(arg);
        }
      },
      value);
}

inline std::string SemanticValueToString(const SemanticValue &value) {
  return std::visit(
      [](auto &&arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
          return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return arg;
        } else {
          std::ostringstream oss;
          oss << arg;
          return oss.str();
        }
      },
      value);
}

/**
 * @brief DpValue 에서 수치 추출
 * @return 수치로 해석할 수 없으면 std::nullopt
 */
inline std::optional<double> DpValueToDouble(const DpValue &value) {
  return std::visit(
      [](auto &&arg) -> std::optional<double> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ByteBuffer>) {
          if (arg.empty() || arg.size() > 4 || arg.size() == 3)
            return std::nullopt;
          uint32_t v = 0;
          for (uint8_t b : arg)
            v = (v << 8) | b;
          return static_cast<double>(v);
        } else if constexpr (std::is_same_v<T, bool>) {
          return arg ? 1.0 : 0.0;
        } else if constexpr (std::is_same_v<T, std::string>) {
          try {
            size_t consumed = 0;
            double d = std::stod(arg, &consumed);
            if (consumed != arg.size())
              return std::nullopt;
            return d;
          } catch (const std::exception &) {
            return std::nullopt;
          }
        } else if constexpr (std::is_same_v<T, EnumValue>) {
          return static_cast<double>(arg.ordinal);
        } else {
          return static_cast<double>(arg);
        }
      },
      value);
}

// =========================================================================
// 컨테이너 별칭들
// =========================================================================
using StringVector = std::vector<std::string>;

} // namespace BasicTypes
} // namespace HybridLink

#endif // HYBRIDLINK_COMMON_BASIC_TYPES_H

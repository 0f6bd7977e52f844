#ifndef HYBRIDLINK_COMMON_STRUCTS_H
#define HYBRIDLINK_COMMON_STRUCTS_H

/**
 * @file Structs.h
 * @brief 모듈 간에 오가는 공용 구조체
 */

#include "Common/BasicTypes.h"
#include "Common/Enums.h"

#include <optional>
#include <string>
#include <vector>

namespace HybridLink {
namespace Structs {

using BasicTypes::ByteBuffer;
using BasicTypes::CapabilityId;
using BasicTypes::DataPointId;
using BasicTypes::DeviceId;
using BasicTypes::DpValue;
using BasicTypes::SemanticValue;
using BasicTypes::Timestamp;
using Enums::CorrectionKind;
using Enums::DataQuality;
using Enums::DpType;
using Enums::ErrorCode;

// =========================================================================
// 와이어 레코드
// =========================================================================

/**
 * @brief DataPoint 프레임 하나 (헤더 + 페이로드)
 */
struct DataPointRecord {
  DataPointId id = 0;
  DpType type = DpType::RAW;
  ByteBuffer payload;

  bool operator==(const DataPointRecord &other) const {
    return id == other.id && type == other.type && payload == other.payload;
  }
};

/**
 * @brief 터널 채널 명령 (status + transaction + 레코드들)
 */
struct DataPointCommand {
  uint8_t status = 0;
  uint8_t transaction = 0;
  std::vector<DataPointRecord> records;
};

// =========================================================================
// 정규화 결과
// =========================================================================

struct NormalizationResult {
  bool is_valid = false;
  std::optional<SemanticValue> corrected_value;
  CorrectionKind correction = CorrectionKind::NONE;
  std::optional<double> applied_divisor;
  std::optional<double> applied_multiplier;
  double raw_numeric = 0.0;
  bool via_learned_divisor = false;
  std::string message;

  /**
   * @brief 수치 결과 (bool/string 결과나 거부 시 nullopt)
   */
  std::optional<double> NumericValue() const {
    if (!corrected_value)
      return std::nullopt;
    if (const double *d = std::get_if<double>(&*corrected_value))
      return *d;
    return std::nullopt;
  }
};

// =========================================================================
// 디바이스 관측 결과
// =========================================================================

/**
 * @brief 이벤트 하나를 처리한 결과 - 호스트의 capability 동기화가 소비
 * @details capability 가 비어 있으면 매핑되지 않은 DataPoint
 */
struct CapabilityUpdate {
  DeviceId device_id;
  std::optional<CapabilityId> capability;
  std::optional<DpValue> raw_value;
  NormalizationResult normalization;
  double confidence = 0.0;
  DataQuality quality = DataQuality::GOOD;
  ErrorCode error = ErrorCode::SUCCESS;
  Timestamp timestamp;

  bool ShouldUpdate() const {
    return capability.has_value() && normalization.is_valid &&
           normalization.corrected_value.has_value();
  }
};

} // namespace Structs
} // namespace HybridLink

#endif // HYBRIDLINK_COMMON_STRUCTS_H

#ifndef HYBRIDLINK_CODEC_TYPE_CODEC_H
#define HYBRIDLINK_CODEC_TYPE_CODEC_H

/**
 * @file TypeCodec.h
 * @brief DataPoint 페이로드 <-> DpValue 변환
 *
 * 타입 태그별 페이로드 규칙:
 *   raw        - 바이트 그대로
 *   boolean    - 첫 바이트 != 0
 *   integer32  - big-endian 1/2/4 바이트, 기본 signed
 *                인코딩은 항상 4 바이트, 범위는 signed 여부를 따른다
 *   string     - 페이로드 전체 (UTF-8, 빈 문자열 허용)
 *   enumerated - 첫 바이트 서수
 *   bitmap     - big-endian 1/2/4 바이트 -> uint32
 */

#include "Common/BasicTypes.h"
#include "Common/Enums.h"
#include "Common/Structs.h"

#include <map>
#include <optional>
#include <string>

namespace HybridLink::Codec {

using BasicTypes::ByteBuffer;
using BasicTypes::DpValue;
using Enums::DpType;
using Structs::DataPointRecord;

struct DecodeOptions {
  bool signed_value = true;
  // enumerated 서수 -> 이름 (없으면 이름 없이 서수만)
  const std::map<uint8_t, std::string> *enum_names = nullptr;
};

struct EncodeOptions {
  // false 면 integer32 를 0..UINT32_MAX 로 받는다
  bool signed_value = true;
};

class TypeCodec {
public:
  /**
   * @brief 레코드 페이로드를 타입 태그에 맞춰 디코딩
   * @return 타입/길이 불일치 시 std::nullopt (로그 WARN)
   */
  static std::optional<DpValue> Decode(const DataPointRecord &record,
                                       const DecodeOptions &options = {});

  /**
   * @brief 값을 타입 태그의 와이어 페이로드로 인코딩
   * @return variant 대안이 타입 태그와 맞지 않거나 integer32 값이 범위를
   *         벗어나면 std::nullopt
   */
  static std::optional<ByteBuffer> Encode(DpType type, const DpValue &value,
                                          const EncodeOptions &options = {});

  /**
   * @brief 텍스트 값을 타입 태그에 맞는 DpValue 로 변환 (CLI 입력용)
   */
  static std::optional<DpValue> ParseValue(DpType type,
                                           const std::string &text);

  static bool Matches(DpType type, const DpValue &value) {
    return value.index() == static_cast<size_t>(type);
  }

private:
  static std::optional<uint32_t> ReadBigEndian(const ByteBuffer &payload);
  static ByteBuffer WriteBigEndian32(uint32_t value);
};

} // namespace HybridLink::Codec

#endif // HYBRIDLINK_CODEC_TYPE_CODEC_H

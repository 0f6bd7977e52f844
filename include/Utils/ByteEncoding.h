#ifndef HYBRIDLINK_UTILS_BYTE_ENCODING_H
#define HYBRIDLINK_UTILS_BYTE_ENCODING_H

/**
 * @file ByteEncoding.h
 * @brief 텍스트로 감싸진 바이너리(base64, hex) 변환 유틸리티
 */

#include "Common/BasicTypes.h"

#include <optional>
#include <string>

namespace HybridLink {
namespace Utils {

using BasicTypes::ByteBuffer;

std::string Base64Encode(const ByteBuffer &bytes);

/**
 * @brief 엄격한 base64 디코딩
 * @details 앞뒤 공백만 허용. 길이가 4의 배수가 아니거나 알파벳 밖의 문자,
 *          중간의 '=' 가 있으면 실패
 */
std::optional<ByteBuffer> Base64Decode(const std::string &text);

/**
 * @brief hex 텍스트 디코딩
 * @details "01 0A ff", "0x01,0x0a", "[01:0A]" 형태 모두 허용.
 *          구분자 없는 연속 hex 는 짝수 길이여야 한다
 */
std::optional<ByteBuffer> HexDecode(const std::string &text);

std::string HexEncode(const ByteBuffer &bytes);

} // namespace Utils
} // namespace HybridLink

#endif // HYBRIDLINK_UTILS_BYTE_ENCODING_H

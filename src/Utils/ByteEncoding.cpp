#include "Utils/ByteEncoding.h"

#include <cctype>

namespace HybridLink {
namespace Utils {

namespace {

const char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int Base64Index(unsigned char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}

int HexNibble(unsigned char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string Trim(const std::string &s) {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

bool IsHexSeparator(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || c == ',' || c == ':' ||
         c == '[' || c == ']' || c == '-';
}

} // namespace

std::string Base64Encode(const ByteBuffer &bytes) {
  std::string result;
  int val = 0, valb = -6;
  for (uint8_t c : bytes) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      result.push_back(kBase64Chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    result.push_back(kBase64Chars[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (result.size() % 4) {
    result.push_back('=');
  }
  return result;
}

std::optional<ByteBuffer> Base64Decode(const std::string &text) {
  std::string encoded = Trim(text);
  if (encoded.empty() || encoded.size() % 4 != 0)
    return std::nullopt;

  size_t padding = 0;
  while (padding < 2 && encoded.size() > padding &&
         encoded[encoded.size() - 1 - padding] == '=') {
    ++padding;
  }

  ByteBuffer result;
  result.reserve(encoded.size() / 4 * 3);
  int val = 0, valb = -8;
  for (size_t i = 0; i < encoded.size() - padding; ++i) {
    int idx = Base64Index(static_cast<unsigned char>(encoded[i]));
    if (idx < 0)
      return std::nullopt;
    val = ((val << 6) + idx) & 0xFFFFFF;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

std::optional<ByteBuffer> HexDecode(const std::string &text) {
  // 토큰 단위로 나누고 각 토큰의 0x 접두사를 제거
  std::vector<std::string> tokens;
  std::string current;
  bool had_separator = false;
  for (char c : text) {
    if (IsHexSeparator(c)) {
      had_separator = true;
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty())
    tokens.push_back(current);
  if (tokens.empty())
    return std::nullopt;

  std::string digits;
  for (auto &token : tokens) {
    if (token.size() > 2 && token[0] == '0' &&
        (token[1] == 'x' || token[1] == 'X')) {
      token = token.substr(2);
    }
    // 구분자로 나뉜 한 자리 토큰 ("0x1, 0x2") 은 앞에 0을 채운다
    if (had_separator && token.size() % 2 == 1)
      token.insert(token.begin(), '0');
    digits += token;
  }

  if (digits.empty() || digits.size() % 2 != 0)
    return std::nullopt;

  ByteBuffer result;
  result.reserve(digits.size() / 2);
  for (size_t i = 0; i < digits.size(); i += 2) {
    int hi = HexNibble(static_cast<unsigned char>(digits[i]));
    int lo = HexNibble(static_cast<unsigned char>(digits[i + 1]));
    if (hi < 0 || lo < 0)
      return std::nullopt;
    result.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return result;
}

std::string HexEncode(const ByteBuffer &bytes) {
  return BasicTypes::BytesToHex(bytes, "");
}

} // namespace Utils
} // namespace HybridLink

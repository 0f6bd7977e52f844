#ifndef HYBRIDLINK_CODEC_FRAME_CODEC_H
#define HYBRIDLINK_CODEC_FRAME_CODEC_H

/**
 * @file FrameCodec.h
 * @brief DataPoint 프레임 인코더/디코더
 *
 * 프레임 포맷 (반복):
 *   [id:1][type:1][length:2 big-endian][payload:length]
 *
 * 입력은 raw 바이트 외에 base64, JSON 배열/객체, hex 텍스트로 감싸져 올 수
 * 있다. 우선순위는 raw -> base64 -> JSON -> hex -> UTF-8 이며 처음으로
 * 비어있지 않고 well-formed 인 결과를 사용한다.
 */

#include "Codec/TypeCodec.h"
#include "Common/BasicTypes.h"
#include "Common/Enums.h"
#include "Common/Structs.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace HybridLink::Codec {

using BasicTypes::ByteBuffer;
using BasicTypes::DataPointId;
using BasicTypes::DpValue;
using Enums::DpType;
using Structs::DataPointRecord;

/**
 * @brief 지연 평가 프레임 시퀀스 (한 번만 순회 가능)
 *
 * 잘린 헤더/페이로드를 만나면 그때까지 읽은 레코드만 내보내고 나머지는
 * 버린다 (WARN 로그). 알 수 없는 타입 태그는 선언된 길이만큼 건너뛴다.
 */
class FrameReader {
public:
  explicit FrameReader(ByteBuffer buffer);

  std::optional<DataPointRecord> Next();

  bool IsExhausted() const { return exhausted_; }
  size_t DiscardedBytes() const { return discarded_bytes_; }
  size_t SkippedRecords() const { return skipped_records_; }
  size_t BufferSize() const { return buffer_.size(); }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = DataPointRecord;
    using difference_type = std::ptrdiff_t;
    using pointer = const DataPointRecord *;
    using reference = const DataPointRecord &;

    iterator() = default;
    explicit iterator(FrameReader *reader) : reader_(reader) { advance(); }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator &operator++() {
      advance();
      return *this;
    }
    bool operator==(const iterator &other) const {
      return reader_ == other.reader_;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    void advance() {
      if (!reader_)
        return;
      current_ = reader_->Next();
      if (!current_)
        reader_ = nullptr;
    }

    FrameReader *reader_ = nullptr;
    std::optional<DataPointRecord> current_;
  };

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  ByteBuffer buffer_;
  size_t offset_ = 0;
  bool exhausted_ = false;
  size_t discarded_bytes_ = 0;
  size_t skipped_records_ = 0;
};

class FrameCodec {
public:
  // =======================================================================
  // 입력 정규화
  // =======================================================================
  static ByteBuffer NormalizeInput(const ByteBuffer &input);
  static ByteBuffer NormalizeInput(const std::string &input);
  static ByteBuffer NormalizeInput(const nlohmann::json &input);

  /**
   * @brief 첫 헤더의 타입 태그가 알려진 값이고 페이로드가 버퍼 안에 있는지
   */
  static bool IsWellFormed(const ByteBuffer &bytes);

  // =======================================================================
  // 디코딩
  // =======================================================================
  static FrameReader Decode(const ByteBuffer &input);
  static FrameReader Decode(const std::string &input);
  static FrameReader Decode(const nlohmann::json &input);

  static std::vector<DataPointRecord> DecodeAll(const ByteBuffer &input);
  static std::vector<DataPointRecord> DecodeAll(const std::string &input);

  // =======================================================================
  // 인코딩
  // =======================================================================
  /**
   * @return 값이 타입과 맞지 않거나 페이로드가 65535 바이트를 넘으면 nullopt
   */
  static std::optional<ByteBuffer> Encode(DataPointId id, DpType type,
                                          const DpValue &value,
                                          const EncodeOptions &options = {});
  static std::optional<ByteBuffer> EncodeRecord(const DataPointRecord &record);
  static std::optional<ByteBuffer>
  EncodeBatch(const std::vector<DataPointRecord> &records);

  static std::string HexDump(const ByteBuffer &bytes) {
    return BasicTypes::BytesToHex(bytes);
  }

private:
  static std::optional<ByteBuffer> FromJson(const nlohmann::json &value,
                                            int depth);
  static std::optional<ByteBuffer> FromText(const std::string &text,
                                            int depth);
};

} // namespace HybridLink::Codec

#endif // HYBRIDLINK_CODEC_FRAME_CODEC_H

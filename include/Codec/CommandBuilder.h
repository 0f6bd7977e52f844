#ifndef HYBRIDLINK_CODEC_COMMAND_BUILDER_H
#define HYBRIDLINK_CODEC_COMMAND_BUILDER_H

/**
 * @file CommandBuilder.h
 * @brief 0xEF00 터널 명령 envelope 생성/해석
 *
 * envelope: [status:1][transaction:1][DataPoint 프레임 ...]
 */

#include "Codec/FrameCodec.h"
#include "Common/Structs.h"

#include <optional>
#include <vector>

namespace HybridLink::Codec {

using Structs::DataPointCommand;

class CommandBuilder {
public:
  explicit CommandBuilder(uint8_t first_transaction = 0)
      : next_transaction_(first_transaction) {}

  // 8비트 순환 트랜잭션 번호
  uint8_t NextTransaction() { return next_transaction_++; }
  uint8_t PeekTransaction() const { return next_transaction_; }

  std::optional<ByteBuffer> BuildSet(const std::vector<DataPointRecord> &records);
  std::optional<ByteBuffer> BuildSet(DataPointId id, DpType type,
                                     const DpValue &value,
                                     const EncodeOptions &options = {});

  // 길이 0 페이로드 프레임 하나로 현재 값을 요청
  ByteBuffer BuildQuery(DataPointId id, DpType type = DpType::RAW);

  static std::optional<ByteBuffer>
  BuildEnvelope(uint8_t status, uint8_t transaction,
                const std::vector<DataPointRecord> &records);

  /**
   * @brief envelope 해석
   * @return 2 바이트 미만이면 std::nullopt (MALFORMED_FRAME)
   */
  static std::optional<DataPointCommand> ParseCommand(const ByteBuffer &bytes);

private:
  uint8_t next_transaction_;
};

} // namespace HybridLink::Codec

#endif // HYBRIDLINK_CODEC_COMMAND_BUILDER_H

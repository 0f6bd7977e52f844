#include "Codec/CommandBuilder.h"
#include "Codec/TypeCodec.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"

namespace HybridLink::Codec {

std::optional<ByteBuffer>
CommandBuilder::BuildEnvelope(uint8_t status, uint8_t transaction,
                              const std::vector<DataPointRecord> &records) {
  auto frames = FrameCodec::EncodeBatch(records);
  if (!frames)
    return std::nullopt;

  ByteBuffer out;
  out.reserve(Constants::COMMAND_HEADER_SIZE + frames->size());
  out.push_back(status);
  out.push_back(transaction);
  out.insert(out.end(), frames->begin(), frames->end());
  return out;
}

std::optional<ByteBuffer>
CommandBuilder::BuildSet(const std::vector<DataPointRecord> &records) {
  return BuildEnvelope(0x00, NextTransaction(), records);
}

std::optional<ByteBuffer> CommandBuilder::BuildSet(DataPointId id, DpType type,
                                                   const DpValue &value,
                                                   const EncodeOptions &options) {
  auto payload = TypeCodec::Encode(type, value, options);
  if (!payload)
    return std::nullopt;

  DataPointRecord record;
  record.id = id;
  record.type = type;
  record.payload = std::move(*payload);
  return BuildSet(std::vector<DataPointRecord>{record});
}

ByteBuffer CommandBuilder::BuildQuery(DataPointId id, DpType type) {
  // 빈 페이로드는 항상 인코딩 가능
  return ByteBuffer{0x00,
                    NextTransaction(),
                    id,
                    static_cast<uint8_t>(type),
                    0x00,
                    0x00};
}

std::optional<DataPointCommand>
CommandBuilder::ParseCommand(const ByteBuffer &bytes) {
  if (bytes.size() < Constants::COMMAND_HEADER_SIZE) {
    LogManager::getInstance().logModule(
        LogCategory::CODEC, LogLevel::WARN,
        "malformed command envelope: {} bytes", bytes.size());
    return std::nullopt;
  }

  DataPointCommand command;
  command.status = bytes[0];
  command.transaction = bytes[1];

  FrameReader reader(ByteBuffer(bytes.begin() + 2, bytes.end()));
  for (const auto &record : reader)
    command.records.push_back(record);
  return command;
}

} // namespace HybridLink::Codec

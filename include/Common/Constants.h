#ifndef HYBRIDLINK_COMMON_CONSTANTS_H
#define HYBRIDLINK_COMMON_CONSTANTS_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace HybridLink {
namespace Constants {

// =========================================================================
// 프레임 포맷
// =========================================================================
constexpr size_t DP_HEADER_SIZE = 4; // id, type, len_hi, len_lo
constexpr size_t DP_MAX_PAYLOAD = 0xFFFF;
constexpr size_t COMMAND_HEADER_SIZE = 2; // status, transaction
constexpr uint16_t DATAPOINT_CLUSTER_ID = 0xEF00;

// DataPoint 채널 명령 번호
constexpr uint8_t DP_CMD_SET = 0x00;
constexpr uint8_t DP_CMD_REPORT = 0x01;
constexpr uint8_t DP_CMD_RESPONSE = 0x02;
constexpr uint8_t DP_CMD_QUERY = 0x03;
constexpr uint8_t DP_CMD_ACTIVE_REPORT = 0x06;

// =========================================================================
// 학습기 기본값
// =========================================================================
constexpr size_t LEARNER_HISTORY_SIZE = 20;
constexpr int LEARNER_PROMOTION_THRESHOLD = 3;
constexpr size_t LEARNER_VOTE_MIN_SAMPLES = 5;
constexpr double LEARNER_VOTE_RATIO = 0.5;

// =========================================================================
// 프로토콜 중재 기본값
// =========================================================================
constexpr std::chrono::seconds OBSERVATION_WINDOW{15 * 60};
constexpr double ARBITRATION_MAJORITY_FACTOR = 2.0;
constexpr std::chrono::hours AFFINITY_MAX_AGE{24};

// =========================================================================
// 매핑 신뢰도
// =========================================================================
constexpr double CONFIDENCE_REGISTRY = 1.0;
constexpr double CONFIDENCE_INFERRED = 0.4;

// 영속 상태 문서 버전 - 포맷 변경 시 올려서 이전 결정을 무효화
constexpr int PERSISTED_STATE_VERSION = 2;

} // namespace Constants
} // namespace HybridLink

#endif // HYBRIDLINK_COMMON_CONSTANTS_H

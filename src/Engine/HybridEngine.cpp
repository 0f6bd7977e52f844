#include "Engine/HybridEngine.h"
#include "Codec/FrameCodec.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"
#include "Normalizer/ValueNormalizer.h"

#include <algorithm>
#include <sstream>

namespace HybridLink::Engine {

using json = nlohmann::json;

HybridEngine::HybridEngine(EngineSettings settings,
                           Scheduling::ClockFunction clock)
    : settings_(std::move(settings)), scheduler_(std::move(clock)) {}

HybridEngine::~HybridEngine() {
  for (auto &kv : sessions_)
    kv.second->Teardown();
  sessions_.clear();
}

size_t HybridEngine::LoadProfiles() {
  if (settings_.load_builtin_profiles)
    registry_.LoadBuiltinProfiles();
  if (!settings_.profile_file.empty())
    registry_.LoadProfilesFromFile(settings_.profile_file);
  return registry_.Size();
}

// =============================================================================
// 디바이스 생명주기
// =============================================================================

bool HybridEngine::InitializeDevice(const DeviceId &device_id,
                                    const Profile::DeviceFingerprint &fingerprint) {
  if (device_id.empty()) {
    LogManager::getInstance().log(LogCategory::ENGINE, LogLevel::WARN,
                                  "InitializeDevice: empty device id");
    return false;
  }

  if (HasDevice(device_id)) {
    LogManager::getInstance().logModule(
        LogCategory::ENGINE, LogLevel::WARN,
        "device {} already initialized, replacing session", device_id);
    RemoveDevice(device_id);
  }

  auto profile = registry_.Resolve(fingerprint);
  if (!profile) {
    LogManager::getInstance().logModule(
        LogCategory::ENGINE, LogLevel::INFO,
        "{}: fingerprint {} is unmapped, using data point conventions",
        device_id, fingerprint.ToString());
  }

  auto session = std::make_unique<DeviceSession>(
      device_id, fingerprint, std::move(profile), scheduler_, settings_);
  ApplyPendingState(*session);
  session->Arbitrator().Start();

  LogManager::getInstance().logModule(
      LogCategory::ENGINE, LogLevel::INFO, "device {} initialized ({}, {})",
      device_id, session->IsMapped() ? session->ActiveProfile()->name
                                     : std::string("unmapped"),
      Enums::ArbitrationStateToString(session->Arbitrator().State()));

  sessions_[device_id] = std::move(session);
  return true;
}

bool HybridEngine::RemoveDevice(const DeviceId &device_id) {
  auto it = sessions_.find(device_id);
  if (it == sessions_.end())
    return false;

  it->second->Teardown();
  sessions_.erase(it);
  LogManager::getInstance().logModule(LogCategory::ENGINE, LogLevel::INFO,
                                      "device {} removed", device_id);
  return true;
}

bool HybridEngine::HasDevice(const DeviceId &device_id) const {
  return sessions_.find(device_id) != sessions_.end();
}

std::vector<DeviceId> HybridEngine::DeviceIds() const {
  std::vector<DeviceId> ids;
  ids.reserve(sessions_.size());
  for (const auto &kv : sessions_)
    ids.push_back(kv.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

DeviceSession *HybridEngine::FindSession(const DeviceId &device_id) {
  auto it = sessions_.find(device_id);
  return it == sessions_.end() ? nullptr : it->second.get();
}

const DeviceSession *HybridEngine::FindSession(const DeviceId &device_id) const {
  auto it = sessions_.find(device_id);
  return it == sessions_.end() ? nullptr : it->second.get();
}

CapabilityUpdate HybridEngine::UnknownDevice(const DeviceId &device_id) const {
  LogManager::getInstance().logModule(LogCategory::ENGINE, LogLevel::WARN,
                                      "event for unknown device {}", device_id);
  CapabilityUpdate update;
  update.device_id = device_id;
  update.error = ErrorCode::UNKNOWN_DEVICE;
  update.quality = Enums::DataQuality::UNMAPPED;
  update.timestamp = BasicTypes::GetCurrentTimestamp();
  update.normalization.message = "device is not initialized";
  return update;
}

// =============================================================================
// 이벤트 처리
// =============================================================================

CapabilityUpdate HybridEngine::ObserveProtocolEvent(
    const DeviceId &device_id, ProtocolPath path, uint32_t key,
    const std::optional<DpValue> &raw) {
  DeviceSession *session = FindSession(device_id);
  if (!session)
    return UnknownDevice(device_id);
  return session->Observe(path, key, raw);
}

std::vector<CapabilityUpdate>
HybridEngine::ProcessDataPointFrame(const DeviceId &device_id,
                                    const ByteBuffer &input) {
  DeviceSession *session = FindSession(device_id);
  if (!session)
    return {UnknownDevice(device_id)};

  ByteBuffer bytes = Codec::FrameCodec::NormalizeInput(input);
  Codec::FrameReader reader(bytes);

  std::vector<CapabilityUpdate> updates;
  std::ostringstream summary;
  for (const auto &record : reader) {
    updates.push_back(session->ProcessRecord(record));
    const CapabilityUpdate &update = updates.back();
    summary << "dp" << static_cast<int>(record.id) << "="
            << (update.raw_value ? BasicTypes::DpValueToString(*update.raw_value)
                                 : std::string("?"))
            << " ";
  }
  if (reader.DiscardedBytes() > 0)
    summary << "(+" << reader.DiscardedBytes() << " bytes discarded)";

  LogManager::getInstance().logFrame(device_id, bytes, summary.str());
  return updates;
}

std::vector<CapabilityUpdate>
HybridEngine::ProcessDataPointFrame(const DeviceId &device_id,
                                    const std::string &input) {
  if (!HasDevice(device_id))
    return {UnknownDevice(device_id)};
  return ProcessDataPointFrame(device_id,
                               Codec::FrameCodec::NormalizeInput(input));
}

std::optional<ByteBuffer>
HybridEngine::BuildDataPointCommand(const DeviceId &device_id, DataPointId id,
                                    DpType type, const DpValue &value) {
  DeviceSession *session = FindSession(device_id);
  if (!session) {
    LogManager::getInstance().logModule(LogCategory::ENGINE, LogLevel::WARN,
                                        "command for unknown device {}",
                                        device_id);
    return std::nullopt;
  }
  // 매핑된 DataPoint 는 규칙의 signed 여부로 범위를 검사한다
  Codec::EncodeOptions options;
  if (auto mapping = session->Resolve(ProtocolPath::DATAPOINT, id))
    options.signed_value = mapping->rule.signed_value;
  return session->Commands().BuildSet(id, type, value, options);
}

// =============================================================================
// 조회
// =============================================================================

std::optional<Protocol::AffinityReport>
HybridEngine::GetProtocolAffinity(const DeviceId &device_id) const {
  const DeviceSession *session = FindSession(device_id);
  if (!session)
    return std::nullopt;
  return session->Arbitrator().Report();
}

json HybridEngine::GetDeviceStatus(const DeviceId &device_id) const {
  const DeviceSession *session = FindSession(device_id);
  if (!session) {
    return json{{"device", device_id}, {"error", "device not found"}};
  }
  return session->Status();
}

json HybridEngine::GetEngineStatus() const {
  json devices = json::array();
  for (const auto &id : DeviceIds())
    devices.push_back(GetDeviceStatus(id));

  return json{{"devices", devices},
              {"deviceCount", sessions_.size()},
              {"profiles", registry_.Size()},
              {"pendingTimers", scheduler_.PendingCount()},
              {"settings", settings_.ToJson()}};
}

// =============================================================================
// 학습 초기화
// =============================================================================

bool HybridEngine::ResetLearning(const DeviceId &device_id,
                                 const BasicTypes::CapabilityId &capability) {
  DeviceSession *session = FindSession(device_id);
  if (!session)
    return false;
  return session->Learner().Reset(device_id, capability);
}

size_t HybridEngine::ResetLearning(const DeviceId &device_id) {
  DeviceSession *session = FindSession(device_id);
  if (!session)
    return 0;
  size_t removed = session->Learner().ResetDevice(device_id);
  LogManager::getInstance().logModule(LogCategory::LEARNER, LogLevel::INFO,
                                      "learning reset for {} ({} keys)",
                                      device_id, removed);
  return removed;
}

// =============================================================================
// 영속 상태
// =============================================================================

json HybridEngine::ExportState() const {
  json divisors = json::array();
  json affinities = json::array();

  for (const auto &id : DeviceIds()) {
    const DeviceSession *session = FindSession(id);
    for (const auto &entry : session->Learner().Export())
      divisors.push_back(entry);
    if (auto persisted = session->Arbitrator().Persisted()) {
      affinities.push_back(
          {{"device", id},
           {"affinity", Enums::ProtocolAffinityToString(persisted->affinity)},
           {"decidedAt",
            BasicTypes::TimestampToEpochMs(persisted->decided_at)}});
    }
  }

  // 아직 초기화되지 않은 디바이스의 상태는 그대로 다시 내보낸다
  for (const auto &kv : pending_divisors_) {
    for (const auto &entry : kv.second)
      divisors.push_back(entry);
  }
  for (const auto &kv : pending_affinities_) {
    affinities.push_back(
        {{"device", kv.first},
         {"affinity", Enums::ProtocolAffinityToString(kv.second.affinity)},
         {"decidedAt", BasicTypes::TimestampToEpochMs(kv.second.decided_at)}});
  }

  return json{{"version", Constants::PERSISTED_STATE_VERSION},
              {"learnedDivisors", divisors},
              {"affinities", affinities}};
}

ErrorCode HybridEngine::ImportState(const json &document) {
  auto reject = [](const std::string &reason) {
    LogManager::getInstance().log(LogCategory::ENGINE, LogLevel::WARN,
                                  "invalid state document: " + reason);
    return ErrorCode::INVALID_STATE_DOCUMENT;
  };

  if (!document.is_object())
    return reject("not an object");
  auto version = document.find("version");
  if (version == document.end() || !version->is_number_integer())
    return reject("version missing");
  const json empty = json::array();
  const json &divisors = document.contains("learnedDivisors")
                             ? document.at("learnedDivisors")
                             : empty;
  const json &affinities =
      document.contains("affinities") ? document.at("affinities") : empty;
  if (!divisors.is_array() || !affinities.is_array())
    return reject("learnedDivisors/affinities must be arrays");

  const int doc_version = version->get<int>();
  if (doc_version != Constants::PERSISTED_STATE_VERSION) {
    LogManager::getInstance().logModule(
        LogCategory::ENGINE, LogLevel::INFO,
        "state document version {} differs from {}, affinities will be "
        "ignored",
        doc_version, Constants::PERSISTED_STATE_VERSION);
  }

  // 학습 divisor - 디바이스별로 묶어서 학습기에 전달
  std::map<DeviceId, json> by_device;
  for (const auto &entry : divisors) {
    if (!entry.is_object() || !entry.contains("device") ||
        !entry.at("device").is_string()) {
      LogManager::getInstance().log(LogCategory::ENGINE, LogLevel::WARN,
                                    "skipping learned divisor without device: " +
                                        entry.dump());
      continue;
    }
    json &list = by_device[entry.at("device").get<std::string>()];
    if (list.is_null())
      list = json::array();
    list.push_back(entry);
  }
  for (auto &kv : by_device) {
    if (DeviceSession *session = FindSession(kv.first)) {
      session->Learner().Import(kv.second);
    } else {
      json &pending = pending_divisors_[kv.first];
      if (pending.is_null())
        pending = json::array();
      for (const auto &entry : kv.second)
        pending.push_back(entry);
    }
  }

  // 프로토콜 결정
  for (const auto &entry : affinities) {
    if (!entry.is_object() || !entry.contains("device") ||
        !entry.at("device").is_string() || !entry.contains("affinity") ||
        !entry.at("affinity").is_string() || !entry.contains("decidedAt") ||
        !entry.at("decidedAt").is_number_integer()) {
      LogManager::getInstance().log(LogCategory::ENGINE, LogLevel::WARN,
                                    "skipping malformed affinity: " +
                                        entry.dump());
      continue;
    }

    Protocol::PersistedAffinity persisted;
    persisted.affinity = Enums::StringToProtocolAffinity(
        entry.at("affinity").get<std::string>());
    persisted.decided_at =
        BasicTypes::EpochMsToTimestamp(entry.at("decidedAt").get<int64_t>());
    persisted.version = doc_version;

    const DeviceId device = entry.at("device").get<std::string>();
    if (DeviceSession *session = FindSession(device)) {
      session->Arbitrator().RestoreDecision(persisted);
    } else if (doc_version == Constants::PERSISTED_STATE_VERSION) {
      pending_affinities_[device] = persisted;
    }
  }

  return ErrorCode::SUCCESS;
}

void HybridEngine::ApplyPendingState(DeviceSession &session) {
  auto divisors = pending_divisors_.find(session.Id());
  if (divisors != pending_divisors_.end()) {
    session.Learner().Import(divisors->second);
    pending_divisors_.erase(divisors);
  }

  auto affinity = pending_affinities_.find(session.Id());
  if (affinity != pending_affinities_.end()) {
    session.Arbitrator().RestoreDecision(affinity->second);
    pending_affinities_.erase(affinity);
  }
}

// =============================================================================
// 상태 없는 연산
// =============================================================================

std::vector<DataPointRecord> HybridEngine::DecodeFrame(const ByteBuffer &input) {
  return Codec::FrameCodec::DecodeAll(input);
}

std::optional<ByteBuffer> HybridEngine::EncodeDataPoint(DataPointId id,
                                                        DpType type,
                                                        const DpValue &value) {
  return Codec::FrameCodec::Encode(id, type, value);
}

NormalizationResult HybridEngine::Normalize(const DpValue &raw,
                                            const Profile::ConversionRule &rule) {
  return Normalizer::ValueNormalizer::Normalize(raw, rule);
}

} // namespace HybridLink::Engine

#include "Engine/DeviceSession.h"
#include "Codec/TypeCodec.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"
#include "Normalizer/ValueNormalizer.h"
#include "Profile/KnownMappings.h"

namespace HybridLink::Engine {

using Enums::CorrectionKind;
using Enums::DataQuality;
using Enums::ErrorCode;

DeviceSession::DeviceSession(DeviceId device_id,
                             Profile::DeviceFingerprint fingerprint,
                             std::optional<Profile::CapabilityProfile> profile,
                             Scheduling::TimerScheduler &scheduler,
                             const EngineSettings &settings)
    : device_id_(std::move(device_id)), fingerprint_(std::move(fingerprint)),
      profile_(std::move(profile)), learner_(settings.learner),
      arbitrator_(std::make_unique<Protocol::ProtocolArbitrator>(
          device_id_, fingerprint_, scheduler, settings.arbitrator)),
      created_at_(BasicTypes::GetCurrentTimestamp()) {}

DeviceSession::~DeviceSession() { Teardown(); }

void DeviceSession::Teardown() {
  if (arbitrator_)
    arbitrator_->Cancel();
}

// =============================================================================
// 매핑 해석
// =============================================================================

std::optional<Profile::ResolvedMapping>
DeviceSession::Resolve(ProtocolPath path, uint32_t key) const {
  if (path == ProtocolPath::CLUSTER) {
    if (key > 0xFFFF)
      return std::nullopt;
    return Profile::ClusterMap::Lookup(static_cast<BasicTypes::ClusterId>(key));
  }

  if (key > 0xFF)
    return std::nullopt;
  auto id = static_cast<BasicTypes::DataPointId>(key);

  if (profile_) {
    const Profile::DataPointMapping *mapping = profile_->FindDataPoint(id);
    if (!mapping)
      return std::nullopt;
    return Profile::ResolvedMapping{mapping->capability, mapping->rule,
                                    Constants::CONFIDENCE_REGISTRY};
  }
  return Profile::DataPointConventions::Lookup(id);
}

// =============================================================================
// 관측
// =============================================================================

CapabilityUpdate DeviceSession::Observe(ProtocolPath path, uint32_t key,
                                        const std::optional<DpValue> &raw) {
  arbitrator_->ObserveEvent(path, key, ProfilePtr());
  auto mapping = Resolve(path, key);

  if (!raw) {
    CapabilityUpdate update;
    update.device_id = device_id_;
    update.timestamp = BasicTypes::GetCurrentTimestamp();
    if (mapping) {
      update.capability = mapping->capability;
      update.confidence = mapping->confidence;
    }
    update.normalization.message = "event without value";
    return update;
  }
  return Evaluate(path, key, mapping, *raw);
}

CapabilityUpdate DeviceSession::ProcessRecord(const DataPointRecord &record) {
  arbitrator_->ObserveEvent(ProtocolPath::DATAPOINT, record.id, ProfilePtr());
  auto mapping = Resolve(ProtocolPath::DATAPOINT, record.id);

  Codec::DecodeOptions options;
  if (mapping) {
    options.signed_value = mapping->rule.signed_value;
    if (const auto *en =
            std::get_if<Profile::EnumMapTransform>(&mapping->rule.transform))
      options.enum_names = &en->names;
  }

  auto value = Codec::TypeCodec::Decode(record, options);
  if (!value) {
    ++type_mismatches_;
    CapabilityUpdate update;
    update.device_id = device_id_;
    update.timestamp = BasicTypes::GetCurrentTimestamp();
    if (mapping) {
      update.capability = mapping->capability;
      update.confidence = mapping->confidence;
    }
    update.error = ErrorCode::TYPE_MISMATCH;
    update.quality = DataQuality::QUARANTINED;
    update.normalization.correction = CorrectionKind::REJECTED;
    update.normalization.message =
        "payload does not match type " + Enums::DpTypeToString(record.type);
    return update;
  }

  return Evaluate(ProtocolPath::DATAPOINT, record.id, mapping, *value);
}

CapabilityUpdate DeviceSession::Evaluate(
    ProtocolPath path, uint32_t key,
    const std::optional<Profile::ResolvedMapping> &mapping,
    const DpValue &raw) {
  CapabilityUpdate update;
  update.device_id = device_id_;
  update.raw_value = raw;
  update.timestamp = BasicTypes::GetCurrentTimestamp();

  if (!mapping) {
    ++unmapped_;
    update.error = ErrorCode::UNKNOWN_DATAPOINT;
    update.quality = DataQuality::UNMAPPED;
    update.normalization.message = "no capability mapping";
    LogManager::getInstance().logModule(
        LogCategory::ENGINE, LogLevel::INFO,
        "{}: unmapped {} {} = {} ({})", device_id_,
        Enums::ProtocolPathToString(path), key,
        BasicTypes::DpValueToString(raw), fingerprint_.ToString());
    return update;
  }

  update.capability = mapping->capability;
  update.confidence = mapping->confidence;
  update.normalization = Normalizer::ValueNormalizer::NormalizeFor(
      learner_, Learning::LearningKey{device_id_, mapping->capability, path},
      raw, mapping->rule);
  AssignQuality(update);

  if (update.ShouldUpdate())
    ++updates_;
  else
    ++rejected_;

  return update;
}

void DeviceSession::AssignQuality(CapabilityUpdate &update) const {
  const auto &result = update.normalization;
  const std::string capability = update.capability.value_or("");

  if (!result.is_valid) {
    update.quality = DataQuality::QUARANTINED;
    update.error = ErrorCode::OUT_OF_RANGE_UNCORRECTABLE;
    LogManager::getInstance().logDataQuality(device_id_, capability,
                                             update.quality, result.message);
    return;
  }

  if (result.correction == CorrectionKind::CLAMPED_MIN) {
    update.quality = DataQuality::CLAMPED;
    LogManager::getInstance().logDataQuality(device_id_, capability,
                                             update.quality, result.message);
  } else if (update.confidence < Constants::CONFIDENCE_REGISTRY) {
    update.quality = DataQuality::UNCERTAIN;
  } else if (result.correction == CorrectionKind::DIVISOR ||
             result.correction == CorrectionKind::MULTIPLIER) {
    update.quality = DataQuality::CORRECTED;
  } else {
    update.quality = DataQuality::GOOD;
  }
}

nlohmann::json DeviceSession::Status() const {
  nlohmann::json learned = learner_.Export();
  return nlohmann::json{
      {"device", device_id_},
      {"vendorId", fingerprint_.vendor_id},
      {"modelId", fingerprint_.model_id},
      {"mapped", IsMapped()},
      {"profile", profile_ ? profile_->name : std::string()},
      {"createdAt", BasicTypes::TimestampToString(created_at_)},
      {"updates", updates_},
      {"rejected", rejected_},
      {"unmapped", unmapped_},
      {"typeMismatches", type_mismatches_},
      {"trackedKeys", learner_.TrackedKeys()},
      {"learnedDivisors", learned},
      {"protocol", arbitrator_->Report().ToJson()}};
}

} // namespace HybridLink::Engine

#include "Protocol/ProtocolArbitrator.h"
#include "Common/Constants.h"
#include "Logging/LogManager.h"
#include "Profile/KnownMappings.h"

#include <algorithm>

namespace HybridLink::Protocol {

using json = nlohmann::json;

namespace {

json OptionalTimestamp(const std::optional<Timestamp> &ts) {
  if (!ts)
    return nullptr;
  return BasicTypes::TimestampToEpochMs(*ts);
}

} // namespace

json AffinityReport::ToJson() const {
  json caps = json::array();
  for (const auto &d : discovered) {
    caps.push_back({{"capability", d.capability},
                    {"clusterHits", d.cluster_hits},
                    {"dataPointHits", d.datapoint_hits},
                    {"confidence", d.confidence}});
  }
  return json{{"device", device_id},
              {"state", Enums::ArbitrationStateToString(state)},
              {"affinity", Enums::ProtocolAffinityToString(affinity)},
              {"clusterHits", cluster_hits},
              {"dataPointHits", datapoint_hits},
              {"lastClusterHit", OptionalTimestamp(last_cluster_hit)},
              {"lastDataPointHit", OptionalTimestamp(last_datapoint_hit)},
              {"decidedAt", OptionalTimestamp(decided_at)},
              {"restored", restored},
              {"discoveredCapabilities", caps}};
}

ProtocolArbitrator::ProtocolArbitrator(DeviceId device_id,
                                       Profile::DeviceFingerprint fingerprint,
                                       Scheduling::TimerScheduler &scheduler,
                                       ArbitratorSettings settings)
    : device_id_(std::move(device_id)), fingerprint_(std::move(fingerprint)),
      scheduler_(scheduler), settings_(settings) {}

void ProtocolArbitrator::Start() {
  if (started_ || IsDecided())
    return;
  started_ = true;

  Scheduling::TimerToken token =
      scheduler_.Schedule(settings_.window, [this] { Decide(); });
  window_timer_ = Scheduling::ScopedTimer(scheduler_, token);

  LogManager::getInstance().logModule(
      LogCategory::ARBITRATOR, LogLevel::DEBUG,
      "observation window started for {} ({} s)", device_id_,
      std::chrono::duration_cast<std::chrono::seconds>(settings_.window)
          .count());
}

bool ProtocolArbitrator::RestoreDecision(const PersistedAffinity &persisted,
                                         Timestamp now) {
  if (IsDecided())
    return false;

  if (persisted.version != Constants::PERSISTED_STATE_VERSION) {
    LogManager::getInstance().logModule(
        LogCategory::ARBITRATOR, LogLevel::INFO,
        "ignoring persisted affinity for {}: version {} != {}", device_id_,
        persisted.version, Constants::PERSISTED_STATE_VERSION);
    return false;
  }
  if (persisted.affinity == ProtocolAffinity::UNDECIDED)
    return false;

  auto age = now - persisted.decided_at;
  if (age < Timestamp::duration::zero() || age >= settings_.max_restore_age) {
    LogManager::getInstance().logModule(
        LogCategory::ARBITRATOR, LogLevel::INFO,
        "ignoring stale persisted affinity for {} (decided {})", device_id_,
        BasicTypes::TimestampToString(persisted.decided_at));
    return false;
  }

  window_timer_.Reset();
  state_ = ArbitrationState::DECIDED;
  affinity_ = persisted.affinity;
  decided_at_ = persisted.decided_at;
  restored_ = true;

  LogManager::getInstance().logModule(
      LogCategory::ARBITRATOR, LogLevel::INFO, "restored affinity {} for {}",
      Enums::ProtocolAffinityToString(affinity_), device_id_);
  return true;
}

bool ProtocolArbitrator::ObserveEvent(ProtocolPath path, uint32_t key,
                                      const Profile::CapabilityProfile *profile) {
  if (IsDecided())
    return false;

  const Timestamp now = BasicTypes::GetCurrentTimestamp();

  if (path == ProtocolPath::CLUSTER) {
    ++cluster_hits_;
    last_cluster_hit_ = now;
    if (key <= 0xFFFF) {
      if (auto mapping =
              Profile::ClusterMap::Lookup(static_cast<uint16_t>(key))) {
        Discover(mapping->capability, path, mapping->confidence);
      }
    }
  } else {
    ++datapoint_hits_;
    last_datapoint_hit_ = now;
    if (key <= 0xFF) {
      auto id = static_cast<BasicTypes::DataPointId>(key);
      const Profile::DataPointMapping *mapped =
          profile ? profile->FindDataPoint(id) : nullptr;
      if (mapped) {
        Discover(mapped->capability, path, Constants::CONFIDENCE_REGISTRY);
      } else if (auto inferred = Profile::DataPointConventions::Lookup(id)) {
        Discover(inferred->capability, path, inferred->confidence);
      }
    }
  }
  return true;
}

void ProtocolArbitrator::Discover(const CapabilityId &capability,
                                  ProtocolPath path, double confidence) {
  DiscoveredCapability &entry = discovered_[capability];
  if (entry.capability.empty()) {
    entry.capability = capability;
    LogManager::getInstance().logModule(
        LogCategory::ARBITRATOR, LogLevel::DEBUG,
        "{} discovered capability {} via {}", device_id_, capability,
        Enums::ProtocolPathToString(path));
  }
  if (path == ProtocolPath::CLUSTER)
    ++entry.cluster_hits;
  else
    ++entry.datapoint_hits;
  entry.confidence = std::max(entry.confidence, confidence);
}

ProtocolAffinity ProtocolArbitrator::Classify(size_t cluster_hits,
                                              size_t datapoint_hits,
                                              double majority_factor) {
  const double c = static_cast<double>(cluster_hits);
  const double t = static_cast<double>(datapoint_hits);
  if (t > majority_factor * c)
    return ProtocolAffinity::DATAPOINT_ONLY;
  if (c > majority_factor * t)
    return ProtocolAffinity::CLUSTER_ONLY;
  return ProtocolAffinity::HYBRID;
}

ProtocolAffinity ProtocolArbitrator::Decide() {
  if (IsDecided())
    return affinity_;

  window_timer_.Reset();
  affinity_ = Classify(cluster_hits_, datapoint_hits_, settings_.majority_factor);
  state_ = ArbitrationState::DECIDED;
  decided_at_ = BasicTypes::GetCurrentTimestamp();

  LogManager::getInstance().logModule(
      LogCategory::ARBITRATOR, LogLevel::INFO,
      "{} decided {} (cluster={}, datapoint={}, capabilities={})", device_id_,
      Enums::ProtocolAffinityToString(affinity_), cluster_hits_,
      datapoint_hits_, discovered_.size());

  CheckKnownProtocol();
  return affinity_;
}

void ProtocolArbitrator::CheckKnownProtocol() const {
  auto hint = Profile::KnownProtocols::Lookup(fingerprint_);
  if (!hint || hint->expected == affinity_)
    return;

  LogManager::getInstance().logModule(
      LogCategory::ARBITRATOR, LogLevel::WARN,
      "{} ({}) decided {} but {} is expected: {}", device_id_,
      fingerprint_.ToString(), Enums::ProtocolAffinityToString(affinity_),
      Enums::ProtocolAffinityToString(hint->expected), hint->notes);
}

std::optional<PersistedAffinity> ProtocolArbitrator::Persisted() const {
  if (!IsDecided() || !decided_at_)
    return std::nullopt;
  PersistedAffinity persisted;
  persisted.affinity = affinity_;
  persisted.decided_at = *decided_at_;
  return persisted;
}

AffinityReport ProtocolArbitrator::Report() const {
  AffinityReport report;
  report.device_id = device_id_;
  report.state = state_;
  report.affinity = affinity_;
  report.cluster_hits = cluster_hits_;
  report.datapoint_hits = datapoint_hits_;
  report.last_cluster_hit = last_cluster_hit_;
  report.last_datapoint_hit = last_datapoint_hit_;
  report.decided_at = decided_at_;
  report.restored = restored_;
  for (const auto &kv : discovered_)
    report.discovered.push_back(kv.second);
  return report;
}

} // namespace HybridLink::Protocol

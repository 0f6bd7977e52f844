/**
 * @file test_protocol_arbitrator.cpp
 * @brief 프로토콜 경로 판정 테스트
 *
 * 검증 목표:
 * 1. 관측 창 종료 시 다수결 판정 (T > 2C, C > 2T, 그 외 hybrid)
 * 2. 판정은 한 번만, 이후 이벤트 무시
 * 3. 저장된 결정 복원 조건 (버전, 나이)
 */

#include <gtest/gtest.h>

#include "Logging/LogManager.h"
#include "Profile/ProfileRegistry.h"
#include "Protocol/ProtocolArbitrator.h"

#include <chrono>
#include <memory>

using namespace HybridLink;
using namespace std::chrono_literals;
using Enums::ArbitrationState;
using Enums::ProtocolAffinity;
using Enums::ProtocolPath;
using Protocol::ArbitratorSettings;
using Protocol::PersistedAffinity;
using Protocol::ProtocolArbitrator;

class ProtocolArbitratorTest : public ::testing::Test {
protected:
    BasicTypes::SteadyTime now_ = BasicTypes::SteadyTime{} + 1h;
    Scheduling::TimerScheduler scheduler_{[this] { return now_; }};
    Profile::DeviceFingerprint fingerprint_{"_TZE284_vvmbj46n", "TS0601"};

    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setLogLevel(LogLevel::DEBUG);
    }

    std::unique_ptr<ProtocolArbitrator> MakeArbitrator(ArbitratorSettings settings = {}) {
        return std::make_unique<ProtocolArbitrator>("zb-0001", fingerprint_, scheduler_, settings);
    }

    void Feed(ProtocolArbitrator& arbitrator, size_t cluster, size_t datapoint) {
        for (size_t i = 0; i < cluster; ++i)
            arbitrator.ObserveEvent(ProtocolPath::CLUSTER, 0x0402);
        for (size_t i = 0; i < datapoint; ++i)
            arbitrator.ObserveEvent(ProtocolPath::DATAPOINT, 1);
    }

    void Advance(BasicTypes::Duration d) {
        now_ += d;
        scheduler_.RunDue();
    }
};

// =============================================================================
// 분류
// =============================================================================

TEST_F(ProtocolArbitratorTest, ClassifyByMajority) {
    EXPECT_EQ(ProtocolArbitrator::Classify(10, 0, 2.0), ProtocolAffinity::CLUSTER_ONLY);
    EXPECT_EQ(ProtocolArbitrator::Classify(5, 5, 2.0), ProtocolAffinity::HYBRID);
    EXPECT_EQ(ProtocolArbitrator::Classify(1, 25, 2.0), ProtocolAffinity::DATAPOINT_ONLY);
    // 이벤트가 없으면 hybrid
    EXPECT_EQ(ProtocolArbitrator::Classify(0, 0, 2.0), ProtocolAffinity::HYBRID);
    // 정확히 두 배는 다수가 아니다
    EXPECT_EQ(ProtocolArbitrator::Classify(4, 2, 2.0), ProtocolAffinity::HYBRID);
    EXPECT_EQ(ProtocolArbitrator::Classify(0, 1, 2.0), ProtocolAffinity::DATAPOINT_ONLY);
}

// =============================================================================
// 관측 창
// =============================================================================

TEST_F(ProtocolArbitratorTest, DecidesWhenWindowElapses) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();
    EXPECT_TRUE(arbitrator->IsWindowPending());
    EXPECT_EQ(arbitrator->State(), ArbitrationState::OBSERVING);
    EXPECT_FALSE(arbitrator->Persisted().has_value());

    Feed(*arbitrator, 1, 25);

    Advance(14min);
    EXPECT_FALSE(arbitrator->IsDecided());

    Advance(1min);
    EXPECT_TRUE(arbitrator->IsDecided());
    EXPECT_EQ(arbitrator->Affinity(), ProtocolAffinity::DATAPOINT_ONLY);
    EXPECT_FALSE(arbitrator->IsWindowPending());

    auto persisted = arbitrator->Persisted();
    ASSERT_TRUE(persisted.has_value());
    EXPECT_EQ(persisted->affinity, ProtocolAffinity::DATAPOINT_ONLY);
    EXPECT_EQ(persisted->version, Constants::PERSISTED_STATE_VERSION);
}

TEST_F(ProtocolArbitratorTest, EventsAfterDecisionAreIgnored) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();
    Feed(*arbitrator, 10, 0);
    EXPECT_EQ(arbitrator->Decide(), ProtocolAffinity::CLUSTER_ONLY);

    EXPECT_FALSE(arbitrator->ObserveEvent(ProtocolPath::DATAPOINT, 1));
    Feed(*arbitrator, 0, 100);
    EXPECT_EQ(arbitrator->DataPointHits(), 0u);

    // 다시 판정해도 기존 결정
    EXPECT_EQ(arbitrator->Decide(), ProtocolAffinity::CLUSTER_ONLY);
}

TEST_F(ProtocolArbitratorTest, StartIsIdempotent) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();
    arbitrator->Start();
    EXPECT_EQ(scheduler_.PendingCount(), 1u);

    arbitrator->Decide();
    arbitrator->Start();
    EXPECT_EQ(scheduler_.PendingCount(), 0u);
}

TEST_F(ProtocolArbitratorTest, CustomWindowAndFactor) {
    ArbitratorSettings settings;
    settings.window = 30s;
    settings.majority_factor = 3.0;
    auto arbitrator = MakeArbitrator(settings);
    arbitrator->Start();

    // 3배 기준: 10 > 3*4 가 아니므로 hybrid
    Feed(*arbitrator, 4, 10);
    Advance(30s);
    EXPECT_EQ(arbitrator->Affinity(), ProtocolAffinity::HYBRID);
}

TEST_F(ProtocolArbitratorTest, DestructionCancelsWindow) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();
    EXPECT_EQ(scheduler_.PendingCount(), 1u);

    arbitrator.reset();
    EXPECT_EQ(scheduler_.PendingCount(), 0u);
    EXPECT_NO_THROW(Advance(1h));
}

TEST_F(ProtocolArbitratorTest, CancelStopsWindow) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();
    arbitrator->Cancel();
    Advance(1h);
    EXPECT_FALSE(arbitrator->IsDecided());
}

// =============================================================================
// capability 발견
// =============================================================================

TEST_F(ProtocolArbitratorTest, DiscoveryConfidence) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();

    // 프로필 없이 DataPoint 관례로만 추론
    arbitrator->ObserveEvent(ProtocolPath::DATAPOINT, 1);
    auto report = arbitrator->Report();
    ASSERT_EQ(report.discovered.size(), 1u);
    EXPECT_EQ(report.discovered[0].capability, "measure_temperature");
    EXPECT_DOUBLE_EQ(report.discovered[0].confidence, Constants::CONFIDENCE_INFERRED);

    // cluster 근거가 신뢰도를 올린다
    arbitrator->ObserveEvent(ProtocolPath::CLUSTER, 0x0402);
    report = arbitrator->Report();
    ASSERT_EQ(report.discovered.size(), 1u);
    EXPECT_EQ(report.discovered[0].cluster_hits, 1u);
    EXPECT_EQ(report.discovered[0].datapoint_hits, 1u);
    EXPECT_DOUBLE_EQ(report.discovered[0].confidence, Constants::CONFIDENCE_REGISTRY);
}

TEST_F(ProtocolArbitratorTest, DiscoveryUsesProfileMapping) {
    Profile::ProfileRegistry registry;
    registry.LoadBuiltinProfiles();
    auto profile = registry.Resolve(fingerprint_);
    ASSERT_TRUE(profile.has_value());

    auto arbitrator = MakeArbitrator();
    arbitrator->Start();
    arbitrator->ObserveEvent(ProtocolPath::DATAPOINT, 4, &*profile);
    // 매핑도 관례도 없는 id 는 세기만 한다
    arbitrator->ObserveEvent(ProtocolPath::DATAPOINT, 250, &*profile);

    auto report = arbitrator->Report();
    EXPECT_EQ(report.datapoint_hits, 2u);
    ASSERT_EQ(report.discovered.size(), 1u);
    EXPECT_EQ(report.discovered[0].capability, "measure_battery");
    EXPECT_DOUBLE_EQ(report.discovered[0].confidence, Constants::CONFIDENCE_REGISTRY);
}

// =============================================================================
// 복원
// =============================================================================

TEST_F(ProtocolArbitratorTest, RestoreRecentDecision) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();

    const auto now = BasicTypes::GetCurrentTimestamp();
    PersistedAffinity persisted;
    persisted.affinity = ProtocolAffinity::HYBRID;
    persisted.decided_at = now - 1h;

    EXPECT_TRUE(arbitrator->RestoreDecision(persisted, now));
    EXPECT_TRUE(arbitrator->IsDecided());
    EXPECT_EQ(arbitrator->Affinity(), ProtocolAffinity::HYBRID);
    EXPECT_FALSE(arbitrator->IsWindowPending());
    EXPECT_EQ(scheduler_.PendingCount(), 0u);
    EXPECT_TRUE(arbitrator->Report().restored);

    // 이미 결정됐으면 다시 복원하지 않는다
    EXPECT_FALSE(arbitrator->RestoreDecision(persisted, now));
}

TEST_F(ProtocolArbitratorTest, RestoreRejectsStaleOrInvalidState) {
    const auto now = BasicTypes::GetCurrentTimestamp();
    PersistedAffinity persisted;
    persisted.affinity = ProtocolAffinity::CLUSTER_ONLY;

    auto arbitrator = MakeArbitrator();
    arbitrator->Start();

    // 24시간 경과
    persisted.decided_at = now - 24h;
    EXPECT_FALSE(arbitrator->RestoreDecision(persisted, now));

    // 미래 시각
    persisted.decided_at = now + 1min;
    EXPECT_FALSE(arbitrator->RestoreDecision(persisted, now));

    // 버전 불일치
    persisted.decided_at = now - 1min;
    persisted.version = Constants::PERSISTED_STATE_VERSION - 1;
    EXPECT_FALSE(arbitrator->RestoreDecision(persisted, now));

    // 결정되지 않은 기록
    persisted.version = Constants::PERSISTED_STATE_VERSION;
    persisted.affinity = ProtocolAffinity::UNDECIDED;
    EXPECT_FALSE(arbitrator->RestoreDecision(persisted, now));

    EXPECT_FALSE(arbitrator->IsDecided());
    EXPECT_TRUE(arbitrator->IsWindowPending());
}

// =============================================================================
// 보고서
// =============================================================================

TEST_F(ProtocolArbitratorTest, ReportJson) {
    auto arbitrator = MakeArbitrator();
    arbitrator->Start();

    auto observing = arbitrator->Report().ToJson();
    EXPECT_EQ(observing["state"], "observing");
    EXPECT_EQ(observing["affinity"], "undecided");
    EXPECT_TRUE(observing["decidedAt"].is_null());
    EXPECT_TRUE(observing["lastClusterHit"].is_null());

    Feed(*arbitrator, 3, 3);
    arbitrator->Decide();

    auto decided = arbitrator->Report().ToJson();
    EXPECT_EQ(decided["device"], "zb-0001");
    EXPECT_EQ(decided["state"], "decided");
    EXPECT_EQ(decided["affinity"], "hybrid");
    EXPECT_EQ(decided["clusterHits"], 3);
    EXPECT_EQ(decided["dataPointHits"], 3);
    EXPECT_TRUE(decided["decidedAt"].is_number_integer());
    EXPECT_TRUE(decided["lastDataPointHit"].is_number_integer());
    EXPECT_FALSE(decided["restored"].get<bool>());
    EXPECT_TRUE(decided["discoveredCapabilities"].is_array());
}

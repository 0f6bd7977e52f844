/**
 * @file test_adaptive_learner.cpp
 * @brief divisor 학습 (반복 보정 / 이력 다수결) 테스트
 */

#include <gtest/gtest.h>

#include "Learning/AdaptiveLearner.h"
#include "Logging/LogManager.h"
#include "Normalizer/ValueNormalizer.h"

#include <nlohmann/json.hpp>

#include <string>

using namespace HybridLink;
using BasicTypes::DpValue;
using Enums::CorrectionKind;
using Enums::ProtocolPath;
using Learning::AdaptiveLearner;
using Learning::LearnerSettings;
using Learning::LearningKey;
using Learning::LearnSource;
using Normalizer::ValueNormalizer;
using Profile::ConversionRule;
using Profile::Range;
using Structs::NormalizationResult;

namespace {

DpValue Int(int64_t v) { return DpValue(std::in_place_index<2>, v); }

const std::string kDevice = "zb-0001";
const std::string kCapability = "measure_humidity";
const LearningKey kKey{kDevice, kCapability, ProtocolPath::DATAPOINT};

} // namespace

class AdaptiveLearnerTest : public ::testing::Test {
protected:
    AdaptiveLearner learner_;

    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setLogLevel(LogLevel::DEBUG);
    }

    static ConversionRule PercentRule() {
        ConversionRule rule = ConversionRule::Identity(Range(0, 100));
        rule.candidate_divisors = {100, 10};
        return rule;
    }

    // valid 는 넓고 typical 은 좁은 규칙 (기본 스케일링이 항상 valid)
    static ConversionRule WideRule(std::vector<double> candidates) {
        ConversionRule rule = ConversionRule::Identity(Range(0, 10000));
        rule.typical_range = Range(0, 100);
        rule.candidate_divisors = std::move(candidates);
        return rule;
    }

    NormalizationResult Run(int64_t raw, const ConversionRule& rule) {
        return ValueNormalizer::NormalizeFor(learner_, kKey, Int(raw), rule);
    }
};

// =============================================================================
// 반복 보정
// =============================================================================

TEST_F(AdaptiveLearnerTest, RepeatedCorrectionsPromoteDivisor) {
    for (int64_t raw : {3500, 3600, 3700}) {
        auto result = Run(raw, PercentRule());
        ASSERT_TRUE(result.is_valid);
        EXPECT_EQ(result.correction, CorrectionKind::DIVISOR);
        EXPECT_FALSE(result.via_learned_divisor);
    }

    auto learned = learner_.GetLearnedDivisor(kKey);
    ASSERT_TRUE(learned.has_value());
    EXPECT_DOUBLE_EQ(*learned, 100.0);

    // 네 번째부터는 탐색 없이 학습된 divisor 사용
    auto fourth = Run(3800, PercentRule());
    ASSERT_TRUE(fourth.is_valid);
    EXPECT_TRUE(fourth.via_learned_divisor);
    EXPECT_EQ(fourth.correction, CorrectionKind::DIVISOR);
    EXPECT_DOUBLE_EQ(*fourth.NumericValue(), 38.0);

    auto stats = learner_.GetStats(kKey);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->source, LearnSource::CORRECTIONS);
    EXPECT_EQ(stats->history_size, 4u);
    EXPECT_EQ(stats->correction_tally.at(100.0), 3);
}

TEST_F(AdaptiveLearnerTest, PromotionThreshold) {
    EXPECT_FALSE(learner_.ReportCorrection(kKey, 10).has_value());
    EXPECT_FALSE(learner_.ReportCorrection(kKey, 10).has_value());
    EXPECT_FALSE(learner_.GetLearnedDivisor(kKey).has_value());

    auto promoted = learner_.ReportCorrection(kKey, 10);
    ASSERT_TRUE(promoted.has_value());
    EXPECT_DOUBLE_EQ(*promoted, 10.0);

    // 이미 확정된 값을 다시 보고해도 새로 확정되지 않는다
    EXPECT_FALSE(learner_.ReportCorrection(kKey, 10).has_value());
}

TEST_F(AdaptiveLearnerTest, UnitDivisorIsNeverReported) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(learner_.ReportCorrection(kKey, 1).has_value());
        EXPECT_FALSE(learner_.ReportCorrection(kKey, 0).has_value());
    }
    EXPECT_FALSE(learner_.GetStats(kKey).has_value());
}

TEST_F(AdaptiveLearnerTest, LearnedDivisorFailureFallsBackToSearch) {
    learner_.SetLearnedDivisor(kKey, 10);

    // 3500 / 10 = 350 은 valid 밖
    auto result = Run(3500, PercentRule());
    ASSERT_TRUE(result.is_valid);
    EXPECT_FALSE(result.via_learned_divisor);
    EXPECT_DOUBLE_EQ(*result.applied_divisor, 100.0);
    EXPECT_DOUBLE_EQ(*result.NumericValue(), 35.0);
}

TEST_F(AdaptiveLearnerTest, LearnedDivisorEqualToBaseScalingIsNotACorrection) {
    ConversionRule rule = ConversionRule::Divisor(10, Range(-40, 80), {1, 10, 100});
    learner_.SetLearnedDivisor(kKey, 10);

    auto result = Run(235, rule);
    ASSERT_TRUE(result.is_valid);
    EXPECT_TRUE(result.via_learned_divisor);
    EXPECT_EQ(result.correction, CorrectionKind::NONE);
    EXPECT_DOUBLE_EQ(*result.NumericValue(), 23.5);
}

TEST_F(AdaptiveLearnerTest, MultiplierCorrectionsPromoteEquivalentDivisor) {
    ConversionRule rule = ConversionRule::Identity(Range(0, 100));
    rule.candidate_multipliers = {0.001};

    for (int64_t raw : {35000, 36000, 37000}) {
        auto result = Run(raw, rule);
        ASSERT_TRUE(result.is_valid);
        EXPECT_EQ(result.correction, CorrectionKind::MULTIPLIER);
    }

    auto learned = learner_.GetLearnedDivisor(kKey);
    ASSERT_TRUE(learned.has_value());
    EXPECT_DOUBLE_EQ(*learned, 1000.0);

    auto fourth = Run(38000, rule);
    ASSERT_TRUE(fourth.is_valid);
    EXPECT_TRUE(fourth.via_learned_divisor);
    EXPECT_DOUBLE_EQ(*fourth.NumericValue(), 38.0);
}

TEST_F(AdaptiveLearnerTest, PathsLearnIndependently) {
    const LearningKey cluster_key{kDevice, kCapability, ProtocolPath::CLUSTER};
    for (int i = 0; i < 3; ++i)
        learner_.ReportCorrection(cluster_key, 100);

    EXPECT_TRUE(learner_.GetLearnedDivisor(cluster_key).has_value());
    EXPECT_FALSE(learner_.GetLearnedDivisor(kKey).has_value());
    EXPECT_EQ(learner_.TrackedKeys(), 1u);
}

// =============================================================================
// 이력 다수결
// =============================================================================

TEST_F(AdaptiveLearnerTest, VotePromotesDivisor) {
    const auto rule = WideRule({1, 10, 100});

    for (int64_t raw : {2000, 2100, 2200, 2300, 2400}) {
        auto result = Run(raw, rule);
        ASSERT_TRUE(result.is_valid);
        EXPECT_EQ(result.correction, CorrectionKind::NONE);
    }

    auto stats = learner_.GetStats(kKey);
    ASSERT_TRUE(stats.has_value());
    ASSERT_TRUE(stats->learned_divisor.has_value());
    EXPECT_DOUBLE_EQ(*stats->learned_divisor, 100.0);
    EXPECT_EQ(stats->source, LearnSource::VOTE);

    auto next = Run(2500, rule);
    EXPECT_TRUE(next.via_learned_divisor);
    EXPECT_DOUBLE_EQ(*next.NumericValue(), 25.0);
}

TEST_F(AdaptiveLearnerTest, VoteNeverLearnsUnitDivisor) {
    const auto rule = WideRule({1, 10});
    for (double raw : {20.0, 21.0, 22.0, 23.0, 24.0})
        learner_.Observe(kKey, raw);

    // 1 과 10 이 동점 -> 작은 쪽(1) 이 이기므로 학습하지 않는다
    EXPECT_FALSE(learner_.DetectByVote(kKey, rule).has_value());
    EXPECT_FALSE(learner_.GetLearnedDivisor(kKey).has_value());
}

TEST_F(AdaptiveLearnerTest, VoteNeedsMinimumSamples) {
    const auto rule = WideRule({1, 10, 100});
    for (double raw : {2000.0, 2100.0, 2200.0, 2300.0})
        learner_.Observe(kKey, raw);
    EXPECT_FALSE(learner_.DetectByVote(kKey, rule).has_value());

    learner_.Observe(kKey, 2400.0);
    auto voted = learner_.DetectByVote(kKey, rule);
    ASSERT_TRUE(voted.has_value());
    EXPECT_DOUBLE_EQ(*voted, 100.0);
}

TEST_F(AdaptiveLearnerTest, VoteNeedsRatio) {
    const auto rule = WideRule({1, 100});
    // 100 으로 typical 에 들어오는 값 2 개 / 6 개
    for (double raw : {2000.0, 2100.0, 50000.0, 60000.0, 70000.0, 80000.0})
        learner_.Observe(kKey, raw);
    EXPECT_FALSE(learner_.DetectByVote(kKey, rule).has_value());
}

TEST_F(AdaptiveLearnerTest, HistoryIsCapped) {
    LearnerSettings settings;
    settings.history_size = 3;
    AdaptiveLearner learner(settings);

    for (double raw : {1.0, 2.0, 3.0, 4.0, 5.0})
        learner.Observe(kKey, raw);

    auto stats = learner.GetStats(kKey);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->history_size, 3u);
}

// =============================================================================
// 초기화 / 영속화
// =============================================================================

TEST_F(AdaptiveLearnerTest, ResetForgetsHistory) {
    const LearningKey cluster_key{kDevice, kCapability, ProtocolPath::CLUSTER};
    const LearningKey other_device{"zb-0002", kCapability, ProtocolPath::DATAPOINT};
    learner_.SetLearnedDivisor(kKey, 10);
    learner_.SetLearnedDivisor(cluster_key, 100);
    learner_.SetLearnedDivisor({kDevice, "measure_temperature", ProtocolPath::DATAPOINT}, 100);
    learner_.SetLearnedDivisor(other_device, 10);
    EXPECT_EQ(learner_.TrackedKeys(), 4u);

    // capability 초기화는 두 경로를 모두 지운다
    EXPECT_TRUE(learner_.Reset(kDevice, kCapability));
    EXPECT_FALSE(learner_.Reset(kDevice, kCapability));
    EXPECT_FALSE(learner_.GetLearnedDivisor(kKey).has_value());
    EXPECT_FALSE(learner_.GetLearnedDivisor(cluster_key).has_value());

    EXPECT_EQ(learner_.ResetDevice(kDevice), 1u);
    EXPECT_EQ(learner_.TrackedKeys(), 1u);
    EXPECT_TRUE(learner_.GetLearnedDivisor(other_device).has_value());
}

TEST_F(AdaptiveLearnerTest, ExportAndImport) {
    const LearningKey temperature{"zb-0002", "measure_temperature", ProtocolPath::CLUSTER};
    learner_.SetLearnedDivisor(temperature, 10);
    learner_.SetLearnedDivisor(kKey, 100);
    learner_.Observe({"zb-0003", "measure_power", ProtocolPath::DATAPOINT}, 42.0); // 학습 전 이력은 내보내지 않는다

    nlohmann::json exported = learner_.Export();
    ASSERT_EQ(exported.size(), 2u);
    EXPECT_EQ(exported[0]["device"], "zb-0001");
    EXPECT_EQ(exported[0]["path"], "datapoint");
    EXPECT_EQ(exported[1]["capability"], "measure_temperature");
    EXPECT_EQ(exported[1]["path"], "cluster");

    AdaptiveLearner restored;
    EXPECT_EQ(restored.Import(exported), 2u);
    EXPECT_DOUBLE_EQ(*restored.GetLearnedDivisor(temperature), 10.0);
    EXPECT_FALSE(restored.GetLearnedDivisor({"zb-0002", "measure_temperature",
                                             ProtocolPath::DATAPOINT}).has_value());
    EXPECT_EQ(restored.GetStats(kKey)->source, LearnSource::IMPORTED);
}

TEST_F(AdaptiveLearnerTest, ImportSkipsMalformedEntries) {
    nlohmann::json entries = nlohmann::json::array({
        {{"device", "a"}, {"capability", "dim"}, {"divisor", 100}},
        {{"device", "b"}},
        {{"device", "c"}, {"capability", "dim"}, {"divisor", 0}},
        {{"device", "d"}, {"capability", "dim"}, {"divisor", "10"}},
        {{"device", "e"}, {"capability", "dim"}, {"path", "zigbee"}, {"divisor", 10}},
        "garbage",
    });

    EXPECT_EQ(learner_.Import(entries), 1u);
    EXPECT_EQ(learner_.LearnedDivisors().size(), 1u);
    // path 가 없으면 DataPoint 경로
    EXPECT_TRUE(learner_.GetLearnedDivisor({"a", "dim", ProtocolPath::DATAPOINT}).has_value());
    EXPECT_EQ(learner_.Import(nlohmann::json::object()), 0u);
}

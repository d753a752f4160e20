#include <gtest/gtest.h>
#include "../src/core/scoring/engine.hpp"
#include "test_support.hpp"

using namespace serverscore;
using namespace serverscore::scoring;
using namespace serverscore::test_support;

namespace {

/**
 * 48 hours of hourly reports from a stable server: 20 TPS, 10 of 150
 * players, 75% memory free, Level114 installed, uptime growing with the
 * wall clock
 */
MinerContext stable_server() {
    MinerContext context;
    context.now_ms = NOW_MS;
    for (uint64_t h = 0; h <= 48; ++h) {
        uint64_t created = NOW_MS - (48 - h) * HOUR_MS - MINUTE_MS;
        context.history.push(make_report(h + 1, created, 50, static_cast<int64_t>(h * HOUR_MS)));
    }
    context.report = *context.history.latest();
    context.verification = passed(context.report);
    return context;
}

} // namespace

class ScoringEngineTest : public ::testing::Test {
protected:
    ScoringConfig config_;
};

TEST_F(ScoringEngineTest, StableServerScenario) {
    MinerContext context = stable_server();
    auto result = score(context, std::nullopt, config_);

    EXPECT_TRUE(result.accepted);
    EXPECT_NEAR(result.components.infrastructure, 0.95, 1e-9);
    EXPECT_NEAR(result.components.participation, 0.71, 1e-9);
    EXPECT_GT(result.components.reliability, 0.98);
    EXPECT_FALSE(result.penalty.has_value());

    EXPECT_EQ(result.score, 876u);
    EXPECT_EQ(result.raw_score, result.score);
    EXPECT_TRUE(result.classification == Classification::Excellent ||
                result.classification == Classification::Good);
}

TEST_F(ScoringEngineTest, PerfectInfrastructure) {
    MinerContext context = stable_server();
    context.report.payload.memory_ram_info = {1000, 0, 1000};
    context.latency_s = 0.0;

    auto result = score(context, std::nullopt, config_);
    EXPECT_DOUBLE_EQ(result.components.infrastructure, 1.0);
}

TEST_F(ScoringEngineTest, InvalidSignatureCapsAtOneHundred) {
    MinerContext context = stable_server();
    context.verification.signature_valid = false;
    context.verification.reason = ErrorCode::SignatureFailure;

    auto first = score(context, std::nullopt, config_);
    EXPECT_LE(first.score, 100u);
    EXPECT_EQ(first.penalty, PenaltyKind::SignatureFailure);

    // A high previous score falls toward the cap by at most one step
    auto smoothed = score(context, 900, config_);
    EXPECT_LE(smoothed.raw_score, 100u);
    EXPECT_EQ(smoothed.score, 740u);
    EXPECT_LE(900u - smoothed.score, config_.max_score_change);
}

TEST_F(ScoringEngineTest, PenalizedScoreStepsWithinBound) {
    MinerContext context = stable_server();
    context.verification.signature_valid = false;
    context.verification.reason = ErrorCode::SignatureFailure;

    uint32_t previous = config_.max_score;
    for (int cycle = 0; cycle < 40; ++cycle) {
        auto result = score(context, previous, config_);
        EXPECT_EQ(result.penalty, PenaltyKind::SignatureFailure);
        EXPECT_LE(previous - result.score, config_.max_score_change);
        EXPECT_GE(result.score, result.raw_score);
        previous = result.score;
    }
    // Converges onto the capped raw score
    EXPECT_LE(previous, 105u);
}

TEST_F(ScoringEngineTest, SignatureCapBeatsComplianceCap) {
    MinerContext context = stable_server();
    context.report.payload.plugins = {"WorldEdit"};

    auto compliance_only = score(context, std::nullopt, config_);
    EXPECT_EQ(compliance_only.penalty, PenaltyKind::ComplianceFailure);
    EXPECT_LE(compliance_only.score, 300u);

    context.verification.signature_valid = false;
    auto both = score(context, std::nullopt, config_);
    EXPECT_EQ(both.penalty, PenaltyKind::SignatureFailure);
    EXPECT_LE(both.score, 100u);
}

TEST_F(ScoringEngineTest, ClearedComplianceFlagIsAFailure) {
    MinerContext context = stable_server();
    context.compliance_ok = false;

    auto result = score(context, std::nullopt, config_);
    EXPECT_EQ(result.penalty, PenaltyKind::ComplianceFailure);
    EXPECT_LE(result.score, 300u);
}

TEST_F(ScoringEngineTest, IntegrityFlagsCap) {
    MinerContext hash = stable_server();
    hash.verification.hash_valid = false;
    auto mismatch = score(hash, std::nullopt, config_);
    EXPECT_EQ(mismatch.penalty, PenaltyKind::IntegrityFailure);
    EXPECT_EQ(mismatch.score, 300u);

    MinerContext drift = stable_server();
    drift.verification.clock_drift = true;
    auto drifted = score(drift, std::nullopt, config_);
    EXPECT_EQ(drifted.penalty, PenaltyKind::ClockDrift);
    EXPECT_LE(drifted.score, 300u);
}

TEST_F(ScoringEngineTest, EmptyHistoryWhenExpectedIsZero) {
    MinerContext context = stable_server();
    context.history = history::ReportHistory(config_.max_history);
    context.history_expected = true;

    auto result = score(context, 800, config_);
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.score, 0u);
    EXPECT_EQ(result.classification, Classification::Poor);
    EXPECT_EQ(result.penalty, PenaltyKind::MissingHistory);
}

TEST_F(ScoringEngineTest, NewEntityWithoutHistoryStillScores) {
    MinerContext context = stable_server();
    context.history = history::ReportHistory(config_.max_history);
    context.history_expected = false;

    auto result = score(context, std::nullopt, config_);
    EXPECT_GT(result.score, 0u);
    EXPECT_FALSE(result.penalty.has_value());
}

TEST_F(ScoringEngineTest, ReplayedReportKeepsPreviousScore) {
    MinerContext context = stable_server();
    context.verification.ok = false;
    context.verification.replay_ok = false;
    context.verification.reason = ErrorCode::ReplayDetected;

    auto result = score(context, 640, config_);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.score, 640u);
    EXPECT_EQ(result.reason, ErrorCode::ReplayDetected);
    EXPECT_DOUBLE_EQ(result.components.infrastructure, 0.0);

    auto unknown = score(context, std::nullopt, config_);
    EXPECT_EQ(unknown.score, 0u);
}

TEST_F(ScoringEngineTest, RealVerifierFeedsEngine) {
    auto [pk, sk] = crypto::Ed25519::generate_keypair();
    MinerContext context = stable_server();
    report::Report latest = context.report;
    sign_report(latest, sk);

    context.verification = integrity::IntegrityVerifier::verify(latest, pk, 48, NOW_MS, config_);
    auto accepted = score(context, std::nullopt, config_);
    EXPECT_TRUE(accepted.accepted);
    EXPECT_EQ(accepted.score, 876u);

    context.verification = integrity::IntegrityVerifier::verify(latest, pk, 49, NOW_MS, config_);
    auto replayed = score(context, accepted.score, config_);
    EXPECT_FALSE(replayed.accepted);
    EXPECT_EQ(replayed.score, accepted.score);
}

TEST_F(ScoringEngineTest, SmoothsTowardsNewScore) {
    MinerContext context = stable_server();
    auto result = score(context, 500, config_);
    EXPECT_EQ(result.raw_score, 876u);
    EXPECT_EQ(result.score, 575u);
    EXPECT_EQ(result.classification, Classification::Average);
}

TEST_F(ScoringEngineTest, IdenticalInputsIdenticalOutput) {
    MinerContext context = stable_server();
    auto first = score(context, 612, config_);
    auto second = score(context, 612, config_);
    EXPECT_EQ(first.to_json(), second.to_json());
}

TEST_F(ScoringEngineTest, ScoreStaysOnScale) {
    for (int64_t tps_millis : {10, 50, 80, 200, 1000, 25000}) {
        for (double latency : {0.0, 0.3, 2.0}) {
            for (std::optional<uint32_t> previous : {std::optional<uint32_t>(),
                                                     std::optional<uint32_t>(0),
                                                     std::optional<uint32_t>(1000)}) {
                MinerContext context = stable_server();
                context.report.payload.tps_millis = tps_millis;
                context.latency_s = latency;

                auto result = score(context, previous, config_);
                EXPECT_LE(result.score, config_.max_score);
                EXPECT_EQ(result.classification, classify(result.score, config_.max_score));
            }
        }
    }
}

TEST_F(ScoringEngineTest, CustomMaxScore) {
    config_.max_score = 500;
    auto result = score(stable_server(), std::nullopt, config_);
    EXPECT_EQ(result.score, 438u);
    EXPECT_EQ(result.classification, Classification::Excellent);
}

TEST_F(ScoringEngineTest, ResultJson) {
    auto result = score(stable_server(), std::nullopt, config_);
    auto j = result.to_json();
    EXPECT_EQ(j["score"], 876);
    EXPECT_EQ(j["classification"], "Excellent");
    EXPECT_TRUE(j["penalty"].is_null());
}

#include <gtest/gtest.h>
#include "../src/core/scoring/components.hpp"
#include "test_support.hpp"

using namespace serverscore;
using namespace serverscore::scoring;
using namespace serverscore::test_support;

namespace {

// Hourly reports ending at `now`, oldest first in `tps_millis`
history::ReportHistory hourly_history(const std::vector<int64_t>& tps_millis,
                                      const std::vector<int64_t>& uptime_h) {
    history::ReportHistory history(60);
    const size_t n = tps_millis.size();
    for (size_t i = 0; i < n; ++i) {
        uint64_t created = NOW_MS - (n - 1 - i) * HOUR_MS;
        int64_t uptime = uptime_h[i] * static_cast<int64_t>(HOUR_MS);
        history.push(make_report(i + 1, created, tps_millis[i], uptime));
    }
    return history;
}

} // namespace

class ComponentsTest : public ::testing::Test {
protected:
    ScoringConfig config_;
};

// Infrastructure

TEST_F(ComponentsTest, IdealInfrastructureIsExactlyOne) {
    report::Report r = make_report(1, NOW_MS);
    r.payload.memory_ram_info = {1000, 0, 1000};

    auto infra = score_infrastructure(r.payload, 0.0, config_);
    EXPECT_DOUBLE_EQ(infra.tps, 1.0);
    EXPECT_DOUBLE_EQ(infra.latency, 1.0);
    EXPECT_DOUBLE_EQ(infra.memory, 1.0);
    EXPECT_DOUBLE_EQ(infra.total, 1.0);
}

TEST_F(ComponentsTest, TpsScaledToIdeal) {
    report::Payload p;
    p.tps_millis = 100;
    EXPECT_DOUBLE_EQ(tps_score(p, config_), 0.5);
    p.tps_millis = 10;
    EXPECT_DOUBLE_EQ(tps_score(p, config_), 1.0);
}

TEST_F(ComponentsTest, LatencyLinearBetweenBounds) {
    EXPECT_DOUBLE_EQ(latency_score(0.05, config_), 1.0);
    EXPECT_DOUBLE_EQ(latency_score(0.1, config_), 1.0);
    EXPECT_NEAR(latency_score(0.55, config_), 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(latency_score(1.0, config_), 0.0);
    EXPECT_DOUBLE_EQ(latency_score(5.0, config_), 0.0);
}

TEST_F(ComponentsTest, MemoryHeadroom) {
    EXPECT_DOUBLE_EQ(memory_score({750, 250, 1000}, config_), 0.75);
    // Below the 10% floor the ratio is scaled down again
    EXPECT_NEAR(memory_score({50, 950, 1000}, config_), 0.025, 1e-12);
    EXPECT_DOUBLE_EQ(memory_score({0, 0, 0}, config_), 0.5);
}

// Participation

TEST_F(ComponentsTest, ComplianceRequiresPlugins) {
    report::Payload p;
    p.plugins = {" level114"};
    EXPECT_DOUBLE_EQ(compliance_score(p, true, config_), 1.0);
    EXPECT_DOUBLE_EQ(compliance_score(p, false, config_), 0.0);

    p.plugins = {"WorldEdit"};
    EXPECT_EQ(count_missing_plugins(p, config_), 1u);
    EXPECT_DOUBLE_EQ(compliance_score(p, true, config_), 0.0);

    config_.missing_plugin_credit = 0.5;
    EXPECT_DOUBLE_EQ(compliance_score(p, true, config_), 0.5);
}

TEST_F(ComponentsTest, UtilizationFactor) {
    report::Payload p;
    p.max_players = 100;

    p.active_players.resize(10);
    EXPECT_DOUBLE_EQ(utilization_factor(p, config_), 0.75);
    p.active_players.resize(50);
    EXPECT_DOUBLE_EQ(utilization_factor(p, config_), 1.0);
    p.active_players.resize(90);
    EXPECT_NEAR(utilization_factor(p, config_), 0.75, 1e-9);
    p.active_players.resize(100);
    EXPECT_DOUBLE_EQ(utilization_factor(p, config_), 0.5);
    p.active_players.resize(120);
    EXPECT_DOUBLE_EQ(utilization_factor(p, config_), 0.5);

    p.max_players = 0;
    EXPECT_DOUBLE_EQ(utilization_factor(p, config_), 0.5);
}

TEST_F(ComponentsTest, PlayerActivityCapsAtWeight) {
    report::Payload p;
    p.max_players = 500;
    p.active_players.resize(250);
    EXPECT_DOUBLE_EQ(player_activity_score(p, config_), 1.0);

    p.active_players.resize(100);
    EXPECT_DOUBLE_EQ(player_activity_score(p, config_), 0.5);
}

TEST_F(ComponentsTest, RegistrationWeightCanBeDisabled) {
    report::Report r = make_report(1, NOW_MS);
    auto with = score_participation(r.payload, false, true, config_);

    config_.w_part_compliance = 0.65;
    config_.w_part_players = 0.35;
    config_.w_part_registration = 0.0;
    auto without = score_participation(r.payload, false, true, config_);

    EXPECT_GT(without.total, with.total);
    EXPECT_DOUBLE_EQ(score_participation(r.payload, true, true, config_).total, without.total);
}

// Reliability

TEST_F(ComponentsTest, FreshnessWeight) {
    EXPECT_DOUBLE_EQ(freshness_weight(NOW_MS - 100 * 1000, NOW_MS, config_), 1.0);
    EXPECT_DOUBLE_EQ(freshness_weight(NOW_MS - 300 * 1000, NOW_MS, config_), 1.0);
    EXPECT_DOUBLE_EQ(freshness_weight(NOW_MS - 600 * 1000, NOW_MS, config_), 0.5);
    EXPECT_DOUBLE_EQ(freshness_weight(NOW_MS - 10 * HOUR_MS, NOW_MS, config_), 0.1);
    EXPECT_DOUBLE_EQ(freshness_weight(NOW_MS + 1000, NOW_MS, config_), 1.0);
}

TEST_F(ComponentsTest, SteadyUptimeEarnsBonus) {
    auto history = hourly_history({50, 50, 50, 50, 50, 50}, {43, 44, 45, 46, 47, 48});
    double r = 48.0 / 72.0;
    double base = 1.0 - (1.0 - r) * (1.0 - r);
    EXPECT_NEAR(uptime_trend_score(history, config_), base * 1.1, 1e-9);
}

TEST_F(ComponentsTest, UptimeResetsArePenalized) {
    auto steady = hourly_history({50, 50, 50, 50, 50, 50}, {43, 44, 45, 46, 47, 48});
    auto reset = hourly_history({50, 50, 50, 50, 50, 50}, {43, 44, 1, 2, 3, 48});

    double r = 48.0 / 72.0;
    double base = 1.0 - (1.0 - r) * (1.0 - r);
    // Reset at chronological index 2 of 6
    EXPECT_NEAR(uptime_trend_score(reset, config_), base - 0.3 * 4.0 / 6.0, 1e-9);
    EXPECT_LT(uptime_trend_score(reset, config_), uptime_trend_score(steady, config_));
}

TEST_F(ComponentsTest, StableTpsIsFullCredit) {
    auto history = hourly_history({50, 50, 50, 50, 50}, {1, 2, 3, 4, 5});
    EXPECT_DOUBLE_EQ(tps_stability_score(history, NOW_MS, config_), 1.0);
}

TEST_F(ComponentsTest, ErraticTpsLosesCredit) {
    // Alternating 20 and 10 TPS, all fresh: cv = 5 / 15
    history::ReportHistory history(60);
    for (uint64_t i = 0; i < 10; ++i) {
        history.push(make_report(i + 1, NOW_MS - (10 - i) * 1000, i % 2 == 0 ? 50 : 100));
    }
    EXPECT_DOUBLE_EQ(tps_stability_score(history, NOW_MS, config_), 0.0);

    config_.max_tps_cv = 0.5;
    EXPECT_NEAR(tps_stability_score(history, NOW_MS, config_), 1.0 - (1.0 / 3.0) / 0.5, 1e-9);
}

TEST_F(ComponentsTest, TpsAboveIdealCountsAsIdeal) {
    history::ReportHistory history(60);
    for (uint64_t i = 0; i < 6; ++i) {
        history.push(make_report(i + 1, NOW_MS - (6 - i) * 1000, i % 2 == 0 ? 50 : 25));
    }
    EXPECT_DOUBLE_EQ(tps_stability_score(history, NOW_MS, config_), 1.0);
}

TEST_F(ComponentsTest, RecoveryCreditDecaysWithDuration) {
    // Dip to 10 TPS for one hourly sample, back after 60 minutes
    auto history = hourly_history({50, 100, 50, 50}, {1, 2, 3, 4});
    EXPECT_NEAR(recovery_score(history, NOW_MS, config_), 1.0 - 30.0 / 90.0, 1e-9);

    auto clean = hourly_history({50, 50, 50}, {1, 2, 3});
    EXPECT_DOUBLE_EQ(recovery_score(clean, NOW_MS, config_), 1.0);
}

TEST_F(ComponentsTest, UnrecoveredIncidentTimedUntilNow) {
    history::ReportHistory history(60);
    history.push(make_report(1, NOW_MS - 40 * MINUTE_MS, 50));
    history.push(make_report(2, NOW_MS - 20 * MINUTE_MS, 100));
    history.push(make_report(3, NOW_MS - 10 * MINUTE_MS, 100));
    EXPECT_DOUBLE_EQ(recovery_score(history, NOW_MS, config_), 1.0);

    EXPECT_NEAR(recovery_score(history, NOW_MS + 55 * MINUTE_MS, config_), 1.0 - 45.0 / 90.0, 1e-9);
    EXPECT_DOUBLE_EQ(recovery_score(history, NOW_MS + 3 * HOUR_MS, config_), 0.0);
}

TEST_F(ComponentsTest, ShortHistoryFallsBackToUptime) {
    auto history = hourly_history({50, 50, 50}, {16, 17, 18});
    report::Report latest = *history.latest();

    auto rely = score_reliability(latest, history, NOW_MS, config_);
    EXPECT_TRUE(rely.fallback);
    EXPECT_DOUBLE_EQ(rely.total, 0.25);
}

TEST_F(ComponentsTest, FullHistoryReliability) {
    std::vector<int64_t> tps(49, 50);
    std::vector<int64_t> uptime(49);
    for (int i = 0; i < 49; ++i) {
        uptime[i] = i;
    }
    auto history = hourly_history(tps, uptime);

    auto rely = score_reliability(*history.latest(), history, NOW_MS, config_);
    EXPECT_FALSE(rely.fallback);
    EXPECT_DOUBLE_EQ(rely.stability, 1.0);
    EXPECT_DOUBLE_EQ(rely.recovery, 1.0);
    EXPECT_GT(rely.total, 0.95);
}

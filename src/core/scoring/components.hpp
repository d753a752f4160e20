#pragma once

#include "core/history/report_history.hpp"
#include "core/report/report.hpp"
#include "core/scoring/scoring_config.hpp"

namespace serverscore::scoring {

/**
 * Component scorers. Every function is pure and returns a value in [0, 1].
 */

struct InfrastructureScore {
    double tps = 0.0;
    double latency = 0.0;
    double memory = 0.0;
    double total = 0.0;
};

struct ParticipationScore {
    double compliance = 0.0;
    double players = 0.0;
    double registration = 0.0;
    size_t missing_plugins = 0;
    double total = 0.0;
};

struct ReliabilityScore {
    double uptime = 0.0;
    double stability = 0.0;
    double recovery = 0.0;
    bool fallback = false;  // too little history, uptime-only estimate
    double total = 0.0;
};

// Infrastructure

double tps_score(const report::Payload& payload, const ScoringConfig& config);
double latency_score(double latency_s, const ScoringConfig& config);
double memory_score(const report::MemoryInfo& memory, const ScoringConfig& config);

InfrastructureScore score_infrastructure(
    const report::Payload& payload,
    double latency_s,
    const ScoringConfig& config
);

// Participation

size_t count_missing_plugins(const report::Payload& payload, const ScoringConfig& config);
double compliance_score(const report::Payload& payload, bool compliance_ok, const ScoringConfig& config);

/**
 * Player activity: min(active, max_players_weight) / max_players_weight,
 * scaled by how well the server's capacity is utilized
 */
double player_activity_score(const report::Payload& payload, const ScoringConfig& config);
double utilization_factor(const report::Payload& payload, const ScoringConfig& config);

ParticipationScore score_participation(
    const report::Payload& payload,
    bool registration_ok,
    bool compliance_ok,
    const ScoringConfig& config
);

// Reliability

/**
 * Weight of a report in the stability statistics: 1.0 while younger than
 * freshness_cutoff_s, then cutoff / age, never below stale_weight_floor
 */
double freshness_weight(uint64_t created_at_ms, uint64_t now_ms, const ScoringConfig& config);

// Observed TPS capped at the ideal target
double capped_tps(const report::Payload& payload, const ScoringConfig& config);

/**
 * Uptime trend over the whole window: concave credit for current uptime,
 * minus a penalty per uptime reset, with a bonus for steady growth
 */
double uptime_trend_score(const history::ReportHistory& history, const ScoringConfig& config);

/**
 * Freshness-weighted coefficient of variation of TPS over the latest
 * reliability_window reports
 */
double tps_stability_score(const history::ReportHistory& history, uint64_t now_ms,
                           const ScoringConfig& config);

/**
 * Mean recovery credit over TPS incidents in the latest recovery_window
 * reports. An incident still open at the newest report is timed until now.
 */
double recovery_score(const history::ReportHistory& history, uint64_t now_ms,
                      const ScoringConfig& config);

ReliabilityScore score_reliability(
    const report::Report& latest,
    const history::ReportHistory& history,
    uint64_t now_ms,
    const ScoringConfig& config
);

} // namespace serverscore::scoring

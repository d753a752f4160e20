#pragma once

#include "serverscore/common.hpp"
#include "serverscore/error.hpp"
#include "crypto/digest.hpp"
#include "utils/config.hpp"
#include <set>
#include <string>

namespace serverscore::scoring {

/**
 * ScoringConfig - Every weight and threshold the engine reads.
 *
 * Passed explicitly into every call and never cached by the engine, so a
 * caller may swap it between cycles. Build it through load()/from_config(),
 * which validate once and throw ConfigException on inconsistent settings.
 */
struct ScoringConfig {
    // Infrastructure targets
    double ideal_tps = 20.0;
    double excellent_latency_s = 0.1;
    double max_latency_s = 1.0;
    double min_memory_headroom = 0.10;

    // Participation
    uint32_t max_players_weight = 200;
    double optimal_player_ratio_min = 0.20;
    double optimal_player_ratio_max = 0.80;
    std::set<std::string> required_plugins = {"Level114"};
    double missing_plugin_credit = 0.0;     // compliance kept per missing plugin
    double compliance_pass_threshold = 0.5;

    // Primary weights (sum to 1.0)
    double w_infra = 0.40;
    double w_part = 0.35;
    double w_rely = 0.25;

    // Infrastructure sub-weights (sum to 1.0)
    double w_infra_tps = 0.55;
    double w_infra_latency = 0.25;
    double w_infra_memory = 0.20;

    // Participation sub-weights (sum to 1.0); zero registration weight disables tracking
    double w_part_compliance = 0.55;
    double w_part_players = 0.30;
    double w_part_registration = 0.15;

    // Reliability sub-weights (sum to 1.0)
    double w_rely_uptime = 0.50;
    double w_rely_stability = 0.35;
    double w_rely_recovery = 0.15;

    // Reliability
    double max_uptime_bonus_h = 72.0;
    double uptime_reset_penalty = 0.3;
    size_t min_reports_for_reliability = 5;
    size_t reliability_window = 20;
    size_t recovery_window = 30;
    double max_tps_cv = 0.30;
    double recovery_tps_threshold = 18.0;
    double recovery_full_credit_min = 30.0;
    double recovery_max_min = 120.0;
    double freshness_cutoff_s = 300.0;
    double stale_weight_floor = 0.10;

    // Integrity
    double max_clock_drift_s = 15.0 * 60.0;
    double clock_drift_factor = 0.5;
    crypto::DigestAlgorithm payload_digest = crypto::DigestAlgorithm::Sha256;

    // Penalty caps (fraction of MAX_SCORE)
    double compliance_failure_cap = 0.30;
    double integrity_failure_cap = 0.30;
    double signature_failure_cap = 0.10;

    // Output scale and smoothing
    uint32_t max_score = constants::DEFAULT_MAX_SCORE;
    double ema_alpha = 0.2;
    uint32_t min_score_change = 1;
    uint32_t max_score_change = 200;

    // History
    size_t max_history = 60;
    double max_report_age_s = 6.0 * 3600.0;

    bool debug = false;

    /**
     * Check weight sums and threshold sanity
     */
    Result<void> validate() const;

    /**
     * Defaults, validated
     */
    static ScoringConfig defaults();

    /**
     * Read recognized keys from a JSON config; unknown keys are ignored.
     * Throws ConfigException on wrong types or failed validation.
     */
    static ScoringConfig from_config(const utils::Config& config);

    /**
     * Defaults, then file values, then SERVERSCORE_* environment overrides.
     * Throws ConfigException on failure.
     */
    static ScoringConfig load(const utils::Config& config);

    /**
     * Apply SERVERSCORE_* environment overrides in place (no validation)
     */
    void apply_env_overrides();

    /**
     * Flat JSON dump of the effective settings
     */
    utils::json to_json() const;
};

} // namespace serverscore::scoring

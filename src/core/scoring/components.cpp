#include "components.hpp"
#include <algorithm>
#include <cmath>

namespace serverscore::scoring {

namespace {

double clamp01(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

double age_seconds(uint64_t created_at_ms, uint64_t now_ms) {
    if (created_at_ms >= now_ms) {
        return 0.0;
    }
    return static_cast<double>(now_ms - created_at_ms) / static_cast<double>(constants::MS_PER_SECOND);
}

uint64_t time_since(uint64_t from_ms, uint64_t to_ms) {
    return to_ms > from_ms ? to_ms - from_ms : 0;
}

// Full credit up to full_min, linear to zero at max_min
double recovery_credit(double minutes, const ScoringConfig& config) {
    if (minutes <= config.recovery_full_credit_min) {
        return 1.0;
    }
    if (minutes >= config.recovery_max_min) {
        return 0.0;
    }
    return 1.0 - (minutes - config.recovery_full_credit_min) /
                 (config.recovery_max_min - config.recovery_full_credit_min);
}

} // namespace

// Infrastructure

double tps_score(const report::Payload& payload, const ScoringConfig& config) {
    return clamp01(payload.actual_tps() / config.ideal_tps);
}

double latency_score(double latency_s, const ScoringConfig& config) {
    if (std::isnan(latency_s)) {
        return 0.0;
    }
    if (latency_s <= config.excellent_latency_s) {
        return 1.0;
    }
    if (latency_s >= config.max_latency_s) {
        return 0.0;
    }
    return 1.0 - (latency_s - config.excellent_latency_s) /
                 (config.max_latency_s - config.excellent_latency_s);
}

double memory_score(const report::MemoryInfo& memory, const ScoringConfig& config) {
    if (!memory.has_data()) {
        return 0.5;
    }
    double ratio = memory.free_ratio();
    if (ratio < config.min_memory_headroom) {
        ratio *= ratio / config.min_memory_headroom;
    }
    return clamp01(ratio);
}

InfrastructureScore score_infrastructure(
    const report::Payload& payload,
    double latency_s,
    const ScoringConfig& config
) {
    InfrastructureScore score;
    score.tps = tps_score(payload, config);
    score.latency = latency_score(latency_s, config);
    score.memory = memory_score(payload.memory(), config);
    score.total = clamp01(config.w_infra_tps * score.tps +
                          config.w_infra_latency * score.latency +
                          config.w_infra_memory * score.memory);
    return score;
}

// Participation

size_t count_missing_plugins(const report::Payload& payload, const ScoringConfig& config) {
    return static_cast<size_t>(std::count_if(
        config.required_plugins.begin(), config.required_plugins.end(),
        [&payload](const std::string& plugin) { return !payload.has_plugin(plugin); }));
}

double compliance_score(const report::Payload& payload, bool compliance_ok, const ScoringConfig& config) {
    if (!compliance_ok) {
        return 0.0;
    }
    size_t missing = count_missing_plugins(payload, config);
    if (missing == 0) {
        return 1.0;
    }
    double lost_per_plugin = 1.0 - config.missing_plugin_credit;
    return std::max(0.0, 1.0 - static_cast<double>(missing) * lost_per_plugin);
}

double utilization_factor(const report::Payload& payload, const ScoringConfig& config) {
    if (payload.max_players <= 0) {
        return 0.5;
    }
    double ratio = payload.player_ratio();
    const double lo = config.optimal_player_ratio_min;
    const double hi = config.optimal_player_ratio_max;

    if (ratio < lo) {
        return 0.5 + 0.5 * (ratio / lo);
    }
    if (ratio <= hi) {
        return 1.0;
    }
    if (ratio >= 1.0 || hi >= 1.0) {
        return 0.5;
    }
    return 1.0 - 0.5 * (ratio - hi) / (1.0 - hi);
}

double player_activity_score(const report::Payload& payload, const ScoringConfig& config) {
    double weight = static_cast<double>(config.max_players_weight);
    double active = std::min(static_cast<double>(payload.player_count()), weight);
    return clamp01((active / weight) * utilization_factor(payload, config));
}

ParticipationScore score_participation(
    const report::Payload& payload,
    bool registration_ok,
    bool compliance_ok,
    const ScoringConfig& config
) {
    ParticipationScore score;
    score.missing_plugins = count_missing_plugins(payload, config);
    score.compliance = compliance_score(payload, compliance_ok, config);
    score.players = player_activity_score(payload, config);
    score.registration = registration_ok ? 1.0 : 0.0;
    score.total = clamp01(config.w_part_compliance * score.compliance +
                          config.w_part_players * score.players +
                          config.w_part_registration * score.registration);
    return score;
}

// Reliability

double freshness_weight(uint64_t created_at_ms, uint64_t now_ms, const ScoringConfig& config) {
    double age = age_seconds(created_at_ms, now_ms);
    if (age <= config.freshness_cutoff_s) {
        return 1.0;
    }
    return std::max(config.stale_weight_floor, config.freshness_cutoff_s / age);
}

double capped_tps(const report::Payload& payload, const ScoringConfig& config) {
    return std::min(payload.actual_tps(), config.ideal_tps);
}

double uptime_trend_score(const history::ReportHistory& history, const ScoringConfig& config) {
    if (history.empty()) {
        return 0.0;
    }
    std::vector<report::Report> reports = history.chronological();
    const size_t n = reports.size();

    double ratio = std::min(reports.back().payload.uptime_hours() / config.max_uptime_bonus_h, 1.0);
    double score = 1.0 - (1.0 - ratio) * (1.0 - ratio);

    // Older resets weigh more
    size_t resets = 0;
    double penalty = 0.0;
    for (size_t i = 1; i < n; ++i) {
        if (reports[i].payload.effective_uptime_ms() < reports[i - 1].payload.effective_uptime_ms()) {
            ++resets;
            penalty += config.uptime_reset_penalty * static_cast<double>(n - i) / static_cast<double>(n);
        }
    }
    score = std::max(0.0, score - penalty);

    if (resets == 0 && n >= config.min_reports_for_reliability) {
        double growth_sum = 0.0;
        size_t samples = 0;
        for (size_t i = 1; i < n; ++i) {
            if (reports[i].created_at_ms <= reports[i - 1].created_at_ms) {
                continue;
            }
            double wall = static_cast<double>(reports[i].created_at_ms - reports[i - 1].created_at_ms);
            double grown = static_cast<double>(reports[i].payload.effective_uptime_ms()) -
                           static_cast<double>(reports[i - 1].payload.effective_uptime_ms());
            growth_sum += grown / wall;
            ++samples;
        }
        if (samples > 0 && growth_sum / static_cast<double>(samples) > 0.8) {
            score = std::min(1.0, score * 1.1);
        }
    }

    return clamp01(score);
}

double tps_stability_score(const history::ReportHistory& history, uint64_t now_ms,
                           const ScoringConfig& config) {
    std::vector<report::Report> window = history.recent(config.reliability_window);
    if (window.empty()) {
        return 0.5;
    }

    double weight_sum = 0.0;
    double weighted_sum = 0.0;
    for (const auto& r : window) {
        double w = freshness_weight(r.created_at_ms, now_ms, config);
        weight_sum += w;
        weighted_sum += w * capped_tps(r.payload, config);
    }
    double mean = weighted_sum / weight_sum;
    if (mean <= 0.0) {
        return 0.0;
    }

    double variance = 0.0;
    for (const auto& r : window) {
        double w = freshness_weight(r.created_at_ms, now_ms, config);
        double d = capped_tps(r.payload, config) - mean;
        variance += w * d * d;
    }
    variance /= weight_sum;

    double cv = std::sqrt(variance) / mean;
    return clamp01(1.0 - cv / config.max_tps_cv);
}

double recovery_score(const history::ReportHistory& history, uint64_t now_ms,
                      const ScoringConfig& config) {
    std::vector<report::Report> window = history.chronological(config.recovery_window);

    double credit_sum = 0.0;
    size_t incidents = 0;
    bool degraded = false;
    uint64_t incident_start = 0;

    for (const auto& r : window) {
        bool below = r.payload.actual_tps() < config.recovery_tps_threshold;
        if (below && !degraded) {
            degraded = true;
            incident_start = r.created_at_ms;
        } else if (!below && degraded) {
            degraded = false;
            double minutes = static_cast<double>(time_since(incident_start, r.created_at_ms)) /
                             static_cast<double>(constants::MS_PER_MINUTE);
            credit_sum += recovery_credit(minutes, config);
            ++incidents;
        }
    }
    if (degraded) {
        double minutes = static_cast<double>(time_since(incident_start, now_ms)) /
                         static_cast<double>(constants::MS_PER_MINUTE);
        credit_sum += recovery_credit(minutes, config);
        ++incidents;
    }

    if (incidents == 0) {
        return 1.0;
    }
    return clamp01(credit_sum / static_cast<double>(incidents));
}

ReliabilityScore score_reliability(
    const report::Report& latest,
    const history::ReportHistory& history,
    uint64_t now_ms,
    const ScoringConfig& config
) {
    ReliabilityScore score;

    if (history.size() < config.min_reports_for_reliability) {
        double half_window = config.max_uptime_bonus_h / 2.0;
        score.fallback = true;
        score.uptime = clamp01(latest.payload.uptime_hours() / half_window);
        score.total = 0.5 * score.uptime;
        return score;
    }

    score.uptime = uptime_trend_score(history, config);
    score.stability = tps_stability_score(history, now_ms, config);
    score.recovery = recovery_score(history, now_ms, config);
    score.total = clamp01(config.w_rely_uptime * score.uptime +
                          config.w_rely_stability * score.stability +
                          config.w_rely_recovery * score.recovery);
    return score;
}

} // namespace serverscore::scoring

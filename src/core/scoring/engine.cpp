#include "engine.hpp"
#include "smoother.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace serverscore::scoring {

nlohmann::json ComponentScores::to_json() const {
    return nlohmann::json{
        {"infrastructure", infrastructure},
        {"participation", participation},
        {"reliability", reliability}
    };
}

nlohmann::json ScoreResult::to_json() const {
    nlohmann::json j = {
        {"accepted", accepted},
        {"score", score},
        {"raw_score", raw_score},
        {"components", components.to_json()},
        {"classification", classification_to_string(classification)},
        {"penalty", nullptr},
        {"reason", nullptr}
    };
    if (penalty) {
        j["penalty"] = penalty_kind_to_string(*penalty);
    }
    if (reason) {
        j["reason"] = error_code_to_string(*reason);
    }
    return j;
}

namespace {

ScoreResult rejected(const MinerContext& context, std::optional<uint32_t> previous_score,
                     const ScoringConfig& config) {
    ScoreResult result;
    result.accepted = false;
    result.score = std::min(previous_score.value_or(constants::MIN_SCORE), config.max_score);
    result.raw_score = result.score;
    result.classification = classify(result.score, config.max_score);
    result.reason = context.verification.reason.value_or(ErrorCode::Unknown);

    SERVERSCORE_LOG_INFO("Report {} from {} rejected ({}), keeping score {}",
                         context.report.id, context.report.server_id,
                         error_code_to_string(*result.reason), result.score);
    return result;
}

} // namespace

ScoreResult score(
    const MinerContext& context,
    std::optional<uint32_t> previous_score,
    const ScoringConfig& config
) {
    const integrity::VerificationResult& verification = context.verification;
    if (!verification.ok) {
        return rejected(context, previous_score, config);
    }

    const report::Payload& payload = context.report.payload;

    InfrastructureScore infra = score_infrastructure(payload, context.latency_s, config);
    ParticipationScore part = score_participation(payload, context.registration_ok,
                                                  context.compliance_ok, config);
    ReliabilityScore rely = score_reliability(context.report, context.history,
                                              context.now_ms, config);

    PenaltyFlags flags;
    flags.compliance_failure = !context.compliance_ok || part.missing_plugins > 0 ||
                               part.compliance < config.compliance_pass_threshold;
    flags.hash_mismatch = !verification.hash_valid;
    flags.clock_drift = verification.clock_drift;
    flags.signature_failure = !verification.signature_valid;
    flags.missing_history = context.history_expected && context.history.empty();

    AggregateResult aggregate_result = aggregate(infra.total, part.total, rely.total, flags, config);

    ScoreResult result;
    result.accepted = true;
    result.raw_score = aggregate_result.score;
    result.components.infrastructure = infra.total;
    result.components.participation = part.total;
    result.components.reliability = rely.total;
    result.penalty = aggregate_result.penalty;
    result.reason = verification.reason;

    // Penalty caps act on the raw score; the smoother bounds the published step
    if (flags.missing_history) {
        result.score = 0;
    } else {
        result.score = smooth(aggregate_result.score, previous_score, config);
    }
    result.classification = classify(result.score, config.max_score);

    if (config.debug) {
        SERVERSCORE_LOG_DEBUG("Scoring {} (report {}):", context.report.server_id, context.report.id);
        SERVERSCORE_LOG_DEBUG("  infrastructure {:.3f} (tps {:.3f}, latency {:.3f}, memory {:.3f})",
                              infra.total, infra.tps, infra.latency, infra.memory);
        SERVERSCORE_LOG_DEBUG("  participation {:.3f} (compliance {:.3f}, players {:.3f}, "
                              "registration {:.1f}, {} plugin(s) missing)",
                              part.total, part.compliance, part.players, part.registration,
                              part.missing_plugins);
        SERVERSCORE_LOG_DEBUG("  reliability {:.3f} (uptime {:.3f}, stability {:.3f}, recovery {:.3f}{})",
                              rely.total, rely.uptime, rely.stability, rely.recovery,
                              rely.fallback ? ", short history" : "");
        SERVERSCORE_LOG_DEBUG("  weighted {:.4f} -> raw {} -> published {} [{}]{}",
                              aggregate_result.weighted, result.raw_score, result.score,
                              classification_to_string(result.classification),
                              result.penalty
                                  ? std::string(" penalty ") + penalty_kind_to_string(*result.penalty)
                                  : std::string());
    }

    return result;
}

} // namespace serverscore::scoring

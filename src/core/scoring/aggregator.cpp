#include "aggregator.hpp"
#include <algorithm>
#include <cmath>

namespace serverscore::scoring {

namespace {

void apply_cap(AggregateResult& result, double cap, PenaltyKind kind) {
    result.raw = std::min(result.raw, cap);
    result.cap = result.cap ? std::min(*result.cap, cap) : cap;
    result.penalty = kind;
}

} // namespace

const char* classification_to_string(Classification classification) {
    switch (classification) {
        case Classification::Excellent: return "Excellent";
        case Classification::Good: return "Good";
        case Classification::Average: return "Average";
        case Classification::Poor: return "Poor";
    }
    return "Unknown";
}

const char* penalty_kind_to_string(PenaltyKind kind) {
    switch (kind) {
        case PenaltyKind::ComplianceFailure: return "ComplianceFailure";
        case PenaltyKind::IntegrityFailure: return "IntegrityFailure";
        case PenaltyKind::ClockDrift: return "ClockDrift";
        case PenaltyKind::SignatureFailure: return "SignatureFailure";
        case PenaltyKind::MissingHistory: return "MissingHistory";
    }
    return "Unknown";
}

Classification classify(uint32_t score, uint32_t max_score) {
    // Integer cross-multiplication keeps the boundaries exact on any scale
    const uint64_t scaled = static_cast<uint64_t>(score) * constants::DEFAULT_MAX_SCORE;
    const uint64_t max = max_score;

    if (scaled >= constants::EXCELLENT_SCORE_THRESHOLD * max) {
        return Classification::Excellent;
    }
    if (scaled >= constants::GOOD_SCORE_THRESHOLD * max) {
        return Classification::Good;
    }
    if (scaled >= constants::POOR_SCORE_THRESHOLD * max) {
        return Classification::Average;
    }
    return Classification::Poor;
}

double weighted_score(double infrastructure, double participation, double reliability,
                      const ScoringConfig& config) {
    double raw = config.w_infra * infrastructure +
                 config.w_part * participation +
                 config.w_rely * reliability;
    if (std::isnan(raw)) {
        return 0.0;
    }
    return std::clamp(raw, 0.0, 1.0);
}

AggregateResult aggregate(
    double infrastructure,
    double participation,
    double reliability,
    const PenaltyFlags& flags,
    const ScoringConfig& config
) {
    AggregateResult result;
    result.weighted = weighted_score(infrastructure, participation, reliability, config);
    result.raw = result.weighted;

    if (flags.compliance_failure) {
        apply_cap(result, config.compliance_failure_cap, PenaltyKind::ComplianceFailure);
    }

    if (flags.hash_mismatch || flags.clock_drift) {
        if (flags.clock_drift) {
            result.raw *= config.clock_drift_factor;
        }
        apply_cap(result, config.integrity_failure_cap,
                  flags.clock_drift ? PenaltyKind::ClockDrift : PenaltyKind::IntegrityFailure);
    }

    if (flags.signature_failure) {
        apply_cap(result, config.signature_failure_cap, PenaltyKind::SignatureFailure);
    }

    if (flags.missing_history) {
        result.raw = 0.0;
        result.cap = 0.0;
        result.penalty = PenaltyKind::MissingHistory;
    }

    double scaled = std::round(result.raw * static_cast<double>(config.max_score));
    result.score = static_cast<uint32_t>(std::clamp(scaled, 0.0, static_cast<double>(config.max_score)));
    result.classification = classify(result.score, config.max_score);
    return result;
}

} // namespace serverscore::scoring

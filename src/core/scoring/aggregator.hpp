#pragma once

#include "core/scoring/scoring_config.hpp"
#include <optional>
#include <string>

namespace serverscore::scoring {

enum class Classification {
    Excellent,
    Good,
    Average,
    Poor
};

/**
 * Penalties in increasing severity. A more severe penalty overrides the cap
 * of a milder one.
 */
enum class PenaltyKind {
    ComplianceFailure,
    IntegrityFailure,
    ClockDrift,
    SignatureFailure,
    MissingHistory
};

const char* classification_to_string(Classification classification);
const char* penalty_kind_to_string(PenaltyKind kind);

/**
 * Classify a score on the given scale. Thresholds are 85%, 65% and 30% of
 * max_score, inclusive on the lower bound (850 is Excellent on a 1000 scale).
 */
Classification classify(uint32_t score, uint32_t max_score = constants::DEFAULT_MAX_SCORE);

struct PenaltyFlags {
    bool compliance_failure = false;
    bool hash_mismatch = false;
    bool clock_drift = false;
    bool signature_failure = false;
    bool missing_history = false;
};

struct AggregateResult {
    double weighted = 0.0;      // before penalties
    double raw = 0.0;           // after penalties, in [0, 1]
    uint32_t score = 0;         // round(raw * max_score)
    Classification classification = Classification::Poor;
    std::optional<PenaltyKind> penalty;
    std::optional<double> cap;  // tightest cap applied, as a fraction of max_score
};

double weighted_score(double infrastructure, double participation, double reliability,
                      const ScoringConfig& config);

/**
 * Combine component scores, apply penalties and scale to max_score
 */
AggregateResult aggregate(
    double infrastructure,
    double participation,
    double reliability,
    const PenaltyFlags& flags,
    const ScoringConfig& config
);

} // namespace serverscore::scoring

#pragma once

#include "core/history/report_history.hpp"
#include "core/integrity/verifier.hpp"
#include "core/report/report.hpp"
#include "core/scoring/aggregator.hpp"
#include "core/scoring/components.hpp"
#include "core/scoring/scoring_config.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace serverscore::scoring {

/**
 * MinerContext - Everything the engine needs to score one entity once.
 *
 * `report` is the latest report as sanitized by the verifier and
 * `history` is most-recent-first, normally including `report` itself.
 * `now_ms` is the evaluation time; the engine never reads a clock.
 */
struct MinerContext {
    report::Report report;
    double latency_s = 0.0;
    bool registration_ok = true;
    bool compliance_ok = true;
    history::ReportHistory history;
    integrity::VerificationResult verification;
    uint64_t now_ms = 0;
    bool history_expected = true;
};

struct ComponentScores {
    double infrastructure = 0.0;
    double participation = 0.0;
    double reliability = 0.0;

    nlohmann::json to_json() const;
};

/**
 * ScoreResult - Typed outcome of one scoring call.
 *
 * A rejected report (malformed or replayed) has accepted == false, zero
 * components and the previous score carried over unchanged.
 */
struct ScoreResult {
    bool accepted = false;
    uint32_t score = 0;         // published, smoothed and capped
    uint32_t raw_score = 0;     // aggregated, before smoothing
    ComponentScores components;
    Classification classification = Classification::Poor;
    std::optional<PenaltyKind> penalty;
    std::optional<ErrorCode> reason;  // first verification failure, if any

    nlohmann::json to_json() const;
};

/**
 * Score one entity. Pure: identical inputs always give identical output.
 */
ScoreResult score(
    const MinerContext& context,
    std::optional<uint32_t> previous_score,
    const ScoringConfig& config
);

} // namespace serverscore::scoring

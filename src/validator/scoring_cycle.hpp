#pragma once

#include "validator/collaborators.hpp"
#include "core/scoring/engine.hpp"
#include "core/scoring/registry.hpp"
#include "core/scoring/scoring_config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace serverscore::validator {

/**
 * EntityInput - Per-entity facts measured outside the report
 */
struct EntityInput {
    std::string entity_id;
    double latency_s = 0.0;
    bool registration_ok = true;
    bool compliance_ok = true;
};

enum class EntityOutcome {
    Scored,      // report accepted and a new score stored
    Rejected,    // malformed or replayed; stored score kept
    Downgraded,  // no usable reports; positive stored score forced to 0
    Skipped,     // no usable reports and nothing stored
    Failed       // a collaborator failed
};

const char* entity_outcome_to_string(EntityOutcome outcome);

struct EntityResult {
    std::string entity_id;
    EntityOutcome outcome = EntityOutcome::Skipped;
    std::optional<scoring::ScoreResult> score;
    std::string message;
};

struct CycleSummary {
    std::vector<EntityResult> entities;
    size_t scored = 0;
    size_t rejected = 0;
    size_t downgraded = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t published = 0;
    bool publish_ok = false;
};

struct CycleOptions {
    // Fan entities out with std::async; collaborators must then be thread-safe
    bool parallel = false;
};

/**
 * ScoringCycle - One validator pass over a set of entities.
 *
 * Per entity: fetch, parse, drop stale reports, verify the latest, score it
 * and update the caller-owned registries. A failure for one entity never
 * stops the others. Afterwards every stored score is published as
 * score / max_score.
 */
class ScoringCycle {
public:
    ScoringCycle(
        ReportSource& source,
        PublicKeyResolver& keys,
        WeightPublisher& publisher,
        scoring::ScoreRegistry& scores,
        scoring::CounterRegistry& counters
    );

    CycleSummary run(
        const std::vector<EntityInput>& entities,
        const scoring::ScoringConfig& config,
        uint64_t now_ms,
        const CycleOptions& options = {}
    );

    EntityResult score_entity(
        const EntityInput& input,
        const scoring::ScoringConfig& config,
        uint64_t now_ms
    );

    /**
     * Publish score / max_score for every stored entity
     * @return number of pairs handed to the publisher
     */
    Result<size_t> publish_weights(const scoring::ScoringConfig& config);

private:
    EntityResult score_entity_guarded(
        const EntityInput& input,
        const scoring::ScoringConfig& config,
        uint64_t now_ms
    );

    ReportSource& source_;
    PublicKeyResolver& keys_;
    WeightPublisher& publisher_;
    scoring::ScoreRegistry& scores_;
    scoring::CounterRegistry& counters_;
};

} // namespace serverscore::validator

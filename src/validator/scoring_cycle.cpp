#include "scoring_cycle.hpp"
#include "core/history/report_history.hpp"
#include "core/integrity/verifier.hpp"
#include "utils/logger.hpp"
#include "serverscore/time_utils.hpp"
#include <algorithm>
#include <future>

namespace serverscore::validator {

const char* entity_outcome_to_string(EntityOutcome outcome) {
    switch (outcome) {
        case EntityOutcome::Scored: return "scored";
        case EntityOutcome::Rejected: return "rejected";
        case EntityOutcome::Downgraded: return "downgraded";
        case EntityOutcome::Skipped: return "skipped";
        case EntityOutcome::Failed: return "failed";
    }
    return "unknown";
}

ScoringCycle::ScoringCycle(
    ReportSource& source,
    PublicKeyResolver& keys,
    WeightPublisher& publisher,
    scoring::ScoreRegistry& scores,
    scoring::CounterRegistry& counters
)
    : source_(source)
    , keys_(keys)
    , publisher_(publisher)
    , scores_(scores)
    , counters_(counters)
{
}

EntityResult ScoringCycle::score_entity(
    const EntityInput& input,
    const scoring::ScoringConfig& config,
    uint64_t now_ms
) {
    EntityResult outcome;
    outcome.entity_id = input.entity_id;

    auto fetched = source_.fetch_reports(input.entity_id, config.max_history);
    if (fetched.is_err()) {
        outcome.outcome = EntityOutcome::Failed;
        outcome.message = fetched.error().to_string();
        SERVERSCORE_LOG_ERROR("Fetching reports for {} failed: {}", input.entity_id, outcome.message);
        return outcome;
    }

    const uint64_t max_age_ms = static_cast<uint64_t>(config.max_report_age_s * constants::MS_PER_SECOND);
    std::vector<report::Report> usable;
    size_t malformed = 0;
    size_t stale = 0;
    for (const auto& raw : fetched.value()) {
        auto parsed = report::Report::from_json(raw);
        if (parsed.is_err()) {
            ++malformed;
            SERVERSCORE_LOG_WARN("Skipping malformed report for {}: {}",
                                 input.entity_id, parsed.error().message());
            continue;
        }
        if (now_ms > parsed.value().created_at_ms &&
            now_ms - parsed.value().created_at_ms > max_age_ms) {
            ++stale;
            continue;
        }
        usable.push_back(std::move(parsed.value()));
    }

    if (usable.empty()) {
        if (scores_.downgrade(input.entity_id, now_ms)) {
            outcome.outcome = EntityOutcome::Downgraded;
            outcome.message = "no usable reports";
            SERVERSCORE_LOG_WARN("{}: no usable reports ({} malformed, {} stale), score downgraded to 0",
                                 input.entity_id, malformed, stale);
        } else {
            outcome.outcome = EntityOutcome::Skipped;
            outcome.message = "no usable reports";
            SERVERSCORE_LOG_DEBUG("{}: no usable reports, skipped", input.entity_id);
        }
        return outcome;
    }

    const report::Report& latest = usable.front();
    auto key = keys_.resolve(input.entity_id);
    auto verification = integrity::IntegrityVerifier::verify(
        latest, key, counters_.last(input.entity_id), now_ms, config);

    scoring::MinerContext context;
    context.latency_s = input.latency_s;
    context.registration_ok = input.registration_ok;
    context.compliance_ok = input.compliance_ok;
    context.now_ms = now_ms;
    context.history_expected = scores_.contains(input.entity_id);
    context.report = verification.malformed ? latest : verification.report;
    if (!verification.malformed) {
        usable.front() = verification.report;
    }
    context.history = history::ReportHistory::from_recent(usable, config.max_history);
    context.verification = std::move(verification);

    auto previous = scores_.previous_score(input.entity_id);
    scoring::ScoreResult result = scoring::score(context, previous, config);
    outcome.score = result;

    if (!result.accepted) {
        outcome.outcome = EntityOutcome::Rejected;
        outcome.message = result.reason ? error_code_to_string(*result.reason) : "rejected";
        return outcome;
    }

    scoring::StoredScore stored;
    stored.score = result.score;
    stored.raw_score = result.raw_score;
    stored.components = result.components;
    stored.updated_at_ms = now_ms;
    scores_.put(input.entity_id, stored);
    counters_.record(input.entity_id, context.report.counter);

    outcome.outcome = EntityOutcome::Scored;
    SERVERSCORE_LOG_INFO("{}: score {} ({}){}", input.entity_id, result.score,
                         scoring::classification_to_string(result.classification),
                         result.penalty
                             ? std::string(", penalty ") + scoring::penalty_kind_to_string(*result.penalty)
                             : std::string());
    return outcome;
}

EntityResult ScoringCycle::score_entity_guarded(
    const EntityInput& input,
    const scoring::ScoringConfig& config,
    uint64_t now_ms
) {
    try {
        return score_entity(input, config, now_ms);
    } catch (const std::exception& e) {
        SERVERSCORE_LOG_ERROR("Scoring {} failed: {}", input.entity_id, e.what());
        EntityResult failed;
        failed.entity_id = input.entity_id;
        failed.outcome = EntityOutcome::Failed;
        failed.message = e.what();
        return failed;
    }
}

Result<size_t> ScoringCycle::publish_weights(const scoring::ScoringConfig& config) {
    std::vector<WeightPair> weights;
    for (const auto& [entity_id, stored] : scores_.snapshot()) {
        double weight = static_cast<double>(stored.score) / static_cast<double>(config.max_score);
        weights.emplace_back(entity_id, std::min(weight, 1.0));
    }

    auto published = publisher_.publish(weights);
    if (published.is_err()) {
        return Result<size_t>::Err(ErrorCode::WeightPublishFailed, published.error().message());
    }
    return Result<size_t>::Ok(weights.size());
}

CycleSummary ScoringCycle::run(
    const std::vector<EntityInput>& entities,
    const scoring::ScoringConfig& config,
    uint64_t now_ms,
    const CycleOptions& options
) {
    time::Timer timer;
    CycleSummary summary;

    if (options.parallel) {
        std::vector<std::future<EntityResult>> futures;
        futures.reserve(entities.size());
        for (const auto& input : entities) {
            futures.push_back(std::async(std::launch::async, [this, &input, &config, now_ms]() {
                return score_entity_guarded(input, config, now_ms);
            }));
        }
        for (auto& future : futures) {
            summary.entities.push_back(future.get());
        }
    } else {
        for (const auto& input : entities) {
            summary.entities.push_back(score_entity_guarded(input, config, now_ms));
        }
    }

    for (const auto& entity : summary.entities) {
        switch (entity.outcome) {
            case EntityOutcome::Scored: ++summary.scored; break;
            case EntityOutcome::Rejected: ++summary.rejected; break;
            case EntityOutcome::Downgraded: ++summary.downgraded; break;
            case EntityOutcome::Skipped: ++summary.skipped; break;
            case EntityOutcome::Failed: ++summary.failed; break;
        }
    }

    auto published = publish_weights(config);
    if (published.is_ok()) {
        summary.publish_ok = true;
        summary.published = published.value();
    } else {
        SERVERSCORE_LOG_ERROR("Publishing weights failed: {}", published.error().message());
    }

    SERVERSCORE_LOG_INFO("Cycle done in {} ms: {} scored, {} rejected, {} downgraded, {} skipped, "
                         "{} failed, {} weight(s) published",
                         timer.elapsed_milliseconds(), summary.scored, summary.rejected,
                         summary.downgraded, summary.skipped, summary.failed, summary.published);
    return summary;
}

} // namespace serverscore::validator

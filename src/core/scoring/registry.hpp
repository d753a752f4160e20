#pragma once

#include "core/scoring/engine.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace serverscore::scoring {

/**
 * StoredScore - Last published state of one entity
 */
struct StoredScore {
    uint32_t score = 0;
    uint32_t raw_score = 0;
    ComponentScores components;
    uint64_t updated_at_ms = 0;

    nlohmann::json to_json() const;
    static Result<StoredScore> from_json(const nlohmann::json& j);
};

/**
 * ScoreRegistry - Caller-owned map from entity to its stored score.
 * Thread-safe; the engine never touches it directly.
 */
class ScoreRegistry {
public:
    ScoreRegistry() = default;
    SERVERSCORE_DISALLOW_COPY(ScoreRegistry);

    std::optional<StoredScore> get(const std::string& entity_id) const;
    std::optional<uint32_t> previous_score(const std::string& entity_id) const;

    void put(const std::string& entity_id, const StoredScore& stored);

    /**
     * Force an entity's score to zero, keeping the diagnostics.
     * @return true if the entity was known and had a positive score
     */
    bool downgrade(const std::string& entity_id, uint64_t now_ms);

    bool erase(const std::string& entity_id);
    bool contains(const std::string& entity_id) const;
    size_t size() const;

    // Copy of every entry, sorted by entity id
    std::vector<std::pair<std::string, StoredScore>> snapshot() const;

    /**
     * Persistence as a JSON object keyed by entity id
     */
    nlohmann::json to_json() const;
    Result<void> load_json(const nlohmann::json& j);
    Result<void> save_to_file(const std::string& path) const;
    Result<void> load_from_file(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, StoredScore> scores_;
};

/**
 * CounterRegistry - Last accepted report counter per entity
 */
class CounterRegistry {
public:
    CounterRegistry() = default;
    SERVERSCORE_DISALLOW_COPY(CounterRegistry);

    std::optional<uint64_t> last(const std::string& entity_id) const;

    /**
     * Record an accepted counter. Counters never move backwards.
     * @return false if counter is not above the recorded one
     */
    bool record(const std::string& entity_id, uint64_t counter);

    size_t size() const;

    /**
     * Persistence as a JSON object of entity id to counter. Replay
     * protection only survives a restart if this is saved with the scores.
     */
    nlohmann::json to_json() const;
    Result<void> load_json(const nlohmann::json& j);
    Result<void> save_to_file(const std::string& path) const;
    Result<void> load_from_file(const std::string& path);

private:
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
};

} // namespace serverscore::scoring

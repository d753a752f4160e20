#include "registry.hpp"
#include "utils/logger.hpp"
#include <fstream>

namespace serverscore::scoring {

namespace {

Result<void> write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return Result<void>::Err(ErrorCode::SerializationFailed, "cannot open " + path + " for writing");
    }
    file << j.dump(2);
    if (!file) {
        return Result<void>::Err(ErrorCode::SerializationFailed, "failed writing " + path);
    }
    return Result<void>::Ok();
}

Result<nlohmann::json> read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<nlohmann::json>::Err(ErrorCode::DeserializationFailed, "cannot open " + path);
    }
    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        return Result<nlohmann::json>::Err(ErrorCode::DeserializationFailed, path + " is not valid JSON");
    }
    return Result<nlohmann::json>::Ok(std::move(j));
}

} // namespace

// StoredScore

nlohmann::json StoredScore::to_json() const {
    return nlohmann::json{
        {"score", score},
        {"raw_score", raw_score},
        {"components", components.to_json()},
        {"updated_at_ms", updated_at_ms}
    };
}

Result<StoredScore> StoredScore::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("score") || !j["score"].is_number_unsigned()) {
        return Result<StoredScore>::Err(ErrorCode::DeserializationFailed,
                                        "stored score needs an unsigned 'score'");
    }

    StoredScore stored;
    try {
        stored.score = j.at("score").get<uint32_t>();
        stored.raw_score = j.value("raw_score", stored.score);
        stored.updated_at_ms = j.value("updated_at_ms", uint64_t{0});
        if (j.contains("components") && j["components"].is_object()) {
            const auto& c = j["components"];
            stored.components.infrastructure = c.value("infrastructure", 0.0);
            stored.components.participation = c.value("participation", 0.0);
            stored.components.reliability = c.value("reliability", 0.0);
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<StoredScore>::Err(ErrorCode::DeserializationFailed, e.what());
    }
    return Result<StoredScore>::Ok(stored);
}

// ScoreRegistry

std::optional<StoredScore> ScoreRegistry::get(const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scores_.find(entity_id);
    if (it == scores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<uint32_t> ScoreRegistry::previous_score(const std::string& entity_id) const {
    auto stored = get(entity_id);
    if (!stored) {
        return std::nullopt;
    }
    return stored->score;
}

void ScoreRegistry::put(const std::string& entity_id, const StoredScore& stored) {
    std::lock_guard<std::mutex> lock(mutex_);
    scores_[entity_id] = stored;
}

bool ScoreRegistry::downgrade(const std::string& entity_id, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scores_.find(entity_id);
    if (it == scores_.end() || it->second.score == 0) {
        return false;
    }
    it->second.score = 0;
    it->second.raw_score = 0;
    it->second.updated_at_ms = now_ms;
    return true;
}

bool ScoreRegistry::erase(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return scores_.erase(entity_id) > 0;
}

bool ScoreRegistry::contains(const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scores_.count(entity_id) > 0;
}

size_t ScoreRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scores_.size();
}

std::vector<std::pair<std::string, StoredScore>> ScoreRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::pair<std::string, StoredScore>>(scores_.begin(), scores_.end());
}

nlohmann::json ScoreRegistry::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [entity_id, stored] : snapshot()) {
        j[entity_id] = stored.to_json();
    }
    return j;
}

Result<void> ScoreRegistry::load_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<void>::Err(ErrorCode::DeserializationFailed, "score registry must be a JSON object");
    }

    std::map<std::string, StoredScore> loaded;
    for (auto it = j.begin(); it != j.end(); ++it) {
        auto stored = StoredScore::from_json(it.value());
        if (stored.is_err()) {
            return Result<void>::Err(ErrorCode::DeserializationFailed,
                                     "entry '" + it.key() + "': " + stored.error().message());
        }
        loaded[it.key()] = stored.value();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    scores_ = std::move(loaded);
    return Result<void>::Ok();
}

Result<void> ScoreRegistry::save_to_file(const std::string& path) const {
    return write_json_file(path, to_json());
}

Result<void> ScoreRegistry::load_from_file(const std::string& path) {
    auto j = read_json_file(path);
    if (j.is_err()) {
        return Result<void>::Err(j.error());
    }
    SERVERSCORE_TRY(load_json(j.value()));
    SERVERSCORE_LOG_INFO("Loaded {} stored score(s) from {}", size(), path);
    return Result<void>::Ok();
}

// CounterRegistry

std::optional<uint64_t> CounterRegistry::last(const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(entity_id);
    if (it == counters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CounterRegistry::record(const std::string& entity_id, uint64_t counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(entity_id);
    if (it != counters_.end() && counter <= it->second) {
        return false;
    }
    counters_[entity_id] = counter;
    return true;
}

size_t CounterRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.size();
}

nlohmann::json CounterRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [entity_id, counter] : counters_) {
        j[entity_id] = counter;
    }
    return j;
}

Result<void> CounterRegistry::load_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<void>::Err(ErrorCode::DeserializationFailed, "counter registry must be a JSON object");
    }

    std::map<std::string, uint64_t> loaded;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number_unsigned()) {
            return Result<void>::Err(ErrorCode::DeserializationFailed,
                                     "entry '" + it.key() + "': counter must be unsigned");
        }
        loaded[it.key()] = it.value().get<uint64_t>();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_ = std::move(loaded);
    return Result<void>::Ok();
}

Result<void> CounterRegistry::save_to_file(const std::string& path) const {
    return write_json_file(path, to_json());
}

Result<void> CounterRegistry::load_from_file(const std::string& path) {
    auto j = read_json_file(path);
    if (j.is_err()) {
        return Result<void>::Err(j.error());
    }
    SERVERSCORE_TRY(load_json(j.value()));
    SERVERSCORE_LOG_INFO("Loaded {} report counter(s) from {}", size(), path);
    return Result<void>::Ok();
}

} // namespace serverscore::scoring

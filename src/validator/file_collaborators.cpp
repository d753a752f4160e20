#include "file_collaborators.hpp"
#include "crypto/ed25519.hpp"
#include "utils/logger.hpp"
#include "serverscore/time_utils.hpp"
#include <algorithm>
#include <fstream>

namespace serverscore::validator {

namespace {

Result<nlohmann::json> read_json_object(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<nlohmann::json>::Err(ErrorCode::ReportSourceUnavailable, "cannot open " + path);
    }
    nlohmann::json data = nlohmann::json::parse(file, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return Result<nlohmann::json>::Err(ErrorCode::InvalidFormat,
                                           path + " must contain a JSON object");
    }
    return Result<nlohmann::json>::Ok(std::move(data));
}

} // namespace

// JsonFileReportSource

JsonFileReportSource::JsonFileReportSource(std::string path) : path_(std::move(path)) {}

Result<void> JsonFileReportSource::reload() {
    auto data = read_json_object(path_);
    if (data.is_err()) {
        return Result<void>::Err(data.error());
    }

    std::map<std::string, std::vector<nlohmann::json>> reports;
    for (auto it = data.value().begin(); it != data.value().end(); ++it) {
        if (!it.value().is_array()) {
            SERVERSCORE_LOG_WARN("{}: entry for {} is not an array, ignored", path_, it.key());
            continue;
        }
        reports[it.key()] = it.value().get<std::vector<nlohmann::json>>();
    }

    reports_ = std::move(reports);
    loaded_ = true;
    return Result<void>::Ok();
}

Result<std::vector<nlohmann::json>> JsonFileReportSource::fetch_reports(
    const std::string& entity_id,
    size_t limit
) {
    if (!loaded_) {
        return Result<std::vector<nlohmann::json>>::Err(ErrorCode::ReportSourceUnavailable,
                                                        "report file not loaded");
    }
    auto it = reports_.find(entity_id);
    if (it == reports_.end()) {
        return Result<std::vector<nlohmann::json>>::Ok({});
    }
    size_t count = std::min(limit, it->second.size());
    return Result<std::vector<nlohmann::json>>::Ok(
        std::vector<nlohmann::json>(it->second.begin(), it->second.begin() + count));
}

std::vector<std::string> JsonFileReportSource::entities() const {
    std::vector<std::string> ids;
    for (const auto& [entity_id, reports] : reports_) {
        ids.push_back(entity_id);
    }
    return ids;
}

// JsonFileKeyResolver

JsonFileKeyResolver::JsonFileKeyResolver(std::string path) : path_(std::move(path)) {}

Result<void> JsonFileKeyResolver::reload() {
    auto data = read_json_object(path_);
    if (data.is_err()) {
        return Result<void>::Err(data.error());
    }

    std::map<std::string, PublicKey> keys;
    for (auto it = data.value().begin(); it != data.value().end(); ++it) {
        auto key = it.value().is_string()
            ? crypto::Ed25519::public_key_from_string(it.value().get<std::string>())
            : std::nullopt;
        if (!key) {
            SERVERSCORE_LOG_WARN("{}: unusable public key for {}", path_, it.key());
            continue;
        }
        keys[it.key()] = *key;
    }

    keys_ = std::move(keys);
    return Result<void>::Ok();
}

std::optional<PublicKey> JsonFileKeyResolver::resolve(const std::string& entity_id) {
    auto it = keys_.find(entity_id);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// JsonFileWeightPublisher

JsonFileWeightPublisher::JsonFileWeightPublisher(std::string path) : path_(std::move(path)) {}

Result<void> JsonFileWeightPublisher::publish(const std::vector<WeightPair>& weights) {
    nlohmann::json body = {
        {"updated_at", time::to_string(time::now())},
        {"weights", nlohmann::json::object()}
    };
    for (const auto& [entity_id, weight] : weights) {
        body["weights"][entity_id] = weight;
    }

    std::ofstream file(path_);
    if (!file.is_open()) {
        return Result<void>::Err(ErrorCode::WeightPublishFailed, "cannot open " + path_);
    }
    file << body.dump(2);
    if (!file) {
        return Result<void>::Err(ErrorCode::WeightPublishFailed, "failed writing " + path_);
    }
    return Result<void>::Ok();
}

} // namespace serverscore::validator

#pragma once

#include "validator/collaborators.hpp"
#include <map>
#include <string>

namespace serverscore::validator {

/**
 * JsonFileReportSource - Reports relayed through a JSON file:
 *   { "<entity>": [ <report>, ... ] }   (most recent first)
 * The file is read by reload(); fetches are served from memory.
 */
class JsonFileReportSource : public ReportSource {
public:
    explicit JsonFileReportSource(std::string path);

    Result<void> reload();

    Result<std::vector<nlohmann::json>> fetch_reports(
        const std::string& entity_id,
        size_t limit
    ) override;

    std::vector<std::string> entities() const;

private:
    std::string path_;
    bool loaded_ = false;
    std::map<std::string, std::vector<nlohmann::json>> reports_;
};

/**
 * JsonFileKeyResolver - { "<entity>": "<hex or base64 Ed25519 key>" }
 */
class JsonFileKeyResolver : public PublicKeyResolver {
public:
    explicit JsonFileKeyResolver(std::string path);

    Result<void> reload();

    std::optional<PublicKey> resolve(const std::string& entity_id) override;

private:
    std::string path_;
    std::map<std::string, PublicKey> keys_;
};

/**
 * JsonFileWeightPublisher - Writes { "updated_at": ..., "weights": {...} }
 */
class JsonFileWeightPublisher : public WeightPublisher {
public:
    explicit JsonFileWeightPublisher(std::string path);

    Result<void> publish(const std::vector<WeightPair>& weights) override;

private:
    std::string path_;
};

} // namespace serverscore::validator

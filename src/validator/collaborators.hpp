#pragma once

#include "serverscore/common.hpp"
#include "serverscore/error.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace serverscore::validator {

/**
 * ReportSource - Supplies raw reports per entity.
 * Returns at most `limit` reports, most recent first, never reordered.
 */
class ReportSource {
public:
    virtual ~ReportSource() = default;

    virtual Result<std::vector<nlohmann::json>> fetch_reports(
        const std::string& entity_id,
        size_t limit
    ) = 0;
};

/**
 * PublicKeyResolver - Current verification key of an entity.
 * Key rotation is the resolver's concern; nullopt when unknown.
 */
class PublicKeyResolver {
public:
    virtual ~PublicKeyResolver() = default;

    virtual std::optional<PublicKey> resolve(const std::string& entity_id) = 0;
};

using WeightPair = std::pair<std::string, double>;

/**
 * WeightPublisher - Receives (entity, score / max_score) pairs
 */
class WeightPublisher {
public:
    virtual ~WeightPublisher() = default;

    virtual Result<void> publish(const std::vector<WeightPair>& weights) = 0;
};

} // namespace serverscore::validator

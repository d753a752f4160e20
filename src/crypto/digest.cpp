#include "digest.hpp"
#include "blake3.hpp"
#include "sha256.hpp"
#include <algorithm>
#include <cctype>

namespace serverscore::crypto {

const char* digest_algorithm_name(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return "sha256";
        case DigestAlgorithm::Blake3: return "blake3";
    }
    return "unknown";
}

std::optional<DigestAlgorithm> digest_algorithm_from_string(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "sha256" || lowered == "sha-256") {
        return DigestAlgorithm::Sha256;
    }
    if (lowered == "blake3") {
        return DigestAlgorithm::Blake3;
    }
    return std::nullopt;
}

Hash256 digest(DigestAlgorithm algorithm, const std::string& data) {
    if (algorithm == DigestAlgorithm::Blake3) {
        return Blake3::hash(data);
    }
    return Sha256::hash(data);
}

} // namespace serverscore::crypto

#pragma once

#include "serverscore/common.hpp"
#include <optional>
#include <string>

namespace serverscore::crypto {

enum class DigestAlgorithm {
    Sha256,
    Blake3
};

const char* digest_algorithm_name(DigestAlgorithm algorithm);
std::optional<DigestAlgorithm> digest_algorithm_from_string(const std::string& name);

// Hash with the selected algorithm
Hash256 digest(DigestAlgorithm algorithm, const std::string& data);

} // namespace serverscore::crypto

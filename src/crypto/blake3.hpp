#pragma once

#include "serverscore/common.hpp"
#include <optional>

namespace serverscore::crypto {

/**
 * BLAKE3 cryptographic hash function wrapper
 */
class Blake3 {
public:
    /**
     * Hash data using BLAKE3
     * @param data The data to hash
     * @return 32-byte hash
     */
    static Hash256 hash(const bytes& data);

    /**
     * Hash a string using BLAKE3
     */
    static Hash256 hash(const std::string& str);
};

} // namespace serverscore::crypto

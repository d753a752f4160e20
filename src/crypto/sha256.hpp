#pragma once

#include "serverscore/common.hpp"

namespace serverscore::crypto {

/**
 * SHA-256 wrapper (libsodium). Used where the Collector expects SHA-256 digests.
 */
class Sha256 {
public:
    static Hash256 hash(const bytes& data);
    static Hash256 hash(const std::string& str);
};

} // namespace serverscore::crypto

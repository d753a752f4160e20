#include "sha256.hpp"
#include <sodium.h>

namespace serverscore::crypto {

Hash256 Sha256::hash(const bytes& data) {
    Hash256 result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

Hash256 Sha256::hash(const std::string& str) {
    Hash256 result;
    crypto_hash_sha256(
        result.data(),
        reinterpret_cast<const unsigned char*>(str.data()),
        str.size()
    );
    return result;
}

} // namespace serverscore::crypto

#include "blake3.hpp"
#include <blake3.h>

namespace serverscore::crypto {

Hash256 Blake3::hash(const bytes& data) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

Hash256 Blake3::hash(const std::string& str) {
    Hash256 result;
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, str.data(), str.size());
    blake3_hasher_finalize(&hasher, result.data(), result.size());
    return result;
}

} // namespace serverscore::crypto

#pragma once

#include "serverscore/common.hpp"
#include <string>
#include <optional>
#include <utility>

namespace serverscore::crypto {

/**
 * Ed25519 digital signature wrapper
 * Provides signing and verification using libsodium
 */
class Ed25519 {
public:
    /**
     * Generate a new Ed25519 keypair
     * @return pair of (public_key, secret_key)
     */
    static std::pair<PublicKey, SecretKey> generate_keypair();

    /**
     * Sign a message with a secret key
     * @param message The message to sign
     * @param secret_key The secret key to sign with
     * @return The detached signature
     */
    static Signature sign(const bytes& message, const SecretKey& secret_key);

    /**
     * Verify a detached signature
     * @param message The original message
     * @param signature The signature to verify
     * @param public_key The public key to verify against
     * @return true if signature is valid
     */
    static bool verify(const bytes& message, const Signature& signature, const PublicKey& public_key);

    static std::string public_key_to_hex(const PublicKey& key);
    static std::optional<PublicKey> public_key_from_hex(const std::string& hex);

    /**
     * Parse a public key from hex (64 chars) or base64/base64url (32 raw bytes)
     */
    static std::optional<PublicKey> public_key_from_string(const std::string& encoded);

    static std::string signature_to_hex(const Signature& sig);

    /**
     * Parse a signature from hex (128 chars) or base64url, padded or not
     */
    static std::optional<Signature> signature_from_string(const std::string& encoded);
};

} // namespace serverscore::crypto

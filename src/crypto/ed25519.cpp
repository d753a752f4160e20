#include "ed25519.hpp"
#include "serverscore/error.hpp"
#include <sodium.h>
#include <algorithm>

namespace serverscore::crypto {

namespace {
    // Ensure libsodium is initialized
    struct SodiumInitializer {
        SodiumInitializer() {
            if (sodium_init() < 0) {
                throw CryptoException(ErrorCode::CryptoInitFailed, "Failed to initialize libsodium");
            }
        }
    };
    static SodiumInitializer sodium_init_instance;

    template<size_t N>
    std::optional<fixed_bytes<N>> decode_fixed(const std::string& encoded) {
        fixed_bytes<N> out;

        if (encoded.size() == N * 2) {
            auto raw = hex_to_bytes(encoded);
            if (raw && raw->size() == N) {
                std::copy(raw->begin(), raw->end(), out.begin());
                return out;
            }
        }

        // Standard and URL-safe alphabets only differ in two characters
        std::string normalized = encoded;
        std::replace(normalized.begin(), normalized.end(), '+', '-');
        std::replace(normalized.begin(), normalized.end(), '/', '_');
        auto raw = base64url_decode(normalized);
        if (!raw || raw->size() != N) {
            return std::nullopt;
        }
        std::copy(raw->begin(), raw->end(), out.begin());
        return out;
    }
}

std::pair<PublicKey, SecretKey> Ed25519::generate_keypair() {
    PublicKey pk;
    SecretKey sk;

    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Failed to generate Ed25519 keypair");
    }

    return {pk, sk};
}

Signature Ed25519::sign(const bytes& message, const SecretKey& secret_key) {
    Signature sig;
    unsigned long long sig_len;

    if (crypto_sign_detached(
        sig.data(),
        &sig_len,
        message.data(),
        message.size(),
        secret_key.data()
    ) != 0) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "Failed to sign message");
    }

    return sig;
}

bool Ed25519::verify(const bytes& message, const Signature& signature, const PublicKey& public_key) {
    return crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    ) == 0;
}

std::string Ed25519::public_key_to_hex(const PublicKey& key) {
    return bytes_to_hex(key.data(), key.size());
}

std::optional<PublicKey> Ed25519::public_key_from_hex(const std::string& hex) {
    if (hex.size() != constants::ED25519_PUBLIC_KEY_SIZE * 2) {
        return std::nullopt;
    }
    return decode_fixed<constants::ED25519_PUBLIC_KEY_SIZE>(hex);
}

std::optional<PublicKey> Ed25519::public_key_from_string(const std::string& encoded) {
    return decode_fixed<constants::ED25519_PUBLIC_KEY_SIZE>(encoded);
}

std::string Ed25519::signature_to_hex(const Signature& sig) {
    return bytes_to_hex(sig.data(), sig.size());
}

std::optional<Signature> Ed25519::signature_from_string(const std::string& encoded) {
    if (encoded.empty()) {
        return std::nullopt;
    }
    return decode_fixed<constants::ED25519_SIGNATURE_SIZE>(encoded);
}

} // namespace serverscore::crypto

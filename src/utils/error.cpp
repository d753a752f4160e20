#include "serverscore/error.hpp"
#include <sstream>

namespace serverscore {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";

        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";
        case ErrorCode::CryptoSignatureFailed: return "Signature failed";
        case ErrorCode::CryptoVerificationFailed: return "Verification failed";
        case ErrorCode::CryptoKeyGenerationFailed: return "Key generation failed";
        case ErrorCode::InvalidPublicKey: return "Invalid public key";
        case ErrorCode::InvalidSignatureEncoding: return "Invalid signature encoding";

        case ErrorCode::MalformedReport: return "Malformed report";
        case ErrorCode::SanityViolation: return "Sanity violation";
        case ErrorCode::IntegrityFailure: return "Integrity failure";
        case ErrorCode::SignatureFailure: return "Signature failure";
        case ErrorCode::ReplayDetected: return "Replay detected";
        case ErrorCode::ClockDrift: return "Clock drift";

        case ErrorCode::ConfigurationError: return "Configuration error";

        case ErrorCode::ReportSourceUnavailable: return "Report source unavailable";
        case ErrorCode::PublicKeyNotFound: return "Public key not found";
        case ErrorCode::WeightPublishFailed: return "Weight publish failed";

        case ErrorCode::SerializationFailed: return "Serialization failed";
        case ErrorCode::DeserializationFailed: return "Deserialization failed";
        case ErrorCode::InvalidFormat: return "Invalid format";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace serverscore

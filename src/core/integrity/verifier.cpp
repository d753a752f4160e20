#include "verifier.hpp"
#include "crypto/ed25519.hpp"
#include "utils/logger.hpp"
#include "serverscore/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace serverscore::integrity {

namespace {

bool is_hex_digest(const std::string& value) {
    return value.size() == constants::SHA256_HASH_SIZE * 2 &&
           std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// Map the standard base64 alphabet onto the URL-safe one and drop padding
std::string normalize_base64(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '+') {
            out.push_back('-');
        } else if (c == '/') {
            out.push_back('_');
        } else if (c != '=') {
            out.push_back(c);
        }
    }
    return out;
}

bool reconcile_memory(report::MemoryInfo& memory) {
    if (memory.total_bytes <= 0) {
        return false;
    }
    const int64_t headroom = std::numeric_limits<int64_t>::max() - memory.free_bytes;
    int64_t parts = memory.used_bytes > headroom ? std::numeric_limits<int64_t>::max()
                                                 : memory.used_bytes + memory.free_bytes;
    if (parts <= 0) {
        return false;
    }
    double diff = std::fabs(static_cast<double>(memory.total_bytes - parts));
    if (diff > constants::MEMORY_TOTAL_TOLERANCE * static_cast<double>(memory.total_bytes)) {
        memory.total_bytes = parts;
        return true;
    }
    return false;
}

bool memory_negative(const report::MemoryInfo& memory) {
    return memory.free_bytes < 0 || memory.used_bytes < 0 || memory.total_bytes < 0;
}

void record_failure(VerificationResult& result, ErrorCode code, const std::string& detail) {
    if (!result.reason) {
        result.reason = code;
        result.detail = detail;
    }
}

} // namespace

SanityResult IntegrityVerifier::check_sanity(const report::Report& report) {
    SanityResult result;
    const report::Payload& payload = report.payload;

    if (payload.tps_millis < 0) {
        result.malformed = true;
        result.malformed_reason = "negative tps_millis";
        return result;
    }
    if (payload.max_players < 0) {
        result.malformed = true;
        result.malformed_reason = "negative max_players";
        return result;
    }
    if (memory_negative(payload.memory_ram_info) ||
        memory_negative(payload.system_info.memory_ram_info)) {
        result.malformed = true;
        result.malformed_reason = "negative memory value";
        return result;
    }
    if (payload.uptime_ms < 0 || payload.system_info.uptime_ms < 0) {
        result.malformed = true;
        result.malformed_reason = "negative uptime";
        return result;
    }

    result.sanitized = report;
    report::Payload& clean = result.sanitized.payload;

    if (clean.tps_millis < constants::MIN_TPS_MILLIS || clean.tps_millis > constants::MAX_TPS_MILLIS) {
        result.violations.push_back("tps_millis " + std::to_string(clean.tps_millis) + " clamped");
        clean.tps_millis = std::clamp(clean.tps_millis, constants::MIN_TPS_MILLIS,
                                      constants::MAX_TPS_MILLIS);
    }
    if (clean.max_players > constants::MAX_PLAYERS_SANITY) {
        result.violations.push_back("max_players " + std::to_string(clean.max_players) + " clamped");
        clean.max_players = constants::MAX_PLAYERS_SANITY;
    }

    const auto max_uptime = static_cast<int64_t>(constants::MAX_UPTIME_MS);
    if (clean.uptime_ms > max_uptime) {
        result.violations.push_back("uptime_ms clamped");
        clean.uptime_ms = max_uptime;
    }
    if (clean.system_info.uptime_ms > max_uptime) {
        result.violations.push_back("system_info.uptime_ms clamped");
        clean.system_info.uptime_ms = max_uptime;
    }

    if (reconcile_memory(clean.memory_ram_info)) {
        result.violations.push_back("memory total reconciled to used + free");
    }
    if (reconcile_memory(clean.system_info.memory_ram_info)) {
        result.violations.push_back("system_info memory total reconciled to used + free");
    }

    return result;
}

std::string IntegrityVerifier::compute_payload_hash(
    const report::Report& report,
    crypto::DigestAlgorithm algorithm
) {
    Hash256 hash = crypto::digest(algorithm, report.canonical_payload());
    return base64url_encode(bytes(hash.begin(), hash.end()));
}

bool IntegrityVerifier::check_hash(const report::Report& report, crypto::DigestAlgorithm algorithm) {
    if (report.payload_hash.empty()) {
        return true;
    }

    Hash256 expected = crypto::digest(algorithm, report.canonical_payload());

    if (is_hex_digest(report.payload_hash)) {
        std::string lowered = report.payload_hash;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered == hash_to_hex(expected);
    }

    return normalize_base64(report.payload_hash) ==
           base64url_encode(bytes(expected.begin(), expected.end()));
}

bool IntegrityVerifier::check_signature(
    const report::Report& report,
    const std::optional<PublicKey>& public_key
) {
    if (!public_key || report.signature.empty()) {
        return false;
    }

    auto signature = crypto::Ed25519::signature_from_string(report.signature);
    if (!signature) {
        return false;
    }

    return crypto::Ed25519::verify(report.canonical_payload_bytes(), *signature, *public_key);
}

bool IntegrityVerifier::check_replay(uint64_t counter, std::optional<uint64_t> last_counter) {
    if (!last_counter) {
        return true;
    }
    return counter > *last_counter;
}

bool IntegrityVerifier::check_clock_drift(uint64_t created_at_ms, uint64_t now_ms, double max_drift_s) {
    double drift_s = static_cast<double>(time::abs_diff_ms(created_at_ms, now_ms)) /
                     static_cast<double>(constants::MS_PER_SECOND);
    return drift_s <= max_drift_s;
}

VerificationResult IntegrityVerifier::verify(
    const report::Report& report,
    const std::optional<PublicKey>& public_key,
    std::optional<uint64_t> last_counter,
    uint64_t now_ms,
    const scoring::ScoringConfig& config
) {
    VerificationResult result;

    // 1. Sanity
    SanityResult sanity = check_sanity(report);
    if (sanity.malformed) {
        result.malformed = true;
        record_failure(result, ErrorCode::MalformedReport, sanity.malformed_reason);
        result.report = report;
        SERVERSCORE_LOG_WARN("Report {} from {} rejected: {}",
                             report.id, report.server_id, sanity.malformed_reason);
        return result;
    }
    result.sanity_violations = std::move(sanity.violations);
    result.report = std::move(sanity.sanitized);
    if (!result.sanity_violations.empty()) {
        record_failure(result, ErrorCode::SanityViolation, result.sanity_violations.front());
        SERVERSCORE_LOG_DEBUG("Report {} from {}: {} sanity adjustment(s)",
                              report.id, report.server_id, result.sanity_violations.size());
    }

    // 2. Hash binding, over the payload exactly as received
    result.hash_valid = check_hash(report, config.payload_digest);
    if (!result.hash_valid) {
        record_failure(result, ErrorCode::IntegrityFailure, "payload hash mismatch");
        SERVERSCORE_LOG_WARN("Report {} from {}: payload hash mismatch", report.id, report.server_id);
    }

    // 3. Signature
    result.signature_valid = check_signature(report, public_key);
    if (!result.signature_valid) {
        const char* why = !public_key ? "no public key" : "invalid signature";
        record_failure(result, ErrorCode::SignatureFailure, why);
        SERVERSCORE_LOG_WARN("Report {} from {}: signature check failed ({})",
                             report.id, report.server_id, why);
    }

    // 4. Replay
    result.replay_ok = check_replay(report.counter, last_counter);
    if (!result.replay_ok) {
        record_failure(result, ErrorCode::ReplayDetected,
                       "counter " + std::to_string(report.counter) + " not above " +
                       std::to_string(*last_counter));
        SERVERSCORE_LOG_WARN("Report {} from {}: replayed counter {} (last accepted {})",
                             report.id, report.server_id, report.counter, *last_counter);
    }

    // 5. Clock drift
    result.clock_drift = !check_clock_drift(report.created_at_ms, now_ms, config.max_clock_drift_s);
    if (result.clock_drift) {
        record_failure(result, ErrorCode::ClockDrift, "created_at outside drift tolerance");
        SERVERSCORE_LOG_WARN("Report {} from {}: clock drift of {} ms",
                             report.id, report.server_id,
                             time::abs_diff_ms(report.created_at_ms, now_ms));
    }

    result.ok = result.replay_ok;
    return result;
}

} // namespace serverscore::integrity

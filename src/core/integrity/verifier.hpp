#pragma once

#include "serverscore/common.hpp"
#include "serverscore/error.hpp"
#include "core/report/report.hpp"
#include "core/scoring/scoring_config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace serverscore::integrity {

/**
 * SanityResult - Outcome of the structural check.
 * `sanitized` holds the clamped copy; it is only meaningful when not malformed.
 */
struct SanityResult {
    bool malformed = false;
    std::string malformed_reason;
    std::vector<std::string> violations;
    report::Report sanitized;
};

/**
 * VerificationResult - Per-report integrity verdict.
 *
 * Only MalformedReport and ReplayDetected reject a report (ok == false).
 * Hash, signature and clock drift failures are flags the aggregator turns
 * into penalties. `reason` names the first failing check in verification
 * order, if any.
 */
struct VerificationResult {
    bool ok = false;
    std::optional<ErrorCode> reason;
    std::string detail;

    bool malformed = false;
    bool hash_valid = false;
    bool signature_valid = false;
    bool replay_ok = false;
    bool clock_drift = false;
    std::vector<std::string> sanity_violations;

    report::Report report;  // sanitized copy used for scoring

    bool has_sanity_violation() const { return !sanity_violations.empty(); }
};

/**
 * IntegrityVerifier - Gatekeeper run before any scoring.
 * Pure: reads nothing but its arguments. The caller records the counter
 * of an accepted report.
 */
class IntegrityVerifier {
public:
    /**
     * Run every check in order: sanity, hash, signature, replay, clock drift.
     * A malformed report short-circuits; every other check always runs.
     */
    static VerificationResult verify(
        const report::Report& report,
        const std::optional<PublicKey>& public_key,
        std::optional<uint64_t> last_counter,
        uint64_t now_ms,
        const scoring::ScoringConfig& config
    );

    /**
     * Reject negative quantities, clamp out-of-range ones and reconcile
     * memory totals
     */
    static SanityResult check_sanity(const report::Report& report);

    // Unpadded base64url digest of the canonical payload
    static std::string compute_payload_hash(
        const report::Report& report,
        crypto::DigestAlgorithm algorithm
    );

    /**
     * Compare the embedded payload_hash with a fresh digest.
     * Accepts base64url or base64, padded or not, and lowercase/uppercase hex.
     * A report without an embedded hash passes.
     */
    static bool check_hash(const report::Report& report, crypto::DigestAlgorithm algorithm);

    // Ed25519 over the canonical payload; false without a key or signature
    static bool check_signature(
        const report::Report& report,
        const std::optional<PublicKey>& public_key
    );

    // Counter must strictly exceed the last accepted one
    static bool check_replay(uint64_t counter, std::optional<uint64_t> last_counter);

    // true when created_at lies within the tolerance of now
    static bool check_clock_drift(uint64_t created_at_ms, uint64_t now_ms, double max_drift_s);
};

} // namespace serverscore::integrity

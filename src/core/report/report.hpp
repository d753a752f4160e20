#pragma once

#include "serverscore/common.hpp"
#include "serverscore/error.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace serverscore::report {

using json = nlohmann::json;

constexpr const char* ZERO_UUID = "00000000-0000-0000-0000-000000000000";

/**
 * MemoryInfo - RAM totals as reported by the server process
 */
struct MemoryInfo {
    int64_t free_bytes = 0;
    int64_t used_bytes = 0;
    int64_t total_bytes = 0;

    bool has_data() const { return total_bytes > 0; }

    // free / total in [0, 1]; 0 when no data
    double free_ratio() const;
};

/**
 * SystemInfo - Host description, including the process uptime
 */
struct SystemInfo {
    int64_t cpu_cores = 1;
    int64_t cpu_threads = 1;
    std::string cpu_model = "Unknown CPU";
    std::string java_version = "Unknown";
    std::string os_name = "Unknown";
    std::string os_version = "Unknown";
    std::string os_arch = "Unknown";
    int64_t uptime_ms = 0;
    MemoryInfo memory_ram_info;

    double uptime_hours() const;
};

struct ActivePlayer {
    std::string name = "Unknown";
    std::string uuid = ZERO_UUID;
};

/**
 * Payload - The signed body of a report
 */
struct Payload {
    std::vector<ActivePlayer> active_players;
    int64_t max_players = 20;
    MemoryInfo memory_ram_info;
    std::vector<std::string> plugins;
    SystemInfo system_info;
    int64_t tps_millis = 50;   // milliseconds per tick
    int64_t uptime_ms = 0;

    size_t player_count() const { return active_players.size(); }

    // Ticks per second derived from tick duration; 0 for non-positive input
    double actual_tps() const;

    // active / max, 0 when capacity is unknown
    double player_ratio() const;

    // Case-insensitive, whitespace-trimmed plugin lookup
    bool has_plugin(const std::string& name) const;

    // Top-level memory totals, falling back to the system_info copy
    const MemoryInfo& memory() const;

    // Process uptime; system_info wins when both are present
    int64_t effective_uptime_ms() const;
    double uptime_hours() const;
};

/**
 * Report - One signed telemetry submission from a server.
 *
 * Immutable once received; the engine only reads it. `created_at_ms` is the
 * authoritative creation time used for drift and freshness checks.
 */
struct Report {
    std::string id;
    std::string server_id;
    uint64_t counter = 0;
    std::string nonce;
    uint64_t client_timestamp_ms = 0;
    uint64_t created_at_ms = 0;
    std::string payload_hash;   // base64url digest of the canonical payload
    std::string signature;      // Ed25519 over the canonical payload, base64url or hex
    Payload payload;

    /**
     * Parse a report from Collector JSON.
     * Missing required fields or wrong types yield MalformedReport.
     */
    static Result<Report> from_json(const json& data);
    static Result<Report> parse(const std::string& text);

    /**
     * Wire representation (same shape from_json accepts)
     */
    json to_json() const;

    /**
     * Canonical payload serialization: sorted keys, compact separators,
     * ASCII-only, players sorted by uuid and plugins sorted.
     * This is the exact byte string that is hashed and signed.
     */
    std::string canonical_payload() const;
    bytes canonical_payload_bytes() const;
};

} // namespace serverscore::report

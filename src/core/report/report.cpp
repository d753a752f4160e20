#include "core/report/report.hpp"
#include "serverscore/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace serverscore::report {

namespace {

constexpr uint64_t INT64_MAX_U = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
constexpr double INT64_BOUND = 9223372036854775808.0;  // 2^63

Error malformed(const std::string& message) {
    return Error(ErrorCode::MalformedReport, message);
}

std::string trim_lower(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    std::string out = begin < end ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Optional integer: absent or null keeps the default, other types are rejected
bool read_int(const json& obj, const char* key, int64_t& out, std::string& error) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return true;
    }
    if (it->is_number_unsigned()) {
        out = static_cast<int64_t>(std::min<uint64_t>(it->get<uint64_t>(), INT64_MAX_U));
        return true;
    }
    if (it->is_number_integer()) {
        out = it->get<int64_t>();
        return true;
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!std::isfinite(value)) {
            error = std::string("field '") + key + "' is not a finite number";
            return false;
        }
        // Saturate; the sanity check clamps out-of-range values later
        if (value >= INT64_BOUND) {
            out = std::numeric_limits<int64_t>::max();
        } else if (value < -INT64_BOUND) {
            out = std::numeric_limits<int64_t>::min();
        } else {
            out = static_cast<int64_t>(value);
        }
        return true;
    }
    error = std::string("field '") + key + "' must be an integer";
    return false;
}

// Optional string: non-string values keep the default
void read_string(const json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        out = it->get<std::string>();
    }
}

bool parse_memory(const json& obj, MemoryInfo& memory, std::string& error) {
    if (!obj.is_object()) {
        return true;
    }
    return read_int(obj, "free_memory_bytes", memory.free_bytes, error) &&
           read_int(obj, "used_memory_bytes", memory.used_bytes, error) &&
           read_int(obj, "total_memory_bytes", memory.total_bytes, error);
}

bool parse_system_info(const json& obj, SystemInfo& info, std::string& error) {
    if (!obj.is_object()) {
        return true;
    }
    read_string(obj, "cpu_model", info.cpu_model);
    read_string(obj, "java_version", info.java_version);
    read_string(obj, "os_name", info.os_name);
    read_string(obj, "os_version", info.os_version);
    read_string(obj, "os_arch", info.os_arch);

    if (!read_int(obj, "cpu_cores", info.cpu_cores, error) ||
        !read_int(obj, "cpu_threads", info.cpu_threads, error) ||
        !read_int(obj, "uptime_ms", info.uptime_ms, error)) {
        return false;
    }

    auto mem = obj.find("memory_ram_info");
    if (mem != obj.end()) {
        return parse_memory(*mem, info.memory_ram_info, error);
    }
    return true;
}

// Players arrive either as plain names or as {name, uuid} objects
std::vector<ActivePlayer> parse_players(const json& arr) {
    std::vector<ActivePlayer> players;
    if (!arr.is_array()) {
        return players;
    }
    for (const auto& entry : arr) {
        ActivePlayer player;
        if (entry.is_string()) {
            player.name = entry.get<std::string>();
        } else if (entry.is_object()) {
            read_string(entry, "name", player.name);
            read_string(entry, "uuid", player.uuid);
            if (player.uuid.size() != 36 ||
                std::count(player.uuid.begin(), player.uuid.end(), '-') != 4) {
                player.uuid = ZERO_UUID;
            }
        } else {
            continue;
        }
        players.push_back(std::move(player));
    }
    return players;
}

std::vector<std::string> parse_plugins(const json& value) {
    std::vector<std::string> plugins;
    if (value.is_string()) {
        plugins.push_back(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& entry : value) {
            if (entry.is_string() && !entry.get<std::string>().empty()) {
                plugins.push_back(entry.get<std::string>());
            }
        }
    }
    return plugins;
}

json memory_to_wire(const MemoryInfo& memory) {
    return json{
        {"free_memory_bytes", memory.free_bytes},
        {"used_memory_bytes", memory.used_bytes},
        {"total_memory_bytes", memory.total_bytes}
    };
}

json memory_to_canonical(const MemoryInfo& memory) {
    return json{
        {"free_bytes", memory.free_bytes},
        {"used_bytes", memory.used_bytes},
        {"total_bytes", memory.total_bytes}
    };
}

json system_info_fields(const SystemInfo& info) {
    return json{
        {"cpu_cores", info.cpu_cores},
        {"cpu_threads", info.cpu_threads},
        {"cpu_model", info.cpu_model},
        {"java_version", info.java_version},
        {"os_name", info.os_name},
        {"os_version", info.os_version},
        {"os_arch", info.os_arch},
        {"uptime_ms", info.uptime_ms}
    };
}

} // namespace

// MemoryInfo / SystemInfo / Payload

double MemoryInfo::free_ratio() const {
    if (total_bytes <= 0) {
        return 0.0;
    }
    double ratio = static_cast<double>(free_bytes) / static_cast<double>(total_bytes);
    return std::clamp(ratio, 0.0, 1.0);
}

double SystemInfo::uptime_hours() const {
    return static_cast<double>(uptime_ms) / static_cast<double>(constants::MS_PER_HOUR);
}

double Payload::actual_tps() const {
    if (tps_millis <= 0) {
        return 0.0;
    }
    return 1000.0 / static_cast<double>(tps_millis);
}

double Payload::player_ratio() const {
    if (max_players <= 0) {
        return 0.0;
    }
    return static_cast<double>(player_count()) / static_cast<double>(max_players);
}

bool Payload::has_plugin(const std::string& name) const {
    const std::string wanted = trim_lower(name);
    if (wanted.empty()) {
        return true;
    }
    return std::any_of(plugins.begin(), plugins.end(),
                       [&wanted](const std::string& p) { return trim_lower(p) == wanted; });
}

const MemoryInfo& Payload::memory() const {
    if (!memory_ram_info.has_data() && system_info.memory_ram_info.has_data()) {
        return system_info.memory_ram_info;
    }
    return memory_ram_info;
}

int64_t Payload::effective_uptime_ms() const {
    return system_info.uptime_ms > 0 ? system_info.uptime_ms : uptime_ms;
}

double Payload::uptime_hours() const {
    return static_cast<double>(effective_uptime_ms()) / static_cast<double>(constants::MS_PER_HOUR);
}

// Report

Result<Report> Report::from_json(const json& data) {
    if (!data.is_object()) {
        return Result<Report>::Err(malformed("report must be a JSON object"));
    }

    Report report;
    std::string error;

    read_string(data, "id", report.id);
    read_string(data, "nonce", report.nonce);
    read_string(data, "payload_hash", report.payload_hash);
    read_string(data, "signature", report.signature);

    auto server_id = data.find("server_id");
    if (server_id == data.end() || !server_id->is_string() ||
        server_id->get<std::string>().empty()) {
        return Result<Report>::Err(malformed("missing server_id"));
    }
    report.server_id = server_id->get<std::string>();

    auto counter = data.find("counter");
    if (counter == data.end() || !counter->is_number_integer()) {
        return Result<Report>::Err(malformed("missing or non-integer counter"));
    }
    if (counter->is_number_unsigned()) {
        report.counter = counter->get<uint64_t>();
    } else {
        int64_t signed_counter = counter->get<int64_t>();
        if (signed_counter < 0) {
            return Result<Report>::Err(malformed("negative counter"));
        }
        report.counter = static_cast<uint64_t>(signed_counter);
    }

    int64_t client_ts = -1;
    if (!read_int(data, "client_timestamp_ms", client_ts, error)) {
        return Result<Report>::Err(malformed(error));
    }
    if (client_ts > 0) {
        report.client_timestamp_ms = static_cast<uint64_t>(client_ts);
    }

    bool have_created_at = false;
    auto created_at = data.find("created_at");
    if (created_at != data.end() && created_at->is_string() &&
        !created_at->get<std::string>().empty()) {
        try {
            report.created_at_ms = time::to_timestamp_ms(
                time::from_string(created_at->get<std::string>()));
            have_created_at = true;
        } catch (const std::runtime_error& e) {
            if (client_ts <= 0) {
                return Result<Report>::Err(malformed(e.what()));
            }
        }
    }
    if (!have_created_at) {
        if (client_ts <= 0) {
            return Result<Report>::Err(malformed("missing created_at"));
        }
        report.created_at_ms = static_cast<uint64_t>(client_ts);
    }
    if (report.client_timestamp_ms == 0) {
        report.client_timestamp_ms = report.created_at_ms;
    }

    auto payload_it = data.find("payload");
    if (payload_it == data.end() || !payload_it->is_object()) {
        return Result<Report>::Err(malformed("missing payload"));
    }
    const json& payload = *payload_it;

    auto tps = payload.find("tps_millis");
    if (tps == payload.end() || !tps->is_number()) {
        return Result<Report>::Err(malformed("missing payload.tps_millis"));
    }
    auto max_players = payload.find("max_players");
    if (max_players == payload.end() || !max_players->is_number()) {
        return Result<Report>::Err(malformed("missing payload.max_players"));
    }

    Payload& p = report.payload;
    if (!read_int(payload, "tps_millis", p.tps_millis, error) ||
        !read_int(payload, "max_players", p.max_players, error) ||
        !read_int(payload, "uptime_ms", p.uptime_ms, error)) {
        return Result<Report>::Err(malformed(error));
    }

    auto players = payload.find("active_players");
    if (players != payload.end()) {
        p.active_players = parse_players(*players);
    }
    auto plugins = payload.find("plugins");
    if (plugins != payload.end()) {
        p.plugins = parse_plugins(*plugins);
    }
    auto memory = payload.find("memory_ram_info");
    if (memory != payload.end() && !parse_memory(*memory, p.memory_ram_info, error)) {
        return Result<Report>::Err(malformed(error));
    }
    auto system = payload.find("system_info");
    if (system != payload.end() && !parse_system_info(*system, p.system_info, error)) {
        return Result<Report>::Err(malformed(error));
    }

    return Result<Report>::Ok(std::move(report));
}

Result<Report> Report::parse(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded()) {
        return Result<Report>::Err(malformed("report is not valid JSON"));
    }
    return from_json(data);
}

json Report::to_json() const {
    json players = json::array();
    for (const auto& player : payload.active_players) {
        players.push_back({{"name", player.name}, {"uuid", player.uuid}});
    }

    json system = system_info_fields(payload.system_info);
    system["memory_ram_info"] = memory_to_wire(payload.system_info.memory_ram_info);

    return json{
        {"id", id},
        {"server_id", server_id},
        {"counter", counter},
        {"nonce", nonce},
        {"client_timestamp_ms", client_timestamp_ms},
        {"created_at", time::to_string(time::from_timestamp_ms(created_at_ms))},
        {"payload_hash", payload_hash},
        {"signature", signature},
        {"payload", {
            {"active_players", players},
            {"max_players", payload.max_players},
            {"memory_ram_info", memory_to_wire(payload.memory_ram_info)},
            {"plugins", payload.plugins},
            {"system_info", system},
            {"tps_millis", payload.tps_millis},
            {"uptime_ms", payload.uptime_ms}
        }}
    };
}

std::string Report::canonical_payload() const {
    std::vector<ActivePlayer> players = payload.active_players;
    std::stable_sort(players.begin(), players.end(),
                     [](const ActivePlayer& a, const ActivePlayer& b) { return a.uuid < b.uuid; });

    json canonical_players = json::array();
    for (const auto& player : players) {
        canonical_players.push_back({{"name", player.name}, {"uuid", player.uuid}});
    }

    std::vector<std::string> plugins = payload.plugins;
    std::sort(plugins.begin(), plugins.end());

    json system = system_info_fields(payload.system_info);
    system["memory_ram_info"] = memory_to_canonical(payload.system_info.memory_ram_info);

    // nlohmann::json objects are std::map backed, so keys come out sorted
    json canonical = {
        {"active_players", canonical_players},
        {"max_players", payload.max_players},
        {"memory_ram_info", memory_to_canonical(payload.memory_ram_info)},
        {"plugins", plugins},
        {"system_info", system},
        {"tps_millis", payload.tps_millis},
        {"uptime_ms", payload.uptime_ms}
    };

    return canonical.dump(-1, ' ', true);
}

bytes Report::canonical_payload_bytes() const {
    std::string text = canonical_payload();
    return bytes(text.begin(), text.end());
}

} // namespace serverscore::report

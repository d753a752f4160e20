#include "core/scoring/scoring_config.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace serverscore::scoring {

namespace {

constexpr double WEIGHT_TOLERANCE = 0.001;

Result<void> check_sum(const char* group, double total) {
    if (std::fabs(total - 1.0) > WEIGHT_TOLERANCE) {
        std::ostringstream oss;
        oss << group << " weights must sum to 1.0, got " << total;
        return Result<void>::Err(ErrorCode::ConfigurationError, oss.str());
    }
    return Result<void>::Ok();
}

Result<void> check_range(const char* name, double value, double lo, double hi, bool lo_open) {
    bool below = lo_open ? value <= lo : value < lo;
    if (below || value > hi || std::isnan(value)) {
        std::ostringstream oss;
        oss << name << " must be in " << (lo_open ? "(" : "[") << lo << ", " << hi
            << "], got " << value;
        return Result<void>::Err(ErrorCode::ConfigurationError, oss.str());
    }
    return Result<void>::Ok();
}

template<typename T>
void read_key(const utils::Config& config, const std::string& key, T& field) {
    if (!config.has(key)) {
        return;
    }
    auto value = config.get<T>(key);
    if (!value) {
        throw ConfigException("option '" + key + "' has the wrong type");
    }
    field = *value;
}

// Unsigned options reject negative JSON numbers instead of wrapping
template<typename T>
void read_unsigned(const utils::Config& config, const std::string& key, T& field) {
    if (!config.has(key)) {
        return;
    }
    const auto& value = config.data().at(key);
    uint64_t parsed = 0;
    if (value.is_number_unsigned()) {
        parsed = value.get<uint64_t>();
    } else if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        parsed = static_cast<uint64_t>(value.get<int64_t>());
    } else {
        throw ConfigException("option '" + key + "' must be a non-negative integer");
    }
    if (parsed > std::numeric_limits<T>::max()) {
        throw ConfigException("option '" + key + "' is out of range: " + std::to_string(parsed));
    }
    field = static_cast<T>(parsed);
}

double env_double(const std::string& name, double current) {
    auto value = utils::Config::env(name);
    if (!value) {
        return current;
    }
    try {
        size_t used = 0;
        double parsed = std::stod(*value, &used);
        if (used != value->size()) {
            throw ConfigException(name + " is not a number: " + *value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigException(name + " is not a number: " + *value);
    }
}

uint32_t env_uint(const std::string& name, uint32_t current) {
    auto value = utils::Config::env(name);
    if (!value) {
        return current;
    }
    try {
        size_t used = 0;
        long long parsed = std::stoll(*value, &used);
        if (used != value->size() || parsed < 0) {
            throw ConfigException(name + " is not a non-negative integer: " + *value);
        }
        if (static_cast<unsigned long long>(parsed) > std::numeric_limits<uint32_t>::max()) {
            throw ConfigException(name + " is out of range: " + *value);
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::logic_error&) {
        throw ConfigException(name + " is not a non-negative integer: " + *value);
    }
}

std::set<std::string> split_plugins(const std::string& text) {
    std::set<std::string> plugins;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            plugins.insert(item.substr(begin, end - begin + 1));
        }
    }
    return plugins;
}

} // namespace

Result<void> ScoringConfig::validate() const {
    SERVERSCORE_TRY(check_sum("Primary", w_infra + w_part + w_rely));
    SERVERSCORE_TRY(check_sum("Infrastructure", w_infra_tps + w_infra_latency + w_infra_memory));
    SERVERSCORE_TRY(check_sum("Participation",
                              w_part_compliance + w_part_players + w_part_registration));
    SERVERSCORE_TRY(check_sum("Reliability", w_rely_uptime + w_rely_stability + w_rely_recovery));

    for (double w : {w_infra, w_part, w_rely, w_infra_tps, w_infra_latency, w_infra_memory,
                     w_part_compliance, w_part_players, w_part_registration,
                     w_rely_uptime, w_rely_stability, w_rely_recovery}) {
        if (w < 0.0) {
            return Result<void>::Err(ErrorCode::ConfigurationError, "weights must be non-negative");
        }
    }

    SERVERSCORE_TRY(check_range("ideal_tps", ideal_tps, 0.0, 30.0, true));
    SERVERSCORE_TRY(check_range("max_latency_s", max_latency_s, 0.0, 10.0, true));
    SERVERSCORE_TRY(check_range("excellent_latency_s", excellent_latency_s, 0.0, max_latency_s, false));
    SERVERSCORE_TRY(check_range("min_memory_headroom", min_memory_headroom, 0.0, 1.0, true));
    SERVERSCORE_TRY(check_range("ema_alpha", ema_alpha, 0.0, 1.0, true));
    SERVERSCORE_TRY(check_range("optimal_player_ratio_min", optimal_player_ratio_min, 0.0, 1.0, true));
    SERVERSCORE_TRY(check_range("optimal_player_ratio_max", optimal_player_ratio_max,
                                optimal_player_ratio_min, 1.0, false));
    SERVERSCORE_TRY(check_range("missing_plugin_credit", missing_plugin_credit, 0.0, 1.0, false));
    SERVERSCORE_TRY(check_range("compliance_pass_threshold", compliance_pass_threshold, 0.0, 1.0, false));
    SERVERSCORE_TRY(check_range("compliance_failure_cap", compliance_failure_cap, 0.0, 1.0, false));
    SERVERSCORE_TRY(check_range("integrity_failure_cap", integrity_failure_cap, 0.0, 1.0, false));
    SERVERSCORE_TRY(check_range("signature_failure_cap", signature_failure_cap, 0.0, 1.0, false));
    SERVERSCORE_TRY(check_range("clock_drift_factor", clock_drift_factor, 0.0, 1.0, false));
    SERVERSCORE_TRY(check_range("stale_weight_floor", stale_weight_floor, 0.0, 1.0, true));
    SERVERSCORE_TRY(check_range("max_tps_cv", max_tps_cv, 0.0, 10.0, true));
    SERVERSCORE_TRY(check_range("max_uptime_bonus_h", max_uptime_bonus_h, 0.0, 24.0 * 365, true));

    if (max_clock_drift_s <= 0.0 || freshness_cutoff_s <= 0.0 || max_report_age_s <= 0.0) {
        return Result<void>::Err(ErrorCode::ConfigurationError,
                                 "time tolerances must be positive");
    }
    if (recovery_full_credit_min <= 0.0 || recovery_max_min <= recovery_full_credit_min) {
        return Result<void>::Err(ErrorCode::ConfigurationError,
                                 "recovery_max_min must exceed recovery_full_credit_min > 0");
    }
    if (max_players_weight == 0) {
        return Result<void>::Err(ErrorCode::ConfigurationError, "max_players_weight must be positive");
    }
    if (max_score == 0) {
        return Result<void>::Err(ErrorCode::ConfigurationError, "max_score must be positive");
    }
    if (min_score_change > max_score_change) {
        return Result<void>::Err(ErrorCode::ConfigurationError,
                                 "min_score_change must not exceed max_score_change");
    }
    if (max_history == 0 || reliability_window == 0 || recovery_window == 0) {
        return Result<void>::Err(ErrorCode::ConfigurationError,
                                 "history and window lengths must be positive");
    }
    if (reliability_window > max_history || recovery_window > max_history) {
        return Result<void>::Err(ErrorCode::ConfigurationError,
                                 "reliability windows cannot exceed max_history");
    }

    return Result<void>::Ok();
}

ScoringConfig ScoringConfig::defaults() {
    ScoringConfig config;
    auto valid = config.validate();
    if (valid.is_err()) {
        throw ConfigException(valid.error().message());
    }
    return config;
}

ScoringConfig ScoringConfig::from_config(const utils::Config& source) {
    ScoringConfig config;

    read_key(source, "ideal_tps", config.ideal_tps);
    read_key(source, "excellent_latency_s", config.excellent_latency_s);
    read_key(source, "max_latency_s", config.max_latency_s);
    read_key(source, "min_memory_headroom", config.min_memory_headroom);

    read_unsigned(source, "max_players_weight", config.max_players_weight);
    read_key(source, "optimal_player_ratio_min", config.optimal_player_ratio_min);
    read_key(source, "optimal_player_ratio_max", config.optimal_player_ratio_max);
    read_key(source, "required_plugins", config.required_plugins);
    read_key(source, "missing_plugin_credit", config.missing_plugin_credit);
    read_key(source, "compliance_pass_threshold", config.compliance_pass_threshold);

    read_key(source, "w_infra", config.w_infra);
    read_key(source, "w_part", config.w_part);
    read_key(source, "w_rely", config.w_rely);
    read_key(source, "w_infra_tps", config.w_infra_tps);
    read_key(source, "w_infra_latency", config.w_infra_latency);
    read_key(source, "w_infra_memory", config.w_infra_memory);
    read_key(source, "w_part_compliance", config.w_part_compliance);
    read_key(source, "w_part_players", config.w_part_players);
    read_key(source, "w_part_registration", config.w_part_registration);
    read_key(source, "w_rely_uptime", config.w_rely_uptime);
    read_key(source, "w_rely_stability", config.w_rely_stability);
    read_key(source, "w_rely_recovery", config.w_rely_recovery);

    read_key(source, "max_uptime_bonus_h", config.max_uptime_bonus_h);
    read_key(source, "uptime_reset_penalty", config.uptime_reset_penalty);
    read_unsigned(source, "min_reports_for_reliability", config.min_reports_for_reliability);
    read_unsigned(source, "reliability_window", config.reliability_window);
    read_unsigned(source, "recovery_window", config.recovery_window);
    read_key(source, "max_tps_cv", config.max_tps_cv);
    read_key(source, "recovery_tps_threshold", config.recovery_tps_threshold);
    read_key(source, "recovery_full_credit_min", config.recovery_full_credit_min);
    read_key(source, "recovery_max_min", config.recovery_max_min);
    read_key(source, "freshness_cutoff_s", config.freshness_cutoff_s);
    read_key(source, "stale_weight_floor", config.stale_weight_floor);

    read_key(source, "max_clock_drift_s", config.max_clock_drift_s);
    read_key(source, "clock_drift_factor", config.clock_drift_factor);
    if (source.has("payload_digest")) {
        auto name = source.get<std::string>("payload_digest");
        auto algorithm = name ? crypto::digest_algorithm_from_string(*name) : std::nullopt;
        if (!algorithm) {
            throw ConfigException("option 'payload_digest' must be sha256 or blake3");
        }
        config.payload_digest = *algorithm;
    }

    read_key(source, "compliance_failure_cap", config.compliance_failure_cap);
    read_key(source, "integrity_failure_cap", config.integrity_failure_cap);
    read_key(source, "signature_failure_cap", config.signature_failure_cap);

    read_unsigned(source, "max_score", config.max_score);
    read_key(source, "ema_alpha", config.ema_alpha);
    read_unsigned(source, "min_score_change", config.min_score_change);
    read_unsigned(source, "max_score_change", config.max_score_change);

    read_unsigned(source, "max_history", config.max_history);
    read_key(source, "max_report_age_s", config.max_report_age_s);
    read_key(source, "debug", config.debug);

    auto valid = config.validate();
    if (valid.is_err()) {
        throw ConfigException(valid.error().message());
    }
    return config;
}

void ScoringConfig::apply_env_overrides() {
    ideal_tps = env_double("SERVERSCORE_IDEAL_TPS", ideal_tps);
    max_latency_s = env_double("SERVERSCORE_MAX_LATENCY_S", max_latency_s);
    max_players_weight = env_uint("SERVERSCORE_MAX_PLAYERS_WEIGHT", max_players_weight);

    w_infra = env_double("SERVERSCORE_W_INFRA", w_infra);
    w_part = env_double("SERVERSCORE_W_PART", w_part);
    w_rely = env_double("SERVERSCORE_W_RELY", w_rely);

    ema_alpha = env_double("SERVERSCORE_EMA_ALPHA", ema_alpha);
    max_score = env_uint("SERVERSCORE_MAX_SCORE", max_score);

    if (auto plugins = utils::Config::env("SERVERSCORE_REQUIRED_PLUGINS")) {
        required_plugins = split_plugins(*plugins);
    }
    if (auto flag = utils::Config::env("SERVERSCORE_DEBUG_SCORING")) {
        debug = (*flag == "true" || *flag == "1" || *flag == "TRUE" || *flag == "True");
    }
}

ScoringConfig ScoringConfig::load(const utils::Config& source) {
    ScoringConfig config = from_config(source);
    config.apply_env_overrides();

    auto valid = config.validate();
    if (valid.is_err()) {
        throw ConfigException(valid.error().message());
    }

    SERVERSCORE_LOG_INFO("Scoring config loaded: weights infra={:.2f} part={:.2f} rely={:.2f}, "
                         "alpha={:.2f}, max_score={}, {} required plugin(s)",
                         config.w_infra, config.w_part, config.w_rely,
                         config.ema_alpha, config.max_score, config.required_plugins.size());
    return config;
}

utils::json ScoringConfig::to_json() const {
    return utils::json{
        {"ideal_tps", ideal_tps},
        {"excellent_latency_s", excellent_latency_s},
        {"max_latency_s", max_latency_s},
        {"min_memory_headroom", min_memory_headroom},
        {"max_players_weight", max_players_weight},
        {"optimal_player_ratio_min", optimal_player_ratio_min},
        {"optimal_player_ratio_max", optimal_player_ratio_max},
        {"required_plugins", required_plugins},
        {"missing_plugin_credit", missing_plugin_credit},
        {"compliance_pass_threshold", compliance_pass_threshold},
        {"w_infra", w_infra},
        {"w_part", w_part},
        {"w_rely", w_rely},
        {"w_infra_tps", w_infra_tps},
        {"w_infra_latency", w_infra_latency},
        {"w_infra_memory", w_infra_memory},
        {"w_part_compliance", w_part_compliance},
        {"w_part_players", w_part_players},
        {"w_part_registration", w_part_registration},
        {"w_rely_uptime", w_rely_uptime},
        {"w_rely_stability", w_rely_stability},
        {"w_rely_recovery", w_rely_recovery},
        {"max_uptime_bonus_h", max_uptime_bonus_h},
        {"uptime_reset_penalty", uptime_reset_penalty},
        {"min_reports_for_reliability", min_reports_for_reliability},
        {"reliability_window", reliability_window},
        {"recovery_window", recovery_window},
        {"max_tps_cv", max_tps_cv},
        {"recovery_tps_threshold", recovery_tps_threshold},
        {"recovery_full_credit_min", recovery_full_credit_min},
        {"recovery_max_min", recovery_max_min},
        {"freshness_cutoff_s", freshness_cutoff_s},
        {"stale_weight_floor", stale_weight_floor},
        {"max_clock_drift_s", max_clock_drift_s},
        {"clock_drift_factor", clock_drift_factor},
        {"payload_digest", crypto::digest_algorithm_name(payload_digest)},
        {"compliance_failure_cap", compliance_failure_cap},
        {"integrity_failure_cap", integrity_failure_cap},
        {"signature_failure_cap", signature_failure_cap},
        {"max_score", max_score},
        {"ema_alpha", ema_alpha},
        {"min_score_change", min_score_change},
        {"max_score_change", max_score_change},
        {"max_history", max_history},
        {"max_report_age_s", max_report_age_s},
        {"debug", debug}
    };
}

} // namespace serverscore::scoring

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

// Scoring
#include "core/scoring/registry.hpp"
#include "core/scoring/scoring_config.hpp"

// Validator loop
#include "validator/file_collaborators.hpp"
#include "validator/scoring_cycle.hpp"

// Utilities
#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "serverscore/common.hpp"
#include "serverscore/time_utils.hpp"

// Global flag for graceful shutdown
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

// Entities listed in the config, or every entity the report file knows
std::vector<serverscore::validator::EntityInput> entity_inputs(
    const serverscore::utils::Config& config,
    const serverscore::validator::JsonFileReportSource& source
) {
    std::vector<serverscore::validator::EntityInput> inputs;

    const auto& data = config.data();
    if (data.contains("entities") && data["entities"].is_array()) {
        for (const auto& entry : data["entities"]) {
            serverscore::validator::EntityInput input;
            if (entry.is_string()) {
                input.entity_id = entry.get<std::string>();
            } else if (entry.is_object() && entry.contains("id") && entry["id"].is_string()) {
                input.entity_id = entry["id"].get<std::string>();
                input.latency_s = entry.value("latency_s", 0.0);
                input.registration_ok = entry.value("registration_ok", true);
                input.compliance_ok = entry.value("compliance_ok", true);
            } else {
                SERVERSCORE_LOG_WARN("Ignoring malformed entity entry: {}", entry.dump());
                continue;
            }
            inputs.push_back(std::move(input));
        }
        return inputs;
    }

    for (const auto& entity_id : source.entities()) {
        serverscore::validator::EntityInput input;
        input.entity_id = entity_id;
        inputs.push_back(std::move(input));
    }
    return inputs;
}

int main(int argc, char** argv) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_path = "serverscore.json";
        if (argc > 1) {
            config_path = argv[1];
        }

        serverscore::utils::Config config;
        if (std::filesystem::exists(config_path)) {
            config = serverscore::utils::Config::load_from_file(config_path);
        } else {
            config.set("log_level", "info");
            config.set("log_to_file", false);
            config.set("reports_file", "reports.json");
            config.set("keys_file", "keys.json");
            config.set("weights_file", "weights.json");
            config.set("scores_file", "scores.json");
            config.set("counters_file", "counters.json");
            config.set("cycle_interval_s", 300);
            config.set("run_once", true);
        }

        serverscore::utils::Logger::init(
            config.get_or<std::string>("log_level", "info"),
            config.get_or<bool>("log_to_file", false)
        );

        SERVERSCORE_LOG_INFO("serverscore validator v{}", SERVERSCORE_VERSION_STRING);

        auto scoring_config = serverscore::scoring::ScoringConfig::load(config);
        if (scoring_config.debug) {
            serverscore::utils::Logger::get()->set_level(spdlog::level::debug);
            SERVERSCORE_LOG_DEBUG("Effective scoring config: {}", scoring_config.to_json().dump());
        }

        serverscore::validator::JsonFileReportSource source(
            config.get_or<std::string>("reports_file", "reports.json"));
        serverscore::validator::JsonFileKeyResolver keys(
            config.get_or<std::string>("keys_file", "keys.json"));
        serverscore::validator::JsonFileWeightPublisher publisher(
            config.get_or<std::string>("weights_file", "weights.json"));

        serverscore::scoring::ScoreRegistry scores;
        serverscore::scoring::CounterRegistry counters;

        const auto scores_file = config.get_or<std::string>("scores_file", "scores.json");
        if (std::filesystem::exists(scores_file)) {
            auto loaded = scores.load_from_file(scores_file);
            if (loaded.is_err()) {
                SERVERSCORE_LOG_WARN("Starting without stored scores: {}", loaded.error().to_string());
            }
        }

        // Last accepted counters; without them a restart would re-accept old reports
        const auto counters_file = config.get_or<std::string>("counters_file", "counters.json");
        if (std::filesystem::exists(counters_file)) {
            auto loaded = counters.load_from_file(counters_file);
            if (loaded.is_err()) {
                SERVERSCORE_LOG_ERROR("Cannot load report counters: {}", loaded.error().to_string());
                return 1;
            }
        }

        serverscore::validator::ScoringCycle cycle(source, keys, publisher, scores, counters);
        serverscore::validator::CycleOptions options;
        options.parallel = config.get_or<bool>("parallel", false);

        const bool run_once = config.get_or<bool>("run_once", false);
        const auto interval = std::chrono::seconds(config.get_or<int>("cycle_interval_s", 300));

        while (!g_shutdown_requested) {
            auto reloaded = source.reload();
            if (reloaded.is_err()) {
                SERVERSCORE_LOG_ERROR("Reports unavailable: {}", reloaded.error().to_string());
            } else {
                auto keys_loaded = keys.reload();
                if (keys_loaded.is_err()) {
                    SERVERSCORE_LOG_WARN("Public keys unavailable: {}", keys_loaded.error().to_string());
                }

                cycle.run(entity_inputs(config, source), scoring_config,
                          serverscore::time::timestamp_milliseconds(), options);

                auto saved = scores.save_to_file(scores_file);
                if (saved.is_err()) {
                    SERVERSCORE_LOG_ERROR("Saving scores failed: {}", saved.error().to_string());
                }
                auto counters_saved = counters.save_to_file(counters_file);
                if (counters_saved.is_err()) {
                    SERVERSCORE_LOG_ERROR("Saving report counters failed: {}",
                                          counters_saved.error().to_string());
                }
            }

            if (run_once) {
                break;
            }

            auto deadline = std::chrono::steady_clock::now() + interval;
            while (!g_shutdown_requested && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }

        SERVERSCORE_LOG_INFO("Stopped with {} stored score(s)", scores.size());

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

#include "config.hpp"
#include "errors.hpp"
#include "execution.hpp"
#include "pg_store.hpp"
#include "redis_bus.hpp"
#include "schema.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitSystemic = 2;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("metrics", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int run_batch(const Config& config, PostgresStore& pg, Executor& executor) {
    BatchTrigger trigger;
    trigger.symbols = config.symbols.empty() ? pg.watchlist_symbols() : config.symbols;
    trigger.snapshot_time_ms = config.snapshot_time_ms ? config.snapshot_time_ms
                                                       : pg.latest_snapshot_time();

    if (trigger.symbols.empty()) {
        spdlog::warn("No symbols to process: SYMBOLS is empty and no watchlist is active");
        return kExitOk;
    }

    auto ctx = build_context(trigger, config);
    auto result = executor.execute(ctx);
    spdlog::info("Batch summary: {}", result.to_json().dump());
    return kExitOk;
}

int run_event_loop(const Config& config, Executor& executor) {
    RedisBus redis(config.redis_url);
    if (!redis.ping()) {
        spdlog::error("Failed to connect to Redis");
        return kExitFailure;
    }
    redis.create_consumer_group(config.stream_triggers, config.consumer_group);

    spdlog::info("Waiting for triggers on {}", config.stream_triggers);
    while (!shutdown_requested) {
        std::vector<std::pair<std::string, nlohmann::json>> triggers;
        try {
            triggers = redis.read_triggers(config.stream_triggers, config.consumer_group,
                                           config.consumer_name, 10, config.trigger_block_ms);
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to read triggers: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
            continue;
        }

        for (const auto& [msg_id, data] : triggers) {
            nlohmann::json reply = {{"message_id", msg_id}};
            try {
                auto trigger = parse_event_trigger(msg_id, data);
                auto result = executor.execute(build_context(trigger, config));
                reply["status"] = result.failed == 0 ? "ok" : "failed";
                reply["result"] = result.to_json();
            } catch (const SystemicError&) {
                // Left pending so the trigger is redelivered once the store is back
                throw;
            } catch (const std::exception& e) {
                spdlog::warn("Trigger {} rejected: {}", msg_id, e.what());
                reply["status"] = "rejected";
                reply["error"] = e.what();
            }

            try {
                redis.publish_result(config.stream_results, reply);
                redis.ack_message(config.stream_triggers, config.consumer_group, msg_id);
            } catch (const sw::redis::Error& e) {
                spdlog::error("Failed to publish result for {}: {}", msg_id, e.what());
            }
        }
    }

    spdlog::info("Shutting down gracefully");
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::from_env();
        config.apply_args(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Invalid invocation: {}", e.what());
        return kExitFailure;
    }
    setup_logging(config.log_level);

    try {
        config.validate();
        spdlog::info("Starting {} in {} mode", config.service_name, config.mode);

        PostgresStore pg(config.pg_dsn);
        if (!pg.ping()) {
            spdlog::error("Failed to connect to Postgres");
            return kExitSystemic;
        }
        prepare_schema(pg, config.dry_run);

        Executor executor(pg, pg);

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        if (config.mode == "event") {
            return run_event_loop(config, executor);
        }
        return run_batch(config, pg, executor);

    } catch (const SystemicError& e) {
        spdlog::error("Systemic failure: {}", e.what());
        return kExitSystemic;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return kExitFailure;
    }
}

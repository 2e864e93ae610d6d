#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_triggers = get_env("STREAM_TRIGGERS", "metrics.triggers");
    cfg.stream_results = get_env("STREAM_RESULTS", "metrics.results");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "metrics_group");
    cfg.consumer_name = get_env("CONSUMER_NAME", "metrics_consumer");
    cfg.trigger_block_ms = get_env_int("TRIGGER_BLOCK_MS", 1000);

    cfg.mode = get_env("MODE", "batch");
    auto snapshot = get_env("SNAPSHOT_TIME");
    if (!snapshot.empty()) {
        cfg.snapshot_time_ms = util::parse_iso8601(snapshot);
        if (!cfg.snapshot_time_ms) {
            spdlog::warn("Invalid SNAPSHOT_TIME '{}', ignoring", snapshot);
        }
    }
    cfg.dry_run = get_env("DRY_RUN", "false") == "true";
    for (const auto& s : util::split(get_env("SYMBOLS"), ',')) {
        auto symbol = util::to_upper(util::trim(s));
        if (!symbol.empty()) cfg.symbols.push_back(symbol);
    }
    double spot = get_env_double("SPOT_OVERRIDE", 0.0);
    if (spot > 0.0) cfg.spot_override = spot;

    cfg.filters.max_dte_days = get_env_int("MAX_DTE_DAYS", 90);
    cfg.filters.min_open_interest = get_env_int("MIN_OPEN_INTEREST", 100);
    cfg.filters.min_volume = get_env_int("MIN_VOLUME", 1);
    cfg.filters.max_spread_pct = get_env_double("MAX_SPREAD_PCT", 10.0);
    cfg.filters.walls_top_n = get_env_int("WALLS_TOP_N", 3);
    cfg.filters.gex_slope_range_pct = get_env_double("GEX_SLOPE_RANGE_PCT", 0.02);
    cfg.filters.max_moneyness = get_env_double("MAX_MONEYNESS", 0.2);

    cfg.gex.sign_convention = get_env("GEX_SIGN_CONVENTION", "dealer_short_calls") ==
                                      "dealer_short_puts"
        ? GexSignConvention::DealerShortPuts : GexSignConvention::DealerShortCalls;
    cfg.model_version = get_env("MODEL_VERSION", "wyckoff-gex-v1");

    cfg.batch_workers = get_env_int("BATCH_WORKERS", 4);
    cfg.symbol_timeout_ms = get_env_int("SYMBOL_TIMEOUT_MS", 60000);
    cfg.heartbeat_every = get_env_int("HEARTBEAT_EVERY", 25);
    cfg.bars_lookback = get_env_int("BARS_LOOKBACK", 400);

    cfg.service_name = get_env("SERVICE_NAME", "metrics");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

namespace {

int parse_int_flag(const std::string& key, const std::string& value) {
    std::string error = "Invalid integer for --" + key + ": '" + value + "'";
    size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(error);
    }
    if (pos != value.size()) throw std::invalid_argument(error);
    return parsed;
}

double parse_double_flag(const std::string& key, const std::string& value) {
    std::string error = "Invalid number for --" + key + ": '" + value + "'";
    size_t pos = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(error);
    }
    if (pos != value.size()) throw std::invalid_argument(error);
    return parsed;
}

} // namespace

void Config::apply_args(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }

        auto eq = arg.find('=');
        std::string key = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
        std::string value = eq == std::string::npos ? "" : arg.substr(eq + 1);

        if (key == "mode") {
            mode = value;
        } else if (key == "snapshot-time") {
            snapshot_time_ms = util::parse_iso8601(value);
            if (!snapshot_time_ms) {
                throw std::invalid_argument("Invalid --snapshot-time: '" + value + "'");
            }
        } else if (key == "dry-run") {
            if (value.empty() || value == "true") {
                dry_run = true;
            } else if (value == "false") {
                dry_run = false;
            } else {
                throw std::invalid_argument("Invalid --dry-run: '" + value + "'");
            }
        } else if (key == "max-dte") {
            filters.max_dte_days = parse_int_flag(key, value);
        } else if (key == "min-oi") {
            filters.min_open_interest = parse_int_flag(key, value);
        } else if (key == "min-volume") {
            filters.min_volume = parse_int_flag(key, value);
        } else if (key == "walls-top-n") {
            filters.walls_top_n = parse_int_flag(key, value);
        } else if (key == "gex-slope-range-pct") {
            filters.gex_slope_range_pct = parse_double_flag(key, value);
        } else if (key == "log-level") {
            log_level = value;
        } else {
            throw std::invalid_argument("Unknown flag: --" + key);
        }
    }
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (mode != "batch" && mode != "event") {
        throw std::runtime_error("mode must be 'batch' or 'event', got '" + mode + "'");
    }
    if (mode == "event" && redis_url.empty()) {
        throw std::runtime_error("REDIS_URL is required in event mode");
    }
    if (batch_workers < 1 || symbol_timeout_ms <= 0 || bars_lookback < 1) {
        throw std::runtime_error("BATCH_WORKERS, SYMBOL_TIMEOUT_MS and BARS_LOOKBACK must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Mode: {} (dry_run={})", mode, dry_run);
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
    spdlog::info("  Filters: {}", filters.to_json().dump());
    spdlog::info("  Workers: {}, symbol timeout: {}ms", batch_workers, symbol_timeout_ms);
}

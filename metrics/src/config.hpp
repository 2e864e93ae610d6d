#pragma once

#include "dealer_metrics.hpp"
#include "wyckoff.hpp"
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

struct Config {
    // Postgres
    std::string pg_dsn;

    // Redis (event mode)
    std::string redis_url;
    std::string stream_triggers;
    std::string stream_results;
    std::string consumer_group;
    std::string consumer_name;
    int trigger_block_ms;

    // Invocation
    std::string mode;  // "batch" or "event"
    std::optional<int64_t> snapshot_time_ms;
    bool dry_run;
    std::vector<std::string> symbols;  // empty: active watchlist
    std::optional<double> spot_override;

    // Calculation parameters
    FilterConfig filters;
    GexConfig gex;
    WyckoffConfig wyckoff;
    std::string model_version;

    // Execution
    int batch_workers;
    int symbol_timeout_ms;
    int heartbeat_every;
    int bars_lookback;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();

    // --key=value flags; throws std::invalid_argument on unknown or malformed flags
    void apply_args(int argc, const char* const* argv);

    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};

#pragma once

#include "models.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Which side dealers are assumed to be short. DealerShortCalls makes call
// exposure negative and put exposure positive.
enum class GexSignConvention {
    DealerShortCalls,
    DealerShortPuts
};

enum class DealerStatus {
    Full,
    Limited,
    Invalid
};

enum class GammaPosition {
    LongGamma,
    ShortGamma,
    Neutral,
    Unknown
};

enum class MetricsConfidence {
    High,
    Medium,
    Low,
    Invalid
};

std::string to_string(GexSignConvention convention);
std::string to_string(DealerStatus status);
std::string to_string(GammaPosition position);
std::string to_string(MetricsConfidence confidence);

// Contract eligibility, overridable from the command line
struct FilterConfig {
    int max_dte_days = 90;
    int64_t min_open_interest = 100;
    int64_t min_volume = 1;
    double max_spread_pct = 10.0;      // (ask - bid) / mid * 100
    int walls_top_n = 3;
    double gex_slope_range_pct = 0.02; // +/- fraction of spot
    double max_moneyness = 0.2;        // walls only

    nlohmann::json to_json() const;
};

struct GexConfig {
    double contract_multiplier = 100.0;
    GexSignConvention sign_convention = GexSignConvention::DealerShortCalls;

    // |gex_net| below this is neutral
    double position_threshold = 1000000.0;

    // dgpi = sign(net) * log10(|net| + 1) * log_scale
    //        * (1 + clamp(slope * slope_coefficient, -slope_clamp, slope_clamp))
    double dgpi_log_scale = 10.0;
    double dgpi_slope_coefficient = 0.01;
    double dgpi_slope_clamp = 0.3;

    int confidence_min_contracts_valid = 5;
    int confidence_min_contracts_high = 10;
    int64_t confidence_min_total_oi = 1000;
    double confidence_min_coverage_high = 0.8;
    double confidence_min_coverage_medium = 0.5;

    int full_min_eligible = 25;
    int limited_min_eligible = 1;

    nlohmann::json to_json() const;
};

struct DealerConfig {
    FilterConfig filters;
    GexConfig gex;
};

struct FilterStats {
    int total = 0;
    int expired = 0;
    int dte_exceeded = 0;
    int missing_gamma = 0;
    int low_open_interest = 0;
    int low_volume = 0;
    int wide_spread = 0;
    int other = 0;

    int rejected() const;
    nlohmann::json to_json() const;
};

struct Wall {
    double strike = 0.0;
    int64_t open_interest = 0;
    int64_t volume = 0;
};

struct StatusDecision {
    DealerStatus status = DealerStatus::Invalid;
    std::string reason;
};

struct DealerMetrics {
    std::string symbol;
    int64_t snapshot_time_ms = 0;
    std::optional<int64_t> effective_options_time_ms;
    int trading_day = 0;
    SpotResolution spot;

    int total_options_count = 0;
    int eligible_options_count = 0;
    FilterStats filter_stats;

    std::optional<double> gex_total;
    std::optional<double> gex_net;
    std::optional<double> gamma_flip;
    std::vector<Wall> call_walls;
    std::vector<Wall> put_walls;
    std::optional<double> gex_slope;
    std::optional<double> dgpi;
    GammaPosition position = GammaPosition::Unknown;
    MetricsConfidence confidence = MetricsConfidence::Invalid;

    DealerStatus status = DealerStatus::Invalid;
    std::string status_reason;
    std::vector<std::string> diagnostics;

    FilterConfig filters;
    GexSignConvention sign_convention = GexSignConvention::DealerShortCalls;

    nlohmann::json to_json() const;
};

// Deterministic status taxonomy over the derived quantities
StatusDecision classify_status(int eligible_options,
                               const std::optional<double>& gex_total,
                               const std::optional<double>& gex_net,
                               bool spot_available,
                               GammaPosition position,
                               MetricsConfidence confidence,
                               const GexConfig& config = GexConfig());

// Pure: never throws for data-quality problems, degrades to Invalid instead
DealerMetrics compute_dealer_metrics(const OptionChainSnapshot& snapshot,
                                     const SpotResolution& spot,
                                     const DealerConfig& config);

// Exposed for tests
std::optional<double> find_gamma_flip(const std::vector<std::pair<double, double>>& strike_gex);

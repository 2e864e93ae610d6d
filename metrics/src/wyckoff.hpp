#pragma once

#include "models.hpp"
#include "regime.hpp"
#include "scoring.hpp"
#include <cstddef>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

// Detector thresholds. Ratios are against the trailing lookback window,
// percentages are fractions (0.05 = 5%).
struct WyckoffConfig {
    int min_history_bars = 30;
    int lookback_bars = 20;
    int trend_bars = 10;
    int momentum_bars = 5;
    size_t max_history_events = 256;
    int sequence_max_days = 30;

    // Selling climax
    double sc_min_decline_pct = 0.05;
    double sc_min_volume_ratio = 2.0;
    double sc_min_range_ratio = 1.5;

    // Automatic rally off the climax low
    int ar_max_bars = 10;
    double ar_min_rally_pct = 0.03;
    double ar_max_volume_ratio = 1.0;

    // Retest of the AR ceiling
    int ar_top_max_bars = 20;
    double ar_top_tolerance_pct = 0.01;
    double ar_top_max_volume_ratio = 1.0;

    int spring_min_bars_after_sc = 3;
    double spring_max_penetration_pct = 0.05;
    double spring_max_volume_ratio = 1.0;
    int spring_recovery_bars = 2;
    int spring_min_score = 5;

    double sos_breakout_pct = 0.01;
    double sos_min_volume_ratio = 1.5;
    double sos_min_range_ratio = 1.2;
    double sos_min_close_location = 0.6;

    double bc_min_advance_pct = 0.10;
    int bc_min_score = 14;

    double ut_max_penetration_pct = 0.03;
    int ut_recovery_bars = 2;

    double sow_breakdown_pct = 0.01;
    double sow_min_volume_ratio = 1.5;
    double sow_min_range_ratio = 1.2;
    double sow_max_close_location = 0.4;

    ScoringConfig scoring;

    nlohmann::json to_json() const;
};

struct DetectionResult {
    std::vector<WyckoffEvent> events;
    RegimeState new_state;
    std::vector<RegimeTransition> transitions;
    std::optional<int> bc_score;
    std::optional<int> spring_score;
};

class WyckoffDetector {
public:
    explicit WyckoffDetector(const WyckoffConfig& config = WyckoffConfig());

    // Pure over (bars, prior_state). Bars must be strictly increasing by day;
    // bars at or before prior_state.last_bar_date only provide context.
    DetectionResult detect(const std::vector<OHLCVBar>& bars,
                           const RegimeState& prior_state) const;

private:
    struct BarContext {
        double average_volume = 0.0;
        double volume_ratio = 0.0;
        double range_ratio = 0.0;
        double close_location = 0.5;
        double support = 0.0;
        double resistance = 0.0;
        double prior_trend = 0.0;
        double momentum_divergence = 0.0;
    };

    WyckoffConfig config_;

    size_t first_evaluable_index() const;
    BarContext context_at(const std::vector<OHLCVBar>& bars, size_t i) const;

    std::optional<WyckoffEvent> evaluate_bar(const std::vector<OHLCVBar>& bars, size_t i,
                                             const BarContext& ctx,
                                             const RegimeState& state) const;

    std::optional<WyckoffEvent> check_sc(const std::vector<OHLCVBar>& bars, size_t i,
                                         const BarContext& ctx, const RegimeState& state) const;
    std::optional<WyckoffEvent> check_ar(const std::vector<OHLCVBar>& bars, size_t i,
                                         const BarContext& ctx, const RegimeState& state) const;
    std::optional<WyckoffEvent> check_ar_top(const std::vector<OHLCVBar>& bars, size_t i,
                                             const BarContext& ctx, const RegimeState& state) const;
    std::optional<WyckoffEvent> check_spring(const std::vector<OHLCVBar>& bars, size_t i,
                                             const RegimeState& state) const;
    std::optional<WyckoffEvent> check_sos(const std::vector<OHLCVBar>& bars, size_t i,
                                          const BarContext& ctx, const RegimeState& state) const;
    std::optional<WyckoffEvent> check_bc(const std::vector<OHLCVBar>& bars, size_t i,
                                         const BarContext& ctx, const RegimeState& state) const;
    std::optional<WyckoffEvent> check_ut(const std::vector<OHLCVBar>& bars, size_t i,
                                         const BarContext& ctx, const RegimeState& state) const;
    std::optional<WyckoffEvent> check_sow(const std::vector<OHLCVBar>& bars, size_t i,
                                          const BarContext& ctx, const RegimeState& state) const;

    std::optional<double> range_ceiling(const std::vector<OHLCVBar>& bars, size_t i,
                                        const RegimeState& state) const;
    BcSignals bc_signals(const OHLCVBar& bar, const BarContext& ctx) const;
};

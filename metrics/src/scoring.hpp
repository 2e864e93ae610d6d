#pragma once

// Composite climax scores. Each sub-signal is normalised to [0,1] and
// multiplied by its weight; the defaults sum to 28 (BC) and 12 (SPRING).
struct ScoringConfig {
    double bc_weight_volume = 8.0;
    double bc_weight_range = 6.0;
    double bc_weight_close_location = 4.0;
    double bc_weight_advance = 6.0;
    double bc_weight_divergence = 4.0;

    // Volume and range ratios map linearly from 1.0 (nothing) to *_full (1.0)
    double bc_volume_ratio_full = 3.0;
    double bc_range_ratio_full = 2.0;
    double bc_advance_full = 0.25;  // prior advance fraction scoring 1.0

    double spring_weight_penetration = 4.0;
    double spring_weight_volume_dryup = 4.0;
    double spring_weight_recovery = 4.0;

    // Weights of the strength blend used for events without a composite score
    double confidence_weight_volume = 0.4;
    double confidence_weight_range = 0.3;
    double confidence_weight_close = 0.3;

    double bc_max() const;
    double spring_max() const;
};

struct BcSignals {
    double volume_ratio = 0.0;
    double range_ratio = 0.0;
    double close_location = 0.0;     // 0 = closed on the low, 1 = on the high
    double prior_advance = 0.0;      // fractional rise over the trend window
    double momentum_divergence = 0.0; // 0..1, momentum lagging the new high
};

struct SpringSignals {
    double penetration_pct = 0.0;     // depth below the floor, fraction of floor
    double max_penetration_pct = 0.0;
    double volume_ratio = 0.0;        // of the breach bar
    double max_volume_ratio = 1.0;
    int recovery_bars = 0;            // 0 = recovered on the breach bar
    int max_recovery_bars = 0;
};

// 0..28 by default; a weak close (exhaustion) scores high
int bc_score(const BcSignals& signals, const ScoringConfig& config);

// 0..12 by default; shallow, quiet, fast recoveries score high
int spring_score(const SpringSignals& signals, const ScoringConfig& config);

// Confidence in [0,1] from normalised volume, range and close strength
double event_confidence(double volume_strength, double range_strength, double close_strength,
                        const ScoringConfig& config);

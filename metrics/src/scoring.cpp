#include "scoring.hpp"
#include "util.hpp"
#include <cmath>

double ScoringConfig::bc_max() const {
    return bc_weight_volume + bc_weight_range + bc_weight_close_location +
           bc_weight_advance + bc_weight_divergence;
}

double ScoringConfig::spring_max() const {
    return spring_weight_penetration + spring_weight_volume_dryup + spring_weight_recovery;
}

namespace {

double ramp(double value, double zero_at, double full_at) {
    if (full_at <= zero_at) return value >= full_at ? 1.0 : 0.0;
    return util::clamp01((value - zero_at) / (full_at - zero_at));
}

} // namespace

int bc_score(const BcSignals& signals, const ScoringConfig& config) {
    double score =
        config.bc_weight_volume * ramp(signals.volume_ratio, 1.0, config.bc_volume_ratio_full) +
        config.bc_weight_range * ramp(signals.range_ratio, 1.0, config.bc_range_ratio_full) +
        config.bc_weight_close_location * util::clamp01(1.0 - signals.close_location) +
        config.bc_weight_advance * ramp(signals.prior_advance, 0.0, config.bc_advance_full) +
        config.bc_weight_divergence * util::clamp01(signals.momentum_divergence);

    return static_cast<int>(std::lround(score));
}

int spring_score(const SpringSignals& signals, const ScoringConfig& config) {
    double penetration = signals.max_penetration_pct > 0.0
        ? 1.0 - util::clamp01(signals.penetration_pct / signals.max_penetration_pct) : 0.0;
    double dryup = signals.max_volume_ratio > 0.0
        ? 1.0 - util::clamp01(signals.volume_ratio / signals.max_volume_ratio) : 0.0;
    double recovery = 1.0 - util::clamp01(static_cast<double>(signals.recovery_bars) /
                                          (signals.max_recovery_bars + 1));

    double score = config.spring_weight_penetration * penetration +
                   config.spring_weight_volume_dryup * dryup +
                   config.spring_weight_recovery * recovery;

    return static_cast<int>(std::lround(score));
}

double event_confidence(double volume_strength, double range_strength, double close_strength,
                        const ScoringConfig& config) {
    double total = config.confidence_weight_volume + config.confidence_weight_range +
                   config.confidence_weight_close;
    if (total <= 0.0) return 0.0;

    double blended = config.confidence_weight_volume * util::clamp01(volume_strength) +
                     config.confidence_weight_range * util::clamp01(range_strength) +
                     config.confidence_weight_close * util::clamp01(close_strength);
    return util::round_to(blended / total, 4);
}

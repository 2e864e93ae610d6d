#include "wyckoff.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

nlohmann::json WyckoffConfig::to_json() const {
    return {
        {"min_history_bars", min_history_bars},
        {"lookback_bars", lookback_bars},
        {"trend_bars", trend_bars},
        {"momentum_bars", momentum_bars},
        {"sequence_max_days", sequence_max_days},
        {"sc_min_decline_pct", sc_min_decline_pct},
        {"sc_min_volume_ratio", sc_min_volume_ratio},
        {"ar_min_rally_pct", ar_min_rally_pct},
        {"spring_max_penetration_pct", spring_max_penetration_pct},
        {"spring_min_score", spring_min_score},
        {"sos_breakout_pct", sos_breakout_pct},
        {"bc_min_advance_pct", bc_min_advance_pct},
        {"bc_min_score", bc_min_score},
        {"bc_weights", {
            scoring.bc_weight_volume, scoring.bc_weight_range, scoring.bc_weight_close_location,
            scoring.bc_weight_advance, scoring.bc_weight_divergence
        }},
        {"spring_weights", {
            scoring.spring_weight_penetration, scoring.spring_weight_volume_dryup,
            scoring.spring_weight_recovery
        }}
    };
}

namespace {

std::optional<size_t> index_of_day(const std::vector<OHLCVBar>& bars, int day) {
    auto it = std::lower_bound(bars.begin(), bars.end(), day,
                               [](const OHLCVBar& b, int d) { return b.day < d; });
    if (it == bars.end() || it->day != day) return std::nullopt;
    return static_cast<size_t>(it - bars.begin());
}

// First down close after the AR bar, if the rally has ended before bar i
std::optional<size_t> rally_end(const std::vector<OHLCVBar>& bars, size_t ar_idx, size_t i) {
    for (size_t k = ar_idx + 1; k < i; ++k) {
        if (bars[k].close < bars[k - 1].close) return k;
    }
    return std::nullopt;
}

double max_high(const std::vector<OHLCVBar>& bars, size_t from, size_t to) {
    double high = bars[from].high;
    for (size_t k = from + 1; k <= to; ++k) high = std::max(high, bars[k].high);
    return high;
}

double min_low(const std::vector<OHLCVBar>& bars, size_t from, size_t to) {
    double low = bars[from].low;
    for (size_t k = from + 1; k <= to; ++k) low = std::min(low, bars[k].low);
    return low;
}

double rate_of_change(const std::vector<OHLCVBar>& bars, size_t k, size_t period) {
    if (k < period || bars[k - period].close <= 0.0) return 0.0;
    return (bars[k].close - bars[k - period].close) / bars[k - period].close;
}

} // namespace

WyckoffDetector::WyckoffDetector(const WyckoffConfig& config) : config_(config) {}

size_t WyckoffDetector::first_evaluable_index() const {
    int first = std::max({config_.lookback_bars, config_.trend_bars + 1, config_.momentum_bars, 1});
    return static_cast<size_t>(first);
}

WyckoffDetector::BarContext WyckoffDetector::context_at(const std::vector<OHLCVBar>& bars,
                                                        size_t i) const {
    BarContext ctx;
    const auto& bar = bars[i];
    size_t window_start = i - static_cast<size_t>(config_.lookback_bars);

    double volume_sum = 0.0;
    double range_sum = 0.0;
    double max_momentum = 0.0;
    ctx.support = bars[window_start].low;
    ctx.resistance = bars[window_start].high;
    for (size_t k = window_start; k < i; ++k) {
        volume_sum += bars[k].volume;
        range_sum += bars[k].high - bars[k].low;
        ctx.support = std::min(ctx.support, bars[k].low);
        ctx.resistance = std::max(ctx.resistance, bars[k].high);
        max_momentum = std::max(max_momentum,
                                rate_of_change(bars, k, static_cast<size_t>(config_.momentum_bars)));
    }

    double n = static_cast<double>(config_.lookback_bars);
    ctx.average_volume = volume_sum / n;
    ctx.volume_ratio = ctx.average_volume > 0.0 ? bar.volume / ctx.average_volume : 0.0;

    double average_range = range_sum / n;
    double range = bar.high - bar.low;
    ctx.range_ratio = average_range > 0.0 ? range / average_range : 0.0;
    ctx.close_location = range > 0.0 ? (bar.close - bar.low) / range : 0.5;

    size_t trend_from = i - 1 - static_cast<size_t>(config_.trend_bars);
    if (bars[trend_from].close > 0.0) {
        ctx.prior_trend = (bars[i - 1].close - bars[trend_from].close) / bars[trend_from].close;
    }

    // Momentum failing to confirm a new high
    double momentum = rate_of_change(bars, i, static_cast<size_t>(config_.momentum_bars));
    if (bar.high > ctx.resistance && max_momentum > 0.0) {
        ctx.momentum_divergence = util::clamp01((max_momentum - momentum) / max_momentum);
    }
    return ctx;
}

DetectionResult WyckoffDetector::detect(const std::vector<OHLCVBar>& bars,
                                        const RegimeState& prior_state) const {
    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i].day <= bars[i - 1].day) {
            throw ValidationError(fmt::format(
                "Bars for {} are not strictly increasing at {} (previous {})",
                prior_state.symbol, util::format_date(bars[i].day),
                util::format_date(bars[i - 1].day)));
        }
    }

    DetectionResult result;
    result.new_state = prior_state;
    RegimeState& state = result.new_state;

    if (bars.size() < static_cast<size_t>(std::max(config_.min_history_bars, 1)) ||
        bars.size() <= first_evaluable_index()) {
        spdlog::debug("{}: {} bars, below minimum history {}", prior_state.symbol,
                      bars.size(), config_.min_history_bars);
        return result;
    }

    for (size_t i = first_evaluable_index(); i < bars.size(); ++i) {
        if (prior_state.last_bar_date && bars[i].day <= *prior_state.last_bar_date) {
            continue;
        }

        auto ctx = context_at(bars, i);
        auto event = evaluate_bar(bars, i, ctx, state);
        if (!event) continue;

        spdlog::debug("{}: {} on {} at {:.2f} (confidence {:.2f})", state.symbol,
                      to_string(event->type), util::format_date(event->day),
                      event->price_level, event->confidence);

        result.events.push_back(*event);
        auto transition = RegimeTracker::record(state, *event);
        if (transition) {
            result.transitions.push_back(*transition);
        }
    }

    int last_day = bars.back().day;
    state.last_bar_date = prior_state.last_bar_date
        ? std::max(*prior_state.last_bar_date, last_day) : last_day;
    RegimeTracker::trim_history(state, config_.max_history_events);

    for (const auto& e : result.events) {
        if (e.type == WyckoffEventType::BC) result.bc_score = e.score;
        if (e.type == WyckoffEventType::SPRING) result.spring_score = e.score;
    }
    if (!result.bc_score) {
        size_t last = bars.size() - 1;
        result.bc_score = bc_score(bc_signals(bars[last], context_at(bars, last)),
                                   config_.scoring);
    }
    return result;
}

std::optional<WyckoffEvent> WyckoffDetector::evaluate_bar(const std::vector<OHLCVBar>& bars,
                                                          size_t i, const BarContext& ctx,
                                                          const RegimeState& state) const {
    // At most one event per bar, first match wins
    if (auto e = check_sc(bars, i, ctx, state)) return e;
    if (auto e = check_ar(bars, i, ctx, state)) return e;
    if (auto e = check_ar_top(bars, i, ctx, state)) return e;
    if (auto e = check_spring(bars, i, state)) return e;
    if (auto e = check_sos(bars, i, ctx, state)) return e;
    if (auto e = check_bc(bars, i, ctx, state)) return e;
    if (auto e = check_ut(bars, i, ctx, state)) return e;
    return check_sow(bars, i, ctx, state);
}

namespace {

WyckoffEvent make_event(const std::string& symbol, WyckoffEventType type, const OHLCVBar& bar,
                        double price_level, double confidence, double average_volume,
                        double volume_ratio) {
    WyckoffEvent e;
    e.symbol = symbol;
    e.day = bar.day;
    e.type = type;
    e.price_level = price_level;
    e.confidence = util::round_to(util::clamp01(confidence), 4);
    e.volume_context.volume = bar.volume;
    e.volume_context.average_volume = util::round_to(average_volume, 4);
    e.volume_context.volume_ratio = util::round_to(volume_ratio, 4);
    return e;
}

} // namespace

std::optional<WyckoffEvent> WyckoffDetector::check_sc(const std::vector<OHLCVBar>& bars, size_t i,
                                                      const BarContext& ctx,
                                                      const RegimeState& state) const {
    if (state.current_regime != Regime::Unknown &&
        state.current_regime != Regime::Accumulation &&
        state.current_regime != Regime::Markdown) {
        return std::nullopt;
    }
    if (state.span_contains(WyckoffEventType::SC)) return std::nullopt;

    const auto& bar = bars[i];
    if (ctx.prior_trend > -config_.sc_min_decline_pct ||
        ctx.volume_ratio < config_.sc_min_volume_ratio ||
        ctx.range_ratio < config_.sc_min_range_ratio ||
        bar.close >= bar.open ||
        bar.low >= ctx.support) {
        return std::nullopt;
    }

    double confidence = event_confidence(ctx.volume_ratio / (2.0 * config_.sc_min_volume_ratio),
                                         ctx.range_ratio / (2.0 * config_.sc_min_range_ratio),
                                         ctx.close_location, config_.scoring);
    return make_event(state.symbol, WyckoffEventType::SC, bar, bar.low, confidence,
                      ctx.average_volume, ctx.volume_ratio);
}

std::optional<WyckoffEvent> WyckoffDetector::check_ar(const std::vector<OHLCVBar>& bars, size_t i,
                                                      const BarContext& ctx,
                                                      const RegimeState& state) const {
    if (state.span_contains(WyckoffEventType::AR)) return std::nullopt;
    const auto* sc = state.span_last(WyckoffEventType::SC);
    if (!sc) return std::nullopt;

    auto sc_idx = index_of_day(bars, sc->day);
    if (!sc_idx || *sc_idx >= i || i - *sc_idx > static_cast<size_t>(config_.ar_max_bars)) {
        return std::nullopt;
    }

    const auto& bar = bars[i];
    double rally_target = sc->price_level * (1.0 + config_.ar_min_rally_pct);
    if (bar.close < rally_target || bar.close <= bar.open ||
        ctx.volume_ratio > config_.ar_max_volume_ratio) {
        return std::nullopt;
    }

    double rally = sc->price_level > 0.0 ? bar.close / sc->price_level - 1.0 : 0.0;
    double quietness = config_.ar_max_volume_ratio > 0.0
        ? 1.0 - ctx.volume_ratio / config_.ar_max_volume_ratio : 0.0;
    double confidence = event_confidence(quietness, rally / (2.0 * config_.ar_min_rally_pct),
                                         ctx.close_location, config_.scoring);

    double ceiling = max_high(bars, *sc_idx + 1, i);
    return make_event(state.symbol, WyckoffEventType::AR, bar, ceiling, confidence,
                      ctx.average_volume, ctx.volume_ratio);
}

std::optional<double> WyckoffDetector::range_ceiling(const std::vector<OHLCVBar>& bars, size_t i,
                                                     const RegimeState& state) const {
    if (const auto* top = state.span_last(WyckoffEventType::AR_TOP)) {
        return top->price_level;
    }
    const auto* ar = state.span_last(WyckoffEventType::AR);
    if (!ar) return std::nullopt;

    auto ar_idx = index_of_day(bars, ar->day);
    if (!ar_idx || *ar_idx >= i) return ar->price_level;

    auto end = rally_end(bars, *ar_idx, i);
    size_t last = end ? *end : i - 1;
    return std::max(ar->price_level, max_high(bars, *ar_idx, last));
}

std::optional<WyckoffEvent> WyckoffDetector::check_ar_top(const std::vector<OHLCVBar>& bars,
                                                          size_t i, const BarContext& ctx,
                                                          const RegimeState& state) const {
    if (state.span_contains(WyckoffEventType::AR_TOP)) return std::nullopt;
    const auto* ar = state.span_last(WyckoffEventType::AR);
    if (!ar) return std::nullopt;

    auto ar_idx = index_of_day(bars, ar->day);
    if (!ar_idx || *ar_idx >= i || i - *ar_idx > static_cast<size_t>(config_.ar_top_max_bars)) {
        return std::nullopt;
    }
    auto end = rally_end(bars, *ar_idx, i);
    if (!end) return std::nullopt;

    const auto& bar = bars[i];
    double ceiling = std::max(ar->price_level, max_high(bars, *ar_idx, *end));
    if (bar.high < ceiling * (1.0 - config_.ar_top_tolerance_pct) ||
        bar.close >= ceiling ||
        ctx.volume_ratio > config_.ar_top_max_volume_ratio) {
        return std::nullopt;
    }

    double proximity = config_.ar_top_tolerance_pct > 0.0
        ? 1.0 - std::abs(bar.high - ceiling) / (ceiling * config_.ar_top_tolerance_pct) : 1.0;
    double quietness = config_.ar_top_max_volume_ratio > 0.0
        ? 1.0 - ctx.volume_ratio / config_.ar_top_max_volume_ratio : 0.0;
    double confidence = event_confidence(quietness, proximity, 1.0 - ctx.close_location,
                                         config_.scoring);
    return make_event(state.symbol, WyckoffEventType::AR_TOP, bar, ceiling, confidence,
                      ctx.average_volume, ctx.volume_ratio);
}

std::optional<WyckoffEvent> WyckoffDetector::check_spring(const std::vector<OHLCVBar>& bars,
                                                          size_t i,
                                                          const RegimeState& state) const {
    if (state.span_contains(WyckoffEventType::SPRING)) return std::nullopt;
    const auto* sc = state.span_last(WyckoffEventType::SC);
    if (!sc) return std::nullopt;

    auto sc_idx = index_of_day(bars, sc->day);
    if (sc_idx && *sc_idx >= i) return std::nullopt;

    const double floor = sc->price_level;
    if (bars[i].close <= floor) return std::nullopt;

    // Earliest bar of the breach that bar i recovers from
    std::optional<size_t> breach;
    if (bars[i].low < floor) breach = i;
    size_t earliest = i > static_cast<size_t>(config_.spring_recovery_bars)
        ? i - static_cast<size_t>(config_.spring_recovery_bars) : 0;
    if (sc_idx) earliest = std::max(earliest, *sc_idx + 1);
    for (size_t k = i; k-- > earliest;) {
        if (bars[k].close > floor) break;
        if (bars[k].low < floor) breach = k;
    }
    if (!breach) return std::nullopt;
    if (sc_idx && *breach - *sc_idx < static_cast<size_t>(config_.spring_min_bars_after_sc)) {
        return std::nullopt;
    }
    if (*breach < first_evaluable_index()) return std::nullopt;

    double low = min_low(bars, *breach, i);
    double penetration = floor > 0.0 ? (floor - low) / floor : 0.0;
    if (penetration <= 0.0 || penetration > config_.spring_max_penetration_pct) {
        return std::nullopt;
    }

    auto breach_ctx = context_at(bars, *breach);
    if (breach_ctx.volume_ratio > config_.spring_max_volume_ratio) return std::nullopt;

    SpringSignals signals;
    signals.penetration_pct = penetration;
    signals.max_penetration_pct = config_.spring_max_penetration_pct;
    signals.volume_ratio = breach_ctx.volume_ratio;
    signals.max_volume_ratio = config_.spring_max_volume_ratio;
    signals.recovery_bars = static_cast<int>(i - *breach);
    signals.max_recovery_bars = config_.spring_recovery_bars;

    int score = spring_score(signals, config_.scoring);
    if (score < config_.spring_min_score) return std::nullopt;

    double max_score = config_.scoring.spring_max();
    auto event = make_event(state.symbol, WyckoffEventType::SPRING, bars[i], low,
                            max_score > 0.0 ? score / max_score : 0.0,
                            breach_ctx.average_volume, breach_ctx.volume_ratio);
    event.score = score;
    return event;
}

std::optional<WyckoffEvent> WyckoffDetector::check_sos(const std::vector<OHLCVBar>& bars, size_t i,
                                                       const BarContext& ctx,
                                                       const RegimeState& state) const {
    if (state.current_regime != Regime::Unknown &&
        state.current_regime != Regime::Accumulation) {
        return std::nullopt;
    }
    if (state.span_contains(WyckoffEventType::SOS)) return std::nullopt;

    double level = range_ceiling(bars, i, state).value_or(ctx.resistance);
    const auto& bar = bars[i];
    if (bar.close <= level * (1.0 + config_.sos_breakout_pct) ||
        ctx.volume_ratio < config_.sos_min_volume_ratio ||
        ctx.range_ratio < config_.sos_min_range_ratio ||
        ctx.close_location < config_.sos_min_close_location) {
        return std::nullopt;
    }

    double confidence = event_confidence(ctx.volume_ratio / (2.0 * config_.sos_min_volume_ratio),
                                         ctx.range_ratio / (2.0 * config_.sos_min_range_ratio),
                                         ctx.close_location, config_.scoring);
    return make_event(state.symbol, WyckoffEventType::SOS, bar, level, confidence,
                      ctx.average_volume, ctx.volume_ratio);
}

BcSignals WyckoffDetector::bc_signals(const OHLCVBar& bar, const BarContext& ctx) const {
    BcSignals signals;
    signals.volume_ratio = ctx.volume_ratio;
    signals.range_ratio = ctx.range_ratio;
    signals.close_location = ctx.close_location;
    signals.prior_advance = std::max(0.0, ctx.prior_trend);
    signals.momentum_divergence = bar.high > ctx.resistance ? ctx.momentum_divergence : 0.0;
    return signals;
}

std::optional<WyckoffEvent> WyckoffDetector::check_bc(const std::vector<OHLCVBar>& bars, size_t i,
                                                      const BarContext& ctx,
                                                      const RegimeState& state) const {
    if (state.current_regime != Regime::Unknown && state.current_regime != Regime::Markup) {
        return std::nullopt;
    }
    if (state.span_contains(WyckoffEventType::BC)) return std::nullopt;

    const auto& bar = bars[i];
    if (ctx.prior_trend < config_.bc_min_advance_pct ||
        bar.high <= ctx.resistance ||
        bar.close <= bar.open) {
        return std::nullopt;
    }

    int score = bc_score(bc_signals(bar, ctx), config_.scoring);
    if (score < config_.bc_min_score) return std::nullopt;

    double max_score = config_.scoring.bc_max();
    auto event = make_event(state.symbol, WyckoffEventType::BC, bar, bar.high,
                            max_score > 0.0 ? score / max_score : 0.0,
                            ctx.average_volume, ctx.volume_ratio);
    event.score = score;
    return event;
}

std::optional<WyckoffEvent> WyckoffDetector::check_ut(const std::vector<OHLCVBar>& bars, size_t i,
                                                      const BarContext& ctx,
                                                      const RegimeState& state) const {
    if (state.current_regime != Regime::Distribution) return std::nullopt;
    if (state.span_contains(WyckoffEventType::UT)) return std::nullopt;
    const auto* bc = state.span_last(WyckoffEventType::BC);
    if (!bc) return std::nullopt;

    auto bc_idx = index_of_day(bars, bc->day);
    if (bc_idx && *bc_idx >= i) return std::nullopt;

    const double ceiling = bc->price_level;
    if (bars[i].close >= ceiling) return std::nullopt;

    // Earliest bar of the breakout that bar i closes back under
    std::optional<size_t> breakout;
    if (bars[i].high > ceiling) breakout = i;
    size_t earliest = i > static_cast<size_t>(config_.ut_recovery_bars)
        ? i - static_cast<size_t>(config_.ut_recovery_bars) : 0;
    if (bc_idx) earliest = std::max(earliest, *bc_idx + 1);
    for (size_t k = i; k-- > earliest;) {
        if (bars[k].close < ceiling) break;
        if (bars[k].high > ceiling) breakout = k;
    }
    if (!breakout) return std::nullopt;

    double high = max_high(bars, *breakout, i);
    if (high > ceiling * (1.0 + config_.ut_max_penetration_pct)) return std::nullopt;

    double confidence = event_confidence(ctx.volume_ratio / 2.0, ctx.range_ratio / 2.0,
                                         1.0 - ctx.close_location, config_.scoring);
    return make_event(state.symbol, WyckoffEventType::UT, bars[i], high, confidence,
                      ctx.average_volume, ctx.volume_ratio);
}

std::optional<WyckoffEvent> WyckoffDetector::check_sow(const std::vector<OHLCVBar>& bars, size_t i,
                                                       const BarContext& ctx,
                                                       const RegimeState& state) const {
    if (state.current_regime != Regime::Distribution) return std::nullopt;
    if (state.span_contains(WyckoffEventType::SOW)) return std::nullopt;

    double floor = ctx.support;
    if (const auto* bc = state.span_last(WyckoffEventType::BC)) {
        auto bc_idx = index_of_day(bars, bc->day);
        if (bc_idx && *bc_idx + 1 < i) {
            floor = min_low(bars, *bc_idx + 1, i - 1);
        }
    }

    const auto& bar = bars[i];
    if (bar.close >= floor * (1.0 - config_.sow_breakdown_pct) ||
        ctx.volume_ratio < config_.sow_min_volume_ratio ||
        ctx.range_ratio < config_.sow_min_range_ratio ||
        ctx.close_location > config_.sow_max_close_location) {
        return std::nullopt;
    }

    double confidence = event_confidence(ctx.volume_ratio / (2.0 * config_.sow_min_volume_ratio),
                                         ctx.range_ratio / (2.0 * config_.sow_min_range_ratio),
                                         1.0 - ctx.close_location, config_.scoring);
    return make_event(state.symbol, WyckoffEventType::SOW, bar, floor, confidence,
                      ctx.average_volume, ctx.volume_ratio);
}

#include "dealer_metrics.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <map>

std::string to_string(GexSignConvention convention) {
    return convention == GexSignConvention::DealerShortCalls ? "dealer_short_calls"
                                                             : "dealer_short_puts";
}

std::string to_string(DealerStatus status) {
    switch (status) {
        case DealerStatus::Full: return "FULL";
        case DealerStatus::Limited: return "LIMITED";
        case DealerStatus::Invalid: return "INVALID";
    }
    return "INVALID";
}

std::string to_string(GammaPosition position) {
    switch (position) {
        case GammaPosition::LongGamma: return "long_gamma";
        case GammaPosition::ShortGamma: return "short_gamma";
        case GammaPosition::Neutral: return "neutral";
        case GammaPosition::Unknown: return "unknown";
    }
    return "unknown";
}

std::string to_string(MetricsConfidence confidence) {
    switch (confidence) {
        case MetricsConfidence::High: return "high";
        case MetricsConfidence::Medium: return "medium";
        case MetricsConfidence::Low: return "low";
        case MetricsConfidence::Invalid: return "invalid";
    }
    return "invalid";
}

nlohmann::json FilterConfig::to_json() const {
    return {
        {"max_dte_days", max_dte_days},
        {"min_open_interest", min_open_interest},
        {"min_volume", min_volume},
        {"max_spread_pct", max_spread_pct},
        {"walls_top_n", walls_top_n},
        {"gex_slope_range_pct", gex_slope_range_pct},
        {"max_moneyness", max_moneyness}
    };
}

nlohmann::json GexConfig::to_json() const {
    return {
        {"contract_multiplier", contract_multiplier},
        {"sign_convention", to_string(sign_convention)},
        {"position_threshold", position_threshold},
        {"dgpi_log_scale", dgpi_log_scale},
        {"dgpi_slope_coefficient", dgpi_slope_coefficient},
        {"dgpi_slope_clamp", dgpi_slope_clamp}
    };
}

int FilterStats::rejected() const {
    return expired + dte_exceeded + missing_gamma + low_open_interest +
           low_volume + wide_spread + other;
}

nlohmann::json FilterStats::to_json() const {
    return {
        {"total", total},
        {"expired", expired},
        {"dte_exceeded", dte_exceeded},
        {"missing_gamma", missing_gamma},
        {"low_open_interest", low_open_interest},
        {"low_volume", low_volume},
        {"wide_spread", wide_spread},
        {"other", other}
    };
}

namespace {

nlohmann::json walls_json(const std::vector<Wall>& walls) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : walls) {
        arr.push_back({
            {"strike", w.strike},
            {"open_interest", w.open_interest},
            {"volume", w.volume}
        });
    }
    return arr;
}

bool is_finite(const std::optional<double>& v) {
    return v && std::isfinite(*v);
}

// Counts the rejection reason for a contract, or returns true if it is eligible
bool passes_filters(const OptionContract& c, int trading_day,
                    const FilterConfig& cfg, FilterStats& stats) {
    if (!(c.strike > 0.0) || !std::isfinite(c.strike)) {
        stats.other++;
        return false;
    }

    int dte = c.expiry_day - trading_day;
    if (dte < 0) {
        stats.expired++;
        return false;
    }
    if (dte > cfg.max_dte_days) {
        stats.dte_exceeded++;
        return false;
    }
    if (!is_finite(c.gamma)) {
        stats.missing_gamma++;
        return false;
    }
    if (c.open_interest <= 0 || c.open_interest < cfg.min_open_interest) {
        stats.low_open_interest++;
        return false;
    }
    if (c.volume < cfg.min_volume) {
        stats.low_volume++;
        return false;
    }

    // Missing or crossed quotes cannot be priced and count as wide
    if (!is_finite(c.bid) || !is_finite(c.ask) || *c.ask < *c.bid) {
        stats.wide_spread++;
        return false;
    }
    double mid = (*c.bid + *c.ask) / 2.0;
    if (mid <= 0.0 || (*c.ask - *c.bid) / mid * 100.0 > cfg.max_spread_pct) {
        stats.wide_spread++;
        return false;
    }
    return true;
}

std::vector<Wall> top_walls(const std::vector<const OptionContract*>& eligible, OptionType side,
                            const std::optional<double>& spot, const FilterConfig& cfg) {
    std::map<double, Wall> by_strike;
    for (const auto* c : eligible) {
        if (c->type != side) continue;
        if (spot && std::abs(c->strike - *spot) / *spot > cfg.max_moneyness) continue;

        auto& wall = by_strike[c->strike];
        wall.strike = c->strike;
        wall.open_interest += c->open_interest;
        wall.volume += c->volume;
    }

    std::vector<Wall> walls;
    for (const auto& [_, wall] : by_strike) {
        walls.push_back(wall);
    }
    // by_strike is ascending, so a stable sort keeps ties strike-ascending
    std::stable_sort(walls.begin(), walls.end(), [](const Wall& a, const Wall& b) {
        return a.open_interest > b.open_interest;
    });
    if (static_cast<int>(walls.size()) > cfg.walls_top_n) {
        walls.resize(static_cast<size_t>(std::max(0, cfg.walls_top_n)));
    }
    return walls;
}

std::optional<double> compute_gex_slope(const std::vector<std::pair<double, double>>& strike_gex,
                                        double spot, double range_pct) {
    double lo = spot * (1.0 - range_pct);
    double hi = spot * (1.0 + range_pct);

    double cumulative = 0.0;
    std::vector<std::pair<double, double>> in_range;
    for (const auto& [strike, gex] : strike_gex) {
        cumulative += gex;
        if (strike >= lo && strike <= hi) {
            in_range.emplace_back(strike, cumulative);
        }
    }
    if (in_range.size() < 2) return std::nullopt;

    double dk = in_range.back().first - in_range.front().first;
    if (dk <= 0.0) return std::nullopt;
    return util::round_to((in_range.back().second - in_range.front().second) / dk, 4);
}

std::optional<double> compute_dgpi(const std::optional<double>& gex_net,
                                   const std::optional<double>& slope, const GexConfig& cfg) {
    if (!gex_net) return std::nullopt;

    double net = *gex_net;
    double sign = net > 0.0 ? 1.0 : (net < 0.0 ? -1.0 : 0.0);
    double value = sign * std::log10(std::abs(net) + 1.0) * cfg.dgpi_log_scale;

    if (slope && *slope != 0.0) {
        double adj = std::clamp(*slope * cfg.dgpi_slope_coefficient,
                                -cfg.dgpi_slope_clamp, cfg.dgpi_slope_clamp);
        value *= 1.0 + adj;
    }
    return util::round_to(std::clamp(value, -100.0, 100.0), 2);
}

GammaPosition classify_position(const std::optional<double>& gex_net, const GexConfig& cfg) {
    if (!gex_net) return GammaPosition::Unknown;
    if (std::abs(*gex_net) < cfg.position_threshold) return GammaPosition::Neutral;
    return *gex_net > 0.0 ? GammaPosition::LongGamma : GammaPosition::ShortGamma;
}

MetricsConfidence classify_confidence(int eligible, int64_t total_oi, double coverage,
                                      const GexConfig& cfg) {
    if (eligible < cfg.confidence_min_contracts_valid) return MetricsConfidence::Invalid;
    if (eligible >= cfg.confidence_min_contracts_high &&
        total_oi >= cfg.confidence_min_total_oi &&
        coverage >= cfg.confidence_min_coverage_high) {
        return MetricsConfidence::High;
    }
    if (coverage >= cfg.confidence_min_coverage_medium) return MetricsConfidence::Medium;
    return MetricsConfidence::Low;
}

} // namespace

std::optional<double> find_gamma_flip(const std::vector<std::pair<double, double>>& strike_gex) {
    double cumulative = 0.0;
    for (size_t i = 0; i < strike_gex.size(); ++i) {
        double prev = cumulative;
        cumulative += strike_gex[i].second;
        if (i == 0) continue;

        bool crossed = (prev < 0.0 && cumulative > 0.0) || (prev > 0.0 && cumulative < 0.0);
        if (!crossed) continue;

        double k1 = strike_gex[i - 1].first;
        double k2 = strike_gex[i].first;
        double flip = k1 + (k2 - k1) * (-prev) / (cumulative - prev);
        double rounded = util::round_to(flip, 2);
        // Rounding must not push the flip onto a bracketing strike
        return (rounded > k1 && rounded < k2) ? rounded : flip;
    }
    return std::nullopt;
}

StatusDecision classify_status(int eligible_options,
                               const std::optional<double>& gex_total,
                               const std::optional<double>& gex_net,
                               bool spot_available,
                               GammaPosition position,
                               MetricsConfidence confidence,
                               const GexConfig& config) {
    if (eligible_options <= 0) return {DealerStatus::Invalid, "no_eligible_options"};
    if (!gex_total) return {DealerStatus::Invalid, "missing_gex_total"};
    if (!gex_net) return {DealerStatus::Invalid, "missing_gex_net"};
    if (!spot_available) return {DealerStatus::Invalid, "missing_spot"};

    bool nonzero = std::abs(*gex_total) > 0.0 && std::abs(*gex_net) > 0.0;

    if (eligible_options >= config.full_min_eligible && nonzero &&
        position != GammaPosition::Unknown &&
        (confidence == MetricsConfidence::High || confidence == MetricsConfidence::Medium)) {
        return {DealerStatus::Full, "full_thresholds_met"};
    }

    if (eligible_options >= config.limited_min_eligible && nonzero &&
        position != GammaPosition::Unknown &&
        (confidence == MetricsConfidence::Medium || confidence == MetricsConfidence::Invalid)) {
        return {DealerStatus::Limited, "limited_thresholds_met"};
    }

    return {DealerStatus::Invalid, "criteria_not_met"};
}

DealerMetrics compute_dealer_metrics(const OptionChainSnapshot& snapshot,
                                     const SpotResolution& spot,
                                     const DealerConfig& config) {
    const auto& fc = config.filters;
    const auto& gc = config.gex;

    DealerMetrics m;
    m.symbol = snapshot.symbol;
    m.snapshot_time_ms = snapshot.snapshot_time_ms;
    m.effective_options_time_ms = snapshot.effective_options_time_ms;
    m.trading_day = snapshot.trading_day;
    m.spot = spot;
    m.filters = fc;
    m.sign_convention = gc.sign_convention;

    std::optional<double> spot_price;
    if (is_finite(spot.spot) && *spot.spot > 0.0) {
        spot_price = spot.spot;
    }

    m.total_options_count = static_cast<int>(snapshot.contracts.size());
    m.filter_stats.total = m.total_options_count;

    std::vector<const OptionContract*> eligible;
    int with_gamma = 0;
    for (const auto& c : snapshot.contracts) {
        if (is_finite(c.gamma)) with_gamma++;
        if (passes_filters(c, snapshot.trading_day, fc, m.filter_stats)) {
            eligible.push_back(&c);
        }
    }
    m.eligible_options_count = static_cast<int>(eligible.size());

    int64_t total_oi = 0;
    std::map<double, double> by_strike;
    if (!eligible.empty()) {
        double gex_total = 0.0;
        double gex_net = 0.0;
        for (const auto* c : eligible) {
            double exposure = *c->gamma * static_cast<double>(c->open_interest) *
                              gc.contract_multiplier;
            bool negative = (c->type == OptionType::Call) ==
                            (gc.sign_convention == GexSignConvention::DealerShortCalls);
            double signed_exposure = negative ? -exposure : exposure;

            gex_total += std::abs(signed_exposure);
            gex_net += signed_exposure;
            by_strike[c->strike] += signed_exposure;
            total_oi += c->open_interest;
        }
        m.gex_total = util::round_to(gex_total, 2);
        m.gex_net = util::round_to(gex_net, 2);
    }

    std::vector<std::pair<double, double>> strike_gex(by_strike.begin(), by_strike.end());
    m.gamma_flip = find_gamma_flip(strike_gex);
    m.call_walls = top_walls(eligible, OptionType::Call, spot_price, fc);
    m.put_walls = top_walls(eligible, OptionType::Put, spot_price, fc);
    if (spot_price) {
        m.gex_slope = compute_gex_slope(strike_gex, *spot_price, fc.gex_slope_range_pct);
    }
    m.dgpi = compute_dgpi(m.gex_net, m.gex_slope, gc);
    m.position = classify_position(m.gex_net, gc);

    double coverage = m.total_options_count > 0
        ? static_cast<double>(with_gamma) / m.total_options_count : 0.0;
    m.confidence = classify_confidence(m.eligible_options_count, total_oi, coverage, gc);

    if (!spot_price) {
        m.diagnostics.push_back("missing_spot_price");
        if (m.eligible_options_count > 0) {
            m.diagnostics.push_back("spot_resolution_failed");
        }
    }
    if (m.total_options_count == 0) {
        m.diagnostics.push_back("no_options_available");
    } else if (m.eligible_options_count == 0) {
        m.diagnostics.push_back("all_contracts_filtered");
    }
    if (m.eligible_options_count == 0) {
        m.diagnostics.push_back("no_eligible_options");
    }

    auto decision = classify_status(m.eligible_options_count, m.gex_total, m.gex_net,
                                    spot_price.has_value(), m.position, m.confidence, gc);
    m.status = decision.status;
    m.status_reason = decision.reason;
    return m;
}

nlohmann::json DealerMetrics::to_json() const {
    nlohmann::json effective_time = effective_options_time_ms
        ? nlohmann::json(util::format_iso8601(*effective_options_time_ms))
        : nlohmann::json(nullptr);

    nlohmann::json metadata = {
        {"symbol", symbol},
        {"snapshot_time", util::format_iso8601(snapshot_time_ms)},
        {"effective_options_time", effective_time},
        {"effective_trading_date", util::format_date(trading_day)},
        {"spot_resolution_strategy", nullable(spot.strategy)},
        {"spot_attempted_sources", spot.attempted_sources},
        {"status_reason", status_reason},
        {"filters", filters.to_json()},
        {"filter_stats", filter_stats.to_json()},
        {"gex_sign_convention", to_string(sign_convention)},
        {"diagnostics", diagnostics}
    };

    return {
        {"status", to_string(status)},
        {"failure_reason", status == DealerStatus::Invalid ? nlohmann::json(status_reason)
                                                           : nlohmann::json(nullptr)},
        {"diagnostics", diagnostics},
        {"spot_price", nullable(spot.spot)},
        {"spot_price_source", nullable(spot.source)},
        {"eligible_options_count", eligible_options_count},
        {"total_options_count", total_options_count},
        {"gex_total", nullable(gex_total)},
        {"gex_net", nullable(gex_net)},
        {"gamma_flip", nullable(gamma_flip)},
        {"call_walls", walls_json(call_walls)},
        {"put_walls", walls_json(put_walls)},
        {"gex_slope", nullable(gex_slope)},
        {"dgpi", nullable(dgpi)},
        {"position", to_string(position)},
        {"confidence", to_string(confidence)},
        {"metadata", metadata}
    };
}

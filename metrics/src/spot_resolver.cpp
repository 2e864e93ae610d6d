#include "spot_resolver.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace {

bool usable(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

SpotResolution resolve_spot(MarketDataSource& source, const std::string& symbol,
                            int64_t snapshot_time_ms, int trading_day,
                            const std::optional<double>& override_spot) {
    SpotResolution res;

    if (override_spot) {
        res.attempted_sources.push_back("override");
        if (usable(*override_spot)) {
            res.spot = *override_spot;
            res.source = "override";
            res.strategy = "override";
            return res;
        }
    }

    res.attempted_sources.push_back("price_metrics");
    auto metric = source.load_price_metric_spot(symbol, snapshot_time_ms);
    if (metric && usable(metric->value)) {
        res.spot = metric->value;
        res.source = "price_metrics." + metric->key;
        res.strategy = "price_metrics";
        return res;
    }

    res.attempted_sources.push_back("ohlcv");
    auto close = source.load_close(symbol, trading_day);
    if (close && usable(*close)) {
        res.spot = *close;
        res.source = "ohlcv";
        res.strategy = "ohlcv_fallback";
        return res;
    }

    spdlog::debug("{}: no spot price for {}", symbol, util::format_date(trading_day));
    return res;
}

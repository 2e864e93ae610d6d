#pragma once

#include "models.hpp"
#include "store.hpp"
#include <cstdint>
#include <optional>
#include <string>

// Explicit override, then the upstream price metric, then the OHLCV close of
// the trading date. Every attempt is recorded.
SpotResolution resolve_spot(MarketDataSource& source, const std::string& symbol,
                            int64_t snapshot_time_ms, int trading_day,
                            const std::optional<double>& override_spot);

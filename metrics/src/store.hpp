#pragma once

#include "models.hpp"
#include "regime.hpp"
#include "snapshot.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct PriceMetricSpot {
    double value = 0.0;
    std::string key;  // which price_metrics field supplied it
};

// Read-only access to the ingestion collaborators' tables
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    virtual std::optional<int64_t> latest_snapshot_time() = 0;
    virtual std::vector<std::string> watchlist_symbols() = 0;

    // Chain at the latest options time <= snapshot_time; empty if none
    virtual OptionChainSnapshot load_option_chain(const std::string& symbol,
                                                  int64_t snapshot_time_ms) = 0;
    virtual std::optional<PriceMetricSpot> load_price_metric_spot(const std::string& symbol,
                                                                  int64_t snapshot_time_ms) = 0;
    virtual std::optional<double> load_close(const std::string& symbol, int day) = 0;

    // Up to max_bars daily bars ending at end_day, oldest first
    virtual std::vector<OHLCVBar> load_bars(const std::string& symbol, int end_day,
                                            int max_bars) = 0;
};

// Persistence collaborator for snapshot rows and regime state
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual bool ping() = 0;

    // Serialises the regime read-update-write for one symbol
    virtual void with_symbol_lock(const std::string& symbol, const std::function<void()>& fn) = 0;

    // Latest persisted state strictly before the given time
    virtual std::optional<RegimeState> load_prior_regime(const std::string& symbol,
                                                         int64_t before_ms) = 0;

    // Upsert of the owned fields; throws TransientPersistenceError when retries run out
    virtual void upsert_snapshot(const SnapshotRecord& record) = 0;
};

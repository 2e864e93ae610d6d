#pragma once

#include "schema.hpp"
#include "store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <pqxx/pqxx>

// Reads the ingestion tables and owns the metrics columns of daily_snapshots.
// A connection per operation; broken connections surface as SystemicError.
class PostgresStore : public MarketDataSource, public SnapshotStore, public SchemaAdmin {
public:
    explicit PostgresStore(const std::string& dsn);

    void init_schema() override;
    std::vector<std::string> missing_columns() override;

    bool ping() override;

    std::optional<int64_t> latest_snapshot_time() override;
    std::vector<std::string> watchlist_symbols() override;
    OptionChainSnapshot load_option_chain(const std::string& symbol,
                                          int64_t snapshot_time_ms) override;
    std::optional<PriceMetricSpot> load_price_metric_spot(const std::string& symbol,
                                                          int64_t snapshot_time_ms) override;
    std::optional<double> load_close(const std::string& symbol, int day) override;
    std::vector<OHLCVBar> load_bars(const std::string& symbol, int end_day,
                                    int max_bars) override;

    void with_symbol_lock(const std::string& symbol, const std::function<void()>& fn) override;
    std::optional<RegimeState> load_prior_regime(const std::string& symbol,
                                                 int64_t before_ms) override;
    void upsert_snapshot(const SnapshotRecord& record) override;

private:
    std::string dsn_;

    std::mutex locks_mx_;
    std::map<std::string, std::unique_ptr<std::mutex>> symbol_locks_;

    pqxx::connection make_connection();
    std::string ticker_id(pqxx::work& txn, const std::string& symbol);
    std::mutex& local_lock(const std::string& symbol);
    void write_snapshot(const SnapshotRecord& record);
};

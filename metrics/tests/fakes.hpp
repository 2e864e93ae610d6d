#pragma once

#include "../src/errors.hpp"
#include "../src/store.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

// In-memory stand-ins for the Postgres collaborators

class FakeMarketData : public MarketDataSource {
public:
    std::map<std::string, OptionChainSnapshot> chains;
    std::map<std::string, std::vector<OHLCVBar>> bars;
    std::map<std::string, PriceMetricSpot> price_metrics;
    std::map<std::pair<std::string, int>, double> closes;
    std::vector<std::string> watchlist;
    std::optional<int64_t> latest;

    std::set<std::string> failing;           // load_option_chain throws
    std::map<std::string, int> delay_ms;     // load_option_chain sleeps first

    std::atomic<int> calls{0};

    std::optional<int64_t> latest_snapshot_time() override {
        calls++;
        return latest;
    }

    std::vector<std::string> watchlist_symbols() override {
        calls++;
        return watchlist;
    }

    OptionChainSnapshot load_option_chain(const std::string& symbol,
                                          int64_t snapshot_time_ms) override {
        calls++;
        auto delay = delay_ms.find(symbol);
        if (delay != delay_ms.end()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay->second));
        }
        if (failing.count(symbol)) {
            throw std::runtime_error("option chain unavailable for " + symbol);
        }
        auto it = chains.find(symbol);
        if (it != chains.end()) return it->second;

        OptionChainSnapshot empty;
        empty.symbol = symbol;
        empty.snapshot_time_ms = snapshot_time_ms;
        return empty;
    }

    std::optional<PriceMetricSpot> load_price_metric_spot(const std::string& symbol,
                                                          int64_t) override {
        calls++;
        auto it = price_metrics.find(symbol);
        if (it == price_metrics.end()) return std::nullopt;
        return it->second;
    }

    std::optional<double> load_close(const std::string& symbol, int day) override {
        calls++;
        auto it = closes.find({symbol, day});
        if (it == closes.end()) return std::nullopt;
        return it->second;
    }

    std::vector<OHLCVBar> load_bars(const std::string& symbol, int end_day,
                                    int max_bars) override {
        calls++;
        std::vector<OHLCVBar> out;
        auto it = bars.find(symbol);
        if (it == bars.end()) return out;
        for (const auto& b : it->second) {
            if (b.day <= end_day) out.push_back(b);
        }
        if (static_cast<int>(out.size()) > max_bars) {
            out.erase(out.begin(), out.end() - max_bars);
        }
        return out;
    }
};

class FakeStore : public SnapshotStore {
public:
    bool reachable = true;
    std::set<std::string> systemic_on;  // upsert throws SystemicError

    bool ping() override {
        return reachable;
    }

    void with_symbol_lock(const std::string& symbol, const std::function<void()>& fn) override {
        std::mutex* lock = nullptr;
        {
            std::lock_guard<std::mutex> lk(mx_);
            auto& slot = symbol_locks_[symbol];
            if (!slot) slot = std::make_unique<std::mutex>();
            lock = slot.get();
        }
        std::lock_guard<std::mutex> held(*lock);
        fn();
    }

    std::optional<RegimeState> load_prior_regime(const std::string& symbol,
                                                 int64_t before_ms) override {
        std::lock_guard<std::mutex> lk(mx_);
        std::optional<RegimeState> found;
        for (const auto& [key, row] : rows_) {
            if (key.first != symbol || key.second >= before_ms) continue;
            if (!row.contains("wyckoff_state_json")) continue;
            found = RegimeState::from_json(row["wyckoff_state_json"]);
        }
        return found;
    }

    void upsert_snapshot(const SnapshotRecord& record) override {
        if (systemic_on.count(record.symbol)) {
            throw SystemicError("connection lost");
        }
        std::lock_guard<std::mutex> lk(mx_);
        record.merge_into(rows_[{record.symbol, record.time_ms}]);
        writes_++;
    }

    void seed(const std::string& symbol, int64_t time_ms, const nlohmann::json& row) {
        std::lock_guard<std::mutex> lk(mx_);
        rows_[{symbol, time_ms}] = row;
    }

    std::optional<nlohmann::json> row(const std::string& symbol, int64_t time_ms) {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = rows_.find({symbol, time_ms});
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    int writes() {
        std::lock_guard<std::mutex> lk(mx_);
        return writes_;
    }

private:
    std::mutex mx_;
    std::map<std::string, std::unique_ptr<std::mutex>> symbol_locks_;
    std::map<std::pair<std::string, int64_t>, nlohmann::json> rows_;
    int writes_ = 0;
};

// Shared fixtures

constexpr int kFixtureFirstDay = 20000;

// 35 bars of steady decline, a selling climax, an automatic rally, a quiet
// drift back under the climax low and a spring recovering above it
inline std::vector<OHLCVBar> accumulation_bars() {
    std::vector<OHLCVBar> bars;
    for (int i = 0; i < 35; ++i) {
        OHLCVBar b;
        b.day = kFixtureFirstDay + i;
        b.close = 100.0 - 0.6 * i;
        b.open = b.close + 0.4;
        b.high = b.open + 0.3;
        b.low = b.close - 0.3;
        b.volume = 1000.0;
        bars.push_back(b);
    }

    struct Row { double o, h, l, c, v; };
    const Row tail[] = {
        {79.8, 80.0, 75.0, 76.0, 5000.0},  // SC
        {76.2, 78.6, 76.0, 78.4, 800.0},   // AR
        {78.3, 78.4, 77.0, 77.2, 700.0},
        {77.2, 77.3, 76.2, 76.4, 700.0},
        {76.4, 76.5, 75.6, 75.8, 700.0},
        {75.8, 75.9, 75.2, 75.4, 700.0},
        {75.4, 75.5, 74.2, 74.6, 600.0},   // breach of the SC low
        {74.7, 75.9, 74.6, 75.7, 650.0},   // SPRING
        {75.7, 76.0, 75.4, 75.8, 700.0},
    };
    int day = kFixtureFirstDay + 35;
    for (const auto& r : tail) {
        bars.push_back({day++, r.o, r.h, r.l, r.c, r.v});
    }
    return bars;
}

// accumulation_bars() carried through a full cycle: a test of the AR high and
// a breakout (Markup), a buying climax, an upthrust and a breakdown (Markdown),
// then a fresh selling climax back into Accumulation
inline std::vector<OHLCVBar> market_cycle_bars() {
    auto bars = accumulation_bars();
    auto add = [&bars](double o, double h, double l, double c, double v) {
        bars.push_back({kFixtureFirstDay + static_cast<int>(bars.size()), o, h, l, c, v});
    };

    add(75.8, 78.2, 75.7, 77.9, 700.0);    // AR_TOP
    add(78.0, 81.0, 77.8, 80.8, 3000.0);   // SOS
    for (int k = 0; k < 12; ++k) {
        double c = 81.6 + 1.0 * k;
        add(c - 0.6, c + 0.2, c - 0.8, c, 1000.0);
    }
    add(92.4, 96.0, 92.2, 92.8, 4000.0);   // BC
    for (int k = 0; k < 3; ++k) {
        double c = 92.0 - 0.5 * k;
        add(c + 0.3, c + 0.5, c - 0.3, c, 900.0);
    }
    add(91.2, 97.0, 91.0, 95.0, 1200.0);   // UT
    for (int k = 0; k < 4; ++k) {
        double c = 93.0 - 0.6 * k;
        add(c + 0.4, c + 0.6, c - 0.3, c, 1000.0);
    }
    add(91.0, 91.2, 86.0, 86.4, 4000.0);   // SOW
    for (int k = 0; k < 10; ++k) {
        double c = 85.6 - 0.8 * k;
        add(c + 0.5, c + 0.7, c - 0.3, c, 1000.0);
    }
    add(78.4, 78.6, 73.0, 73.6, 5000.0);   // SC
    add(73.8, 76.4, 73.6, 76.2, 900.0);    // AR
    return bars;
}

inline OptionContract make_contract(OptionType type, double strike, double gamma,
                                    int64_t open_interest, int expiry_day) {
    OptionContract c;
    c.type = type;
    c.strike = strike;
    c.gamma = gamma;
    c.open_interest = open_interest;
    c.volume = 10;
    c.expiry_day = expiry_day;
    c.bid = 1.00;
    c.ask = 1.05;
    return c;
}

// Two calls and two puts around a 144 spot; gex_total 1340, gex_net -140
inline OptionChainSnapshot sample_chain(const std::string& symbol, int trading_day,
                                        int64_t snapshot_ms) {
    OptionChainSnapshot chain;
    chain.symbol = symbol;
    chain.snapshot_time_ms = snapshot_ms;
    chain.effective_options_time_ms = snapshot_ms;
    chain.trading_day = trading_day;
    int expiry = trading_day + 30;
    chain.contracts = {
        make_contract(OptionType::Call, 145.0, 0.05, 100, expiry),
        make_contract(OptionType::Put, 140.0, 0.04, 120, expiry),
        make_contract(OptionType::Call, 150.0, 0.03, 80, expiry),
        make_contract(OptionType::Put, 135.0, 0.02, 60, expiry),
    };
    return chain;
}

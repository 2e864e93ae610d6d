#include "pg_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <thread>

namespace {

constexpr int kMaxWriteAttempts = 3;
constexpr std::chrono::milliseconds kRetryBackoff{250};

// $n as a timestamptz from epoch milliseconds, exact to the millisecond
std::string ts_param(int n) {
    return "(TIMESTAMPTZ 'epoch' + $" + std::to_string(n) + "::bigint * INTERVAL '1 millisecond')";
}

// $n as a date from days since epoch
std::string date_param(int n) {
    return "(DATE '1970-01-01' + $" + std::to_string(n) + "::int)";
}

std::optional<double> opt_double(const pqxx::field& f) {
    if (f.is_null()) return std::nullopt;
    return f.as<double>();
}

} // namespace

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {}

pqxx::connection PostgresStore::make_connection() {
    try {
        return pqxx::connection(dsn_);
    } catch (const pqxx::broken_connection& e) {
        spdlog::error("Postgres connection failed ({}): {}", util::redact_dsn(dsn_), e.what());
        throw SystemicError(std::string("postgres unreachable: ") + e.what());
    }
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS daily_snapshots (
                time TIMESTAMPTZ NOT NULL,
                ticker_id UUID NOT NULL,
                PRIMARY KEY (time, ticker_id)
            )
        )");

        std::string alter = "ALTER TABLE daily_snapshots";
        const auto& columns = snapshot_columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            alter += (i == 0 ? " " : ", ");
            alter += "ADD COLUMN IF NOT EXISTS " + columns[i].name + " " + columns[i].type;
        }
        txn.exec(alter);

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const SystemicError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

std::vector<std::string> PostgresStore::missing_columns() {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec(
        "SELECT column_name::text FROM information_schema.columns "
        "WHERE table_schema = current_schema() AND table_name = 'daily_snapshots'"
    );
    txn.commit();

    std::set<std::string> present;
    for (const auto& row : result) {
        present.insert(row[0].as<std::string>());
    }

    std::vector<std::string> missing;
    for (const auto& column : snapshot_columns()) {
        if (!present.count(column.name)) missing.push_back(column.name);
    }
    return missing;
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}

std::string PostgresStore::ticker_id(pqxx::work& txn, const std::string& symbol) {
    auto result = txn.exec_params(
        "SELECT id::text FROM tickers WHERE UPPER(symbol) = UPPER($1) ORDER BY id LIMIT 1",
        symbol
    );
    if (result.empty()) {
        throw std::runtime_error("unknown symbol: " + symbol);
    }
    return result[0][0].as<std::string>();
}

std::optional<int64_t> PostgresStore::latest_snapshot_time() {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec(
        "SELECT (EXTRACT(EPOCH FROM MAX(time)) * 1000)::bigint FROM options_chains"
    );
    txn.commit();
    if (result.empty() || result[0][0].is_null()) return std::nullopt;
    return result[0][0].as<int64_t>();
}

std::vector<std::string> PostgresStore::watchlist_symbols() {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto result = txn.exec(R"(
        SELECT DISTINCT UPPER(t.symbol)
        FROM watchlists w
        JOIN tickers t ON UPPER(t.symbol) = UPPER(w.symbol)
        WHERE w.active = TRUE
        ORDER BY 1
    )");
    txn.commit();

    std::vector<std::string> symbols;
    for (const auto& row : result) {
        symbols.push_back(row[0].as<std::string>());
    }
    return symbols;
}

OptionChainSnapshot PostgresStore::load_option_chain(const std::string& symbol,
                                                     int64_t snapshot_time_ms) {
    OptionChainSnapshot chain;
    chain.symbol = symbol;
    chain.snapshot_time_ms = snapshot_time_ms;
    chain.trading_day = util::day_from_ms(snapshot_time_ms);

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto id = ticker_id(txn, symbol);

    // Latest bar date on or before the snapshot date is the DTE reference
    auto trading = txn.exec_params(
        "SELECT (MAX(date) - DATE '1970-01-01') FROM ohlcv "
        "WHERE ticker_id = $1::uuid AND date <= " + date_param(2),
        id, chain.trading_day
    );
    if (!trading.empty() && !trading[0][0].is_null()) {
        chain.trading_day = trading[0][0].as<int>();
    }

    auto effective = txn.exec_params(
        "SELECT (EXTRACT(EPOCH FROM MAX(time)) * 1000)::bigint FROM options_chains "
        "WHERE ticker_id = $1::uuid AND time <= " + ts_param(2),
        id, snapshot_time_ms
    );
    if (effective.empty() || effective[0][0].is_null()) {
        txn.commit();
        spdlog::debug("{}: no option chain at or before {}", symbol,
                      util::format_iso8601(snapshot_time_ms));
        return chain;
    }
    chain.effective_options_time_ms = effective[0][0].as<int64_t>();

    auto rows = txn.exec_params(
        "SELECT (expiration_date - DATE '1970-01-01'), strike_price::float8, "
        "       UPPER(option_type::text), bid::float8, ask::float8, "
        "       COALESCE(volume, 0), COALESCE(open_interest, 0), "
        "       implied_volatility::float8, delta::float8, gamma::float8 "
        "FROM options_chains "
        "WHERE ticker_id = $1::uuid AND time = " + ts_param(2) + " "
        "  AND expiration_date IS NOT NULL AND strike_price IS NOT NULL "
        "ORDER BY expiration_date, strike_price, option_type",
        id, *chain.effective_options_time_ms
    );
    txn.commit();

    for (const auto& row : rows) {
        OptionContract c;
        c.expiry_day = row[0].as<int>();
        c.strike = row[1].as<double>();
        auto type = row[2].as<std::string>();
        c.type = (type == "C" || type == "CALL") ? OptionType::Call : OptionType::Put;
        c.bid = opt_double(row[3]);
        c.ask = opt_double(row[4]);
        c.volume = row[5].as<int64_t>();
        c.open_interest = row[6].as<int64_t>();
        c.implied_volatility = opt_double(row[7]);
        c.delta = opt_double(row[8]);
        c.gamma = opt_double(row[9]);
        chain.contracts.push_back(c);
    }
    return chain;
}

std::optional<PriceMetricSpot> PostgresStore::load_price_metric_spot(const std::string& symbol,
                                                                     int64_t snapshot_time_ms) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto id = ticker_id(txn, symbol);
    auto result = txn.exec_params(
        "SELECT price_metrics_json::text FROM daily_snapshots "
        "WHERE ticker_id = $1::uuid AND time = " + ts_param(2),
        id, snapshot_time_ms
    );
    txn.commit();
    if (result.empty() || result[0][0].is_null()) return std::nullopt;

    auto metrics = nlohmann::json::parse(result[0][0].as<std::string>());
    if (!metrics.is_object()) return std::nullopt;

    for (const char* key : {"close", "spot", "price", "last"}) {
        auto it = metrics.find(key);
        if (it == metrics.end() || !it->is_number()) continue;
        double value = it->get<double>();
        if (std::isfinite(value) && value > 0.0) {
            return PriceMetricSpot{value, key};
        }
    }
    return std::nullopt;
}

std::optional<double> PostgresStore::load_close(const std::string& symbol, int day) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto id = ticker_id(txn, symbol);
    auto result = txn.exec_params(
        "SELECT close::float8 FROM ohlcv WHERE ticker_id = $1::uuid AND date = " + date_param(2),
        id, day
    );
    txn.commit();
    if (result.empty() || result[0][0].is_null()) return std::nullopt;
    return result[0][0].as<double>();
}

std::vector<OHLCVBar> PostgresStore::load_bars(const std::string& symbol, int end_day,
                                               int max_bars) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto id = ticker_id(txn, symbol);
    auto result = txn.exec_params(
        "SELECT (date - DATE '1970-01-01'), open::float8, high::float8, low::float8, "
        "       close::float8, COALESCE(volume, 0)::float8 "
        "FROM ohlcv "
        "WHERE ticker_id = $1::uuid AND date <= " + date_param(2) + " "
        "  AND open IS NOT NULL AND high IS NOT NULL AND low IS NOT NULL AND close IS NOT NULL "
        "ORDER BY date DESC LIMIT $3",
        id, end_day, max_bars
    );
    txn.commit();

    std::vector<OHLCVBar> bars;
    bars.reserve(result.size());
    for (const auto& row : result) {
        OHLCVBar bar;
        bar.day = row[0].as<int>();
        bar.open = row[1].as<double>();
        bar.high = row[2].as<double>();
        bar.low = row[3].as<double>();
        bar.close = row[4].as<double>();
        bar.volume = row[5].as<double>();
        bars.push_back(bar);
    }
    std::reverse(bars.begin(), bars.end());
    return bars;
}

std::mutex& PostgresStore::local_lock(const std::string& symbol) {
    std::lock_guard<std::mutex> lk(locks_mx_);
    auto& slot = symbol_locks_[symbol];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

void PostgresStore::with_symbol_lock(const std::string& symbol,
                                     const std::function<void()>& fn) {
    std::lock_guard<std::mutex> local(local_lock(symbol));

    // Session-level advisory lock, released when the connection closes
    auto conn = make_connection();
    {
        pqxx::nontransaction tx(conn);
        tx.exec_params("SELECT pg_advisory_lock(hashtext($1))", "metrics:" + symbol);
    }
    fn();
}

std::optional<RegimeState> PostgresStore::load_prior_regime(const std::string& symbol,
                                                            int64_t before_ms) {
    auto conn = make_connection();
    pqxx::work txn(conn);
    auto id = ticker_id(txn, symbol);
    auto result = txn.exec_params(
        "SELECT wyckoff_state_json::text FROM daily_snapshots "
        "WHERE ticker_id = $1::uuid AND time < " + ts_param(2) + " "
        "  AND wyckoff_state_json IS NOT NULL "
        "ORDER BY time DESC LIMIT 1",
        id, before_ms
    );
    txn.commit();
    if (result.empty()) return std::nullopt;

    auto state = RegimeState::from_json(nlohmann::json::parse(result[0][0].as<std::string>()));
    if (state.symbol.empty()) state.symbol = symbol;
    return state;
}

void PostgresStore::write_snapshot(const SnapshotRecord& record) {
    auto row = record.to_json();

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto id = ticker_id(txn, record.symbol);

    std::optional<std::string> primary;
    if (!row["primary_event"].is_null()) primary = row["primary_event"].get<std::string>();
    std::optional<std::string> set_by;
    if (!row["wyckoff_regime_set_by_event"].is_null()) {
        set_by = row["wyckoff_regime_set_by_event"].get<std::string>();
    }

    txn.exec_params(
        "INSERT INTO daily_snapshots ("
        "  time, ticker_id, dealer_metrics_json, model_version, events_detected, "
        "  primary_event, events_json, bc_score, spring_score, wyckoff_regime, "
        "  wyckoff_regime_confidence, wyckoff_regime_set_by_event, wyckoff_state_json, "
        "  wyckoff_sequences_json) "
        "VALUES (" + ts_param(1) + ", $2::uuid, $3::jsonb, $4, "
        "  ARRAY(SELECT jsonb_array_elements_text($5::jsonb)), $6, $7::jsonb, $8, $9, $10, "
        "  $11, $12, $13::jsonb, $14::jsonb) "
        "ON CONFLICT (time, ticker_id) DO UPDATE SET "
        "  dealer_metrics_json = EXCLUDED.dealer_metrics_json, "
        "  model_version = EXCLUDED.model_version, "
        "  events_detected = EXCLUDED.events_detected, "
        "  primary_event = EXCLUDED.primary_event, "
        "  events_json = EXCLUDED.events_json, "
        "  bc_score = EXCLUDED.bc_score, "
        "  spring_score = EXCLUDED.spring_score, "
        "  wyckoff_regime = EXCLUDED.wyckoff_regime, "
        "  wyckoff_regime_confidence = EXCLUDED.wyckoff_regime_confidence, "
        "  wyckoff_regime_set_by_event = EXCLUDED.wyckoff_regime_set_by_event, "
        "  wyckoff_state_json = EXCLUDED.wyckoff_state_json, "
        "  wyckoff_sequences_json = EXCLUDED.wyckoff_sequences_json",
        record.time_ms, id, row["dealer_metrics_json"].dump(), record.model_version,
        row["events_detected"].dump(), primary, row["events_json"].dump(),
        record.bc_score, record.spring_score, row["wyckoff_regime"].get<std::string>(),
        record.regime.regime_confidence, set_by, row["wyckoff_state_json"].dump(),
        row["wyckoff_sequences_json"].dump()
    );
    txn.commit();
}

void PostgresStore::upsert_snapshot(const SnapshotRecord& record) {
    for (int attempt = 1;; ++attempt) {
        try {
            write_snapshot(record);
            spdlog::debug("{}: snapshot upserted at {}", record.symbol,
                          util::format_iso8601(record.time_ms));
            return;
        } catch (const SystemicError&) {
            throw;
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("Postgres connection lost writing {}: {}", record.symbol, e.what());
            throw SystemicError(std::string("postgres connection lost: ") + e.what());
        } catch (const std::exception& e) {
            if (attempt >= kMaxWriteAttempts) {
                spdlog::error("Failed to upsert snapshot for {} after {} attempts: {}",
                              record.symbol, attempt, e.what());
                throw TransientPersistenceError("snapshot upsert failed for " + record.symbol +
                                                ": " + e.what());
            }
            spdlog::warn("Upsert for {} failed (attempt {}/{}): {}", record.symbol, attempt,
                         kMaxWriteAttempts, e.what());
            std::this_thread::sleep_for(kRetryBackoff * attempt);
        }
    }
}

#include <catch2/catch_test_macros.hpp>
#include "../src/execution.hpp"
#include "../src/spot_resolver.hpp"
#include "../src/util.hpp"
#include "fakes.hpp"
#include <chrono>

namespace {

// 21:00 UTC on the last fixture bar
const int kTradingDay = kFixtureFirstDay + 43;
const int64_t kSnapshotMs = static_cast<int64_t>(kTradingDay) * 86400000 + 75600000;

void add_symbol(FakeMarketData& data, const std::string& symbol) {
    data.chains[symbol] = sample_chain(symbol, kTradingDay, kSnapshotMs);
    data.bars[symbol] = accumulation_bars();
    data.price_metrics[symbol] = PriceMetricSpot{144.0, "close"};
}

ExecutionContext make_context(const std::vector<std::string>& scope) {
    ExecutionContext ctx;
    ctx.mode = scope.size() == 1 ? ExecutionMode::Event : ExecutionMode::Batch;
    ctx.scope = scope;
    ctx.snapshot_time_ms = kSnapshotMs;
    ctx.trace_id = "test-run";
    ctx.model_version = "wyckoff-gex-v1";
    ctx.dealer.filters.min_open_interest = 1;
    ctx.dealer.filters.min_volume = 0;
    ctx.workers = 2;
    ctx.symbol_timeout_ms = 5000;
    return ctx;
}

} // namespace

TEST_CASE("Context validation happens before any I/O", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "AAPL");
    Executor executor(data, store);

    SECTION("Missing snapshot time") {
        auto ctx = make_context({"AAPL"});
        ctx.snapshot_time_ms.reset();
        REQUIRE_THROWS_AS(executor.execute(ctx), ValidationError);
    }

    SECTION("Empty scope") {
        auto ctx = make_context({});
        REQUIRE_THROWS_AS(executor.execute(ctx), ValidationError);
    }

    SECTION("Duplicate symbols") {
        auto ctx = make_context({"AAPL", "AAPL"});
        REQUIRE_THROWS_AS(executor.execute(ctx), ValidationError);
    }

    SECTION("Event context with several symbols") {
        auto ctx = make_context({"AAPL", "MSFT"});
        ctx.mode = ExecutionMode::Event;
        REQUIRE_THROWS_AS(executor.execute(ctx), ValidationError);
    }

    SECTION("Invalid filter") {
        auto ctx = make_context({"AAPL"});
        ctx.dealer.filters.walls_top_n = 0;
        REQUIRE_THROWS_AS(executor.execute(ctx), ValidationError);
    }

    REQUIRE(data.calls.load() == 0);
    REQUIRE(store.writes() == 0);
}

TEST_CASE("Single symbol run", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "AAPL");
    Executor executor(data, store);

    auto result = executor.execute(make_context({"AAPL"}));
    REQUIRE(result.succeeded == 1);
    REQUIRE(result.failed == 0);
    REQUIRE(store.writes() == 1);

    auto row = store.row("AAPL", kSnapshotMs);
    REQUIRE(row.has_value());
    REQUIRE((*row)["dealer_metrics_json"]["status"] == "LIMITED");
    REQUIRE((*row)["events_detected"] == nlohmann::json::array({"SC", "AR", "SPRING"}));
    REQUIRE((*row)["primary_event"] == "SC");
    REQUIRE((*row)["spring_score"] == 8);
    REQUIRE((*row)["wyckoff_regime"] == "ACCUMULATION");
    REQUIRE((*row)["dealer_metrics_json"]["spot_price_source"] == "price_metrics.close");
}

TEST_CASE("Dry run computes without writing", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "AAPL");
    Executor executor(data, store);

    auto ctx = make_context({"AAPL"});
    ctx.dry_run = true;
    auto dry = executor.execute(ctx);
    REQUIRE(dry.dry_run);
    REQUIRE(store.writes() == 0);
    REQUIRE(dry.outcomes.size() == 1);
    REQUIRE(dry.outcomes[0].ok);
    REQUIRE_FALSE(dry.outcomes[0].persisted);
    REQUIRE(dry.outcomes[0].record.has_value());

    ctx.dry_run = false;
    auto wet = executor.execute(ctx);
    REQUIRE(store.writes() == 1);
    REQUIRE(wet.outcomes[0].persisted);
    REQUIRE(wet.outcomes[0].record->to_json() == dry.outcomes[0].record->to_json());
}

TEST_CASE("Reruns are idempotent and leave sibling columns alone", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "AAPL");
    store.seed("AAPL", kSnapshotMs, {
        {"price_metrics_json", {{"close", 144.0}}},
        {"volatility_metrics_json", {{"iv_rank", 0.42}}}
    });
    Executor executor(data, store);

    executor.execute(make_context({"AAPL"}));
    auto first = store.row("AAPL", kSnapshotMs);
    executor.execute(make_context({"AAPL"}));
    auto second = store.row("AAPL", kSnapshotMs);

    REQUIRE(store.writes() == 2);
    REQUIRE(first->dump() == second->dump());
    REQUIRE((*second)["volatility_metrics_json"]["iv_rank"] == 0.42);
    REQUIRE((*second)["price_metrics_json"]["close"] == 144.0);
}

TEST_CASE("Regime state carries across snapshots", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "AAPL");
    Executor executor(data, store);
    executor.execute(make_context({"AAPL"}));

    // Next day, one more quiet bar: nothing new is detected
    data.bars["AAPL"].push_back({kTradingDay + 1, 75.8, 76.2, 75.6, 76.0, 700.0});
    auto ctx = make_context({"AAPL"});
    ctx.snapshot_time_ms = kSnapshotMs + 86400000;
    auto result = executor.execute(ctx);

    REQUIRE(result.succeeded == 1);
    const auto& record = *result.outcomes[0].record;
    REQUIRE(record.events.empty());
    REQUIRE(record.regime.current_regime == Regime::Accumulation);
    REQUIRE(record.regime.event_history.size() == 3);
    REQUIRE(record.regime.last_bar_date == kTradingDay + 1);
}

TEST_CASE("Per-symbol failures are isolated", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    for (const char* s : {"AAPL", "MSFT", "NVDA"}) add_symbol(data, s);
    data.failing.insert("MSFT");
    Executor executor(data, store);

    auto result = executor.execute(make_context({"AAPL", "MSFT", "NVDA"}));
    REQUIRE(result.succeeded == 2);
    REQUIRE(result.failed == 1);
    REQUIRE(result.timed_out == 0);
    REQUIRE(store.row("AAPL", kSnapshotMs).has_value());
    REQUIRE_FALSE(store.row("MSFT", kSnapshotMs).has_value());
    REQUIRE(store.row("NVDA", kSnapshotMs).has_value());

    auto summary = result.to_json();
    REQUIRE(summary["failures"].size() == 1);
    REQUIRE(summary["failures"][0]["symbol"] == "MSFT");
    REQUIRE(summary["processed"].size() == 2);
}

TEST_CASE("A stuck symbol times out and never persists", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "SLOW");
    add_symbol(data, "FAST");
    data.delay_ms["SLOW"] = 400;
    Executor executor(data, store);

    auto ctx = make_context({"SLOW", "FAST"});
    ctx.symbol_timeout_ms = 50;
    auto result = executor.execute(ctx);

    REQUIRE(result.timed_out == 1);
    REQUIRE(result.failed == 1);
    REQUIRE(result.succeeded == 1);
    REQUIRE(result.outcomes[0].symbol == "SLOW");
    REQUIRE(result.outcomes[0].timed_out);
    REQUIRE_FALSE(store.row("SLOW", kSnapshotMs).has_value());
    REQUIRE(store.row("FAST", kSnapshotMs).has_value());
}

TEST_CASE("A hung symbol does not hold up the run", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "SLOW");
    add_symbol(data, "FAST");
    data.delay_ms["SLOW"] = 2000;
    Executor executor(data, store);

    auto ctx = make_context({"SLOW", "FAST"});
    ctx.symbol_timeout_ms = 50;

    SECTION("One worker moves on to the queued symbol") {
        ctx.workers = 1;
    }
    SECTION("Several workers") {
        ctx.workers = 4;
    }

    auto started = std::chrono::steady_clock::now();
    auto result = executor.execute(ctx);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    REQUIRE(elapsed < 1000);
    REQUIRE(result.timed_out == 1);
    REQUIRE(result.succeeded == 1);
    REQUIRE(result.outcomes[0].symbol == "SLOW");
    REQUIRE(result.outcomes[1].symbol == "FAST");
    REQUIRE(result.outcomes[1].persisted);
    REQUIRE(store.row("FAST", kSnapshotMs).has_value());

    SECTION("The next run is not starved by the abandoned thread") {
        auto again = executor.execute(make_context({"FAST"}));
        REQUIRE(again.succeeded == 1);
    }
}

TEST_CASE("Systemic failures abort the run", "[execution]") {
    FakeMarketData data;
    FakeStore store;
    add_symbol(data, "AAPL");
    Executor executor(data, store);

    SECTION("Store unreachable before any symbol") {
        store.reachable = false;
        REQUIRE_THROWS_AS(executor.execute(make_context({"AAPL"})), SystemicError);
        REQUIRE(store.writes() == 0);
    }

    SECTION("Connection lost while writing") {
        store.systemic_on.insert("AAPL");
        REQUIRE_THROWS_AS(executor.execute(make_context({"AAPL"})), SystemicError);
    }
}

TEST_CASE("Trigger handling", "[execution]") {
    Config config = Config::from_env();
    config.batch_workers = 3;
    config.dry_run = false;
    config.snapshot_time_ms = kSnapshotMs;
    config.spot_override.reset();

    SECTION("Event triggers run one symbol on one worker") {
        EventTrigger trigger;
        trigger.symbol = " aapl ";
        trigger.dry_run = true;
        trigger.message_id = "1700000000000-0";
        auto ctx = build_context(trigger, config);
        REQUIRE(ctx.mode == ExecutionMode::Event);
        REQUIRE(ctx.scope == std::vector<std::string>{"AAPL"});
        REQUIRE(ctx.workers == 1);
        REQUIRE(ctx.dry_run);
        REQUIRE(ctx.trace_id == "event-1700000000000-0");
        REQUIRE(ctx.snapshot_time_ms == kSnapshotMs);
    }

    SECTION("Batch triggers use the configured pool") {
        BatchTrigger trigger;
        trigger.symbols = {"AAPL", "MSFT"};
        auto ctx = build_context(trigger, config);
        REQUIRE(ctx.mode == ExecutionMode::Batch);
        REQUIRE(ctx.workers == 3);
        REQUIRE(ctx.trace_id == build_context(trigger, config).trace_id);
    }

    SECTION("Trigger payloads") {
        auto trigger = parse_event_trigger("1-0", {
            {"symbol", "SPY"},
            {"snapshot_time", "2024-11-16"},
            {"dry_run", true},
            {"spot_override", 450.5}
        });
        REQUIRE(trigger.symbol == "SPY");
        REQUIRE(trigger.snapshot_time_ms == util::parse_iso8601("2024-11-16"));
        REQUIRE(trigger.dry_run);
        REQUIRE(trigger.spot_override == 450.5);

        REQUIRE_THROWS_AS(parse_event_trigger("2-0", nlohmann::json::array()), ValidationError);
        REQUIRE_THROWS_AS(parse_event_trigger("3-0", {{"symbol", 42}}), ValidationError);
        REQUIRE_THROWS_AS(parse_event_trigger("4-0", {{"symbol", "SPY"},
                                                      {"snapshot_time", "yesterday"}}),
                          ValidationError);
    }
}

TEST_CASE("Spot resolution order", "[execution][spot]") {
    FakeMarketData data;
    data.price_metrics["AAPL"] = PriceMetricSpot{144.0, "close"};
    data.closes[{"AAPL", kTradingDay}] = 143.5;

    SECTION("Override wins") {
        auto spot = resolve_spot(data, "AAPL", kSnapshotMs, kTradingDay, 150.0);
        REQUIRE(spot.spot == 150.0);
        REQUIRE(spot.strategy == std::string("override"));
        REQUIRE(spot.attempted_sources == std::vector<std::string>{"override"});
    }

    SECTION("Price metrics before OHLCV") {
        auto spot = resolve_spot(data, "AAPL", kSnapshotMs, kTradingDay, std::nullopt);
        REQUIRE(spot.spot == 144.0);
        REQUIRE(spot.source == std::string("price_metrics.close"));
    }

    SECTION("OHLCV close as the fallback") {
        data.price_metrics.clear();
        auto spot = resolve_spot(data, "AAPL", kSnapshotMs, kTradingDay, std::nullopt);
        REQUIRE(spot.spot == 143.5);
        REQUIRE(spot.strategy == std::string("ohlcv_fallback"));
        REQUIRE(spot.attempted_sources ==
                std::vector<std::string>{"price_metrics", "ohlcv"});
    }

    SECTION("Nothing available") {
        data.price_metrics.clear();
        data.closes.clear();
        auto spot = resolve_spot(data, "AAPL", kSnapshotMs, kTradingDay, std::nullopt);
        REQUIRE_FALSE(spot.spot.has_value());
        REQUIRE_FALSE(spot.source.has_value());
    }
}

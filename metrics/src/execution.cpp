#include "execution.hpp"
#include "errors.hpp"
#include "sequences.hpp"
#include "spot_resolver.hpp"
#include "util.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>

std::string to_string(ExecutionMode mode) {
    return mode == ExecutionMode::Event ? "event" : "batch";
}

nlohmann::json ExecutionContext::parameters_json() const {
    return {
        {"filters", dealer.filters.to_json()},
        {"gex", dealer.gex.to_json()},
        {"wyckoff", wyckoff.to_json()},
        {"model_version", model_version},
        {"spot_override", nullable(spot_override)},
        {"workers", workers},
        {"symbol_timeout_ms", symbol_timeout_ms},
        {"bars_lookback", bars_lookback}
    };
}

namespace {

std::vector<std::string> normalize_symbols(const std::vector<std::string>& symbols) {
    std::vector<std::string> out;
    for (const auto& s : symbols) {
        out.push_back(util::to_upper(util::trim(s)));
    }
    return out;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

} // namespace

ExecutionContext build_context(const Trigger& trigger, const Config& config) {
    ExecutionContext ctx;
    ctx.dealer.filters = config.filters;
    ctx.dealer.gex = config.gex;
    ctx.wyckoff = config.wyckoff;
    ctx.model_version = config.model_version;
    ctx.symbol_timeout_ms = config.symbol_timeout_ms;
    ctx.heartbeat_every = config.heartbeat_every;
    ctx.bars_lookback = config.bars_lookback;
    ctx.dry_run = config.dry_run;
    ctx.spot_override = config.spot_override;
    ctx.snapshot_time_ms = config.snapshot_time_ms;

    if (const auto* ev = std::get_if<EventTrigger>(&trigger)) {
        ctx.mode = ExecutionMode::Event;
        ctx.scope = normalize_symbols({ev->symbol});
        if (ev->snapshot_time_ms) ctx.snapshot_time_ms = ev->snapshot_time_ms;
        if (ev->spot_override) ctx.spot_override = ev->spot_override;
        ctx.dry_run = ctx.dry_run || ev->dry_run;
        ctx.workers = 1;
        ctx.trace_id = ev->message_id.empty()
            ? util::make_trace_id("event", ctx.scope, ctx.snapshot_time_ms.value_or(0))
            : "event-" + ev->message_id;
    } else {
        const auto& batch = std::get<BatchTrigger>(trigger);
        ctx.mode = ExecutionMode::Batch;
        ctx.scope = normalize_symbols(batch.symbols);
        if (batch.snapshot_time_ms) ctx.snapshot_time_ms = batch.snapshot_time_ms;
        ctx.workers = config.batch_workers;
        ctx.trace_id = util::make_trace_id("batch", ctx.scope, ctx.snapshot_time_ms.value_or(0));
    }
    return ctx;
}

void validate_context(const ExecutionContext& ctx) {
    if (!ctx.snapshot_time_ms) {
        throw ValidationError("snapshot_time is required");
    }
    if (ctx.scope.empty()) {
        throw ValidationError("scope is empty");
    }
    if (ctx.mode == ExecutionMode::Event && ctx.scope.size() != 1) {
        throw ValidationError(fmt::format("event context must have exactly one symbol, got {}",
                                          ctx.scope.size()));
    }

    std::set<std::string> seen;
    for (const auto& symbol : ctx.scope) {
        if (symbol.empty()) {
            throw ValidationError("scope contains a blank symbol");
        }
        if (!seen.insert(symbol).second) {
            throw ValidationError("duplicate symbol in scope: " + symbol);
        }
    }

    if (ctx.trace_id.empty()) {
        throw ValidationError("trace_id is required");
    }
    if (ctx.model_version.empty()) {
        throw ValidationError("model_version is required");
    }

    const auto& f = ctx.dealer.filters;
    if (f.max_dte_days < 0) throw ValidationError("max_dte_days must be >= 0");
    if (f.min_open_interest < 0) throw ValidationError("min_open_interest must be >= 0");
    if (f.min_volume < 0) throw ValidationError("min_volume must be >= 0");
    if (f.walls_top_n < 1) throw ValidationError("walls_top_n must be >= 1");
    if (!(f.gex_slope_range_pct > 0.0 && f.gex_slope_range_pct < 1.0)) {
        throw ValidationError("gex_slope_range_pct must be in (0, 1)");
    }
    if (!(f.max_spread_pct > 0.0)) throw ValidationError("max_spread_pct must be > 0");
    if (!(f.max_moneyness > 0.0)) throw ValidationError("max_moneyness must be > 0");

    if (ctx.spot_override && !(*ctx.spot_override > 0.0)) {
        throw ValidationError("spot_override must be positive");
    }
    if (ctx.wyckoff.lookback_bars < 1 || ctx.wyckoff.trend_bars < 1 ||
        ctx.wyckoff.momentum_bars < 1) {
        throw ValidationError("Wyckoff window lengths must be >= 1");
    }
    if (ctx.workers < 1) throw ValidationError("workers must be >= 1");
    if (ctx.symbol_timeout_ms <= 0) throw ValidationError("symbol_timeout_ms must be > 0");
    if (ctx.bars_lookback < 1) throw ValidationError("bars_lookback must be >= 1");
}

EventTrigger parse_event_trigger(const std::string& message_id, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ValidationError("trigger payload must be a JSON object");
    }
    if (!data.contains("symbol") || !data["symbol"].is_string()) {
        throw ValidationError("trigger payload requires a string 'symbol'");
    }

    EventTrigger trigger;
    trigger.message_id = message_id;
    trigger.symbol = data["symbol"].get<std::string>();

    if (data.contains("snapshot_time") && !data["snapshot_time"].is_null()) {
        if (!data["snapshot_time"].is_string()) {
            throw ValidationError("'snapshot_time' must be an ISO-8601 string");
        }
        auto text = data["snapshot_time"].get<std::string>();
        trigger.snapshot_time_ms = util::parse_iso8601(text);
        if (!trigger.snapshot_time_ms) {
            throw ValidationError("invalid snapshot_time: " + text);
        }
    }
    if (data.contains("dry_run")) {
        if (!data["dry_run"].is_boolean()) {
            throw ValidationError("'dry_run' must be a boolean");
        }
        trigger.dry_run = data["dry_run"].get<bool>();
    }
    if (data.contains("spot_override") && !data["spot_override"].is_null()) {
        if (!data["spot_override"].is_number()) {
            throw ValidationError("'spot_override' must be a number");
        }
        trigger.spot_override = data["spot_override"].get<double>();
    }
    return trigger;
}

nlohmann::json ExecutionResult::to_json() const {
    nlohmann::json failures = nlohmann::json::array();
    nlohmann::json processed = nlohmann::json::array();
    for (const auto& o : outcomes) {
        if (!o.ok) {
            failures.push_back({
                {"symbol", o.symbol},
                {"error", o.error},
                {"timed_out", o.timed_out}
            });
            continue;
        }
        nlohmann::json entry = {
            {"symbol", o.symbol},
            {"persisted", o.persisted}
        };
        if (o.record) {
            entry["dealer_status"] = o.record->dealer_metrics.value("status", "INVALID");
            entry["events"] = o.record->events_detected();
            entry["regime"] = to_string(o.record->regime.current_regime);
        }
        processed.push_back(entry);
    }

    return {
        {"trace_id", trace_id},
        {"mode", to_string(mode)},
        {"dry_run", dry_run},
        {"succeeded", succeeded},
        {"failed", failed},
        {"timed_out", timed_out},
        {"duration_ms", duration_ms},
        {"processed", processed},
        {"failures", failures}
    };
}

Executor::Executor(MarketDataSource& source, SnapshotStore& store)
    : source_(source), store_(store) {}

SymbolOutcome Executor::process_symbol(const ExecutionContext& ctx, const std::string& symbol,
                                       const std::atomic<bool>& cancelled) {
    const int64_t snapshot_ms = *ctx.snapshot_time_ms;

    SymbolOutcome outcome;
    outcome.symbol = symbol;

    auto chain = source_.load_option_chain(symbol, snapshot_ms);
    chain.symbol = symbol;
    chain.snapshot_time_ms = snapshot_ms;
    auto spot = resolve_spot(source_, symbol, snapshot_ms, chain.trading_day, ctx.spot_override);
    auto dealer = compute_dealer_metrics(chain, spot, ctx.dealer);

    auto bars = source_.load_bars(symbol, util::day_from_ms(snapshot_ms), ctx.bars_lookback);
    WyckoffDetector detector(ctx.wyckoff);

    store_.with_symbol_lock(symbol, [&]() {
        auto prior = store_.load_prior_regime(symbol, snapshot_ms)
                         .value_or(RegimeState::initial(symbol));
        auto detection = detector.detect(bars, prior);

        SnapshotRecord record;
        record.symbol = symbol;
        record.time_ms = snapshot_ms;
        record.model_version = ctx.model_version;
        record.dealer_metrics = dealer.to_json();
        record.events = detection.events;
        record.regime = detection.new_state;
        record.transitions = detection.transitions;
        record.bc_score = detection.bc_score;
        record.spring_score = detection.spring_score;
        if (detection.new_state.last_bar_date) {
            record.sequences = find_sequences(detection.new_state.event_history,
                                              prior.last_bar_date,
                                              *detection.new_state.last_bar_date,
                                              ctx.wyckoff.sequence_max_days);
        }

        spdlog::debug("{}: dealer={} ({}) events={} regime={}", symbol, to_string(dealer.status),
                      dealer.status_reason, join(record.events_detected()),
                      to_string(record.regime.current_regime));

        outcome.record = record;
        if (ctx.dry_run) return;
        if (cancelled) {
            spdlog::warn("{}: cancelled after timeout, not persisting", symbol);
            return;
        }
        store_.upsert_snapshot(record);
        outcome.persisted = true;
    });

    outcome.ok = true;
    return outcome;
}

namespace {

constexpr int kTaskRunning = 0;
constexpr int kTaskDone = 1;
constexpr int kTaskAbandoned = 2;

struct SymbolTask {
    std::string symbol;
    std::atomic<int> state{kTaskRunning};
    std::atomic<bool> cancelled{false};
    std::promise<SymbolOutcome> promise;
    std::future<SymbolOutcome> future;
    int64_t started_ms = 0;  // when it was handed to a worker
};

// Shared with the workers; outlives execute() when a task is abandoned
struct RunState {
    ExecutionContext ctx;
    std::atomic<bool> aborted{false};
    std::mutex mx;
    std::string systemic_error;
};

constexpr std::chrono::milliseconds kPollInterval{20};

} // namespace

WorkerPool& Executor::reserve_workers(unsigned workers) {
    std::lock_guard<std::mutex> lk(pool_mx_);
    unsigned needed = workers + static_cast<unsigned>(std::max(0, abandoned_.load()));
    if (!pool_) {
        pool_ = std::make_unique<WorkerPool>(needed);
    } else {
        pool_->grow_to(needed);
    }
    return *pool_;
}

ExecutionResult Executor::execute(const ExecutionContext& ctx) {
    validate_context(ctx);

    auto started = std::chrono::steady_clock::now();
    spdlog::info("RUN START trace_id={} mode={} scope=[{}] snapshot_time={} dry_run={} params={}",
                 ctx.trace_id, to_string(ctx.mode), join(ctx.scope),
                 util::format_iso8601(*ctx.snapshot_time_ms), ctx.dry_run,
                 ctx.parameters_json().dump());
    if (ctx.dry_run) {
        spdlog::info("DRY RUN trace_id={}: persistence suppressed", ctx.trace_id);
    }

    ExecutionResult result;
    result.trace_id = ctx.trace_id;
    result.mode = ctx.mode;
    result.dry_run = ctx.dry_run;

    if (!store_.ping()) {
        spdlog::error("RUN ABORTED trace_id={}: snapshot store unreachable", ctx.trace_id);
        throw SystemicError("snapshot store unreachable");
    }

    auto run = std::make_shared<RunState>();
    run->ctx = ctx;

    const size_t total = ctx.scope.size();
    const size_t workers = std::min<size_t>(static_cast<size_t>(ctx.workers), total);

    std::vector<std::shared_ptr<SymbolTask>> tasks;
    for (const auto& symbol : ctx.scope) {
        auto task = std::make_shared<SymbolTask>();
        task->symbol = symbol;
        task->future = task->promise.get_future();
        tasks.push_back(task);
    }

    std::vector<std::optional<SymbolOutcome>> outcomes(total);
    std::vector<size_t> running;
    size_t next = 0;
    size_t resolved = 0;

    // At most `workers` live tasks; abandoned ones do not count against it
    auto dispatch = [&]() {
        if (run->aborted || running.size() >= workers || next >= total) return;
        auto& pool = reserve_workers(static_cast<unsigned>(workers));
        while (!run->aborted && running.size() < workers && next < total) {
            auto task = tasks[next];
            task->started_ms = steady_now_ms();
            pool.post([this, run, task]() {
                SymbolOutcome outcome;
                outcome.symbol = task->symbol;
                try {
                    outcome = process_symbol(run->ctx, task->symbol, task->cancelled);
                } catch (const SystemicError& e) {
                    run->aborted = true;
                    std::lock_guard<std::mutex> lk(run->mx);
                    if (run->systemic_error.empty()) run->systemic_error = e.what();
                    outcome.error = e.what();
                } catch (const std::exception& e) {
                    outcome.error = e.what();
                }
                if (task->state.exchange(kTaskDone) == kTaskAbandoned) {
                    abandoned_--;
                    spdlog::info("{}: abandoned task finished", task->symbol);
                }
                task->promise.set_value(std::move(outcome));
            });
            running.push_back(next++);
        }
    };

    auto settle = [&](size_t i, SymbolOutcome outcome) {
        if (outcome.ok) {
            result.succeeded++;
        } else {
            result.failed++;
            if (outcome.timed_out) result.timed_out++;
            spdlog::warn("Symbol {} failed trace_id={}: {}", outcome.symbol, ctx.trace_id,
                         outcome.error);
        }
        outcomes[i] = std::move(outcome);

        size_t done = ++resolved;
        if (ctx.heartbeat_every > 0 && done % static_cast<size_t>(ctx.heartbeat_every) == 0 &&
            done < total) {
            spdlog::info("HEARTBEAT trace_id={} processed={}/{}", ctx.trace_id, done, total);
        }
    };

    dispatch();
    while (resolved < total) {
        if (running.empty()) {
            // Aborted: nothing left in flight and nothing more is started
            for (; next < total; ++next) {
                SymbolOutcome skipped;
                skipped.symbol = tasks[next]->symbol;
                skipped.error = "run aborted";
                settle(next, std::move(skipped));
            }
            break;
        }

        tasks[running.front()]->future.wait_for(kPollInterval);

        for (auto it = running.begin(); it != running.end();) {
            auto& task = *tasks[*it];
            if (task.future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                settle(*it, task.future.get());
                it = running.erase(it);
                continue;
            }
            if (steady_now_ms() - task.started_ms > ctx.symbol_timeout_ms) {
                abandoned_++;
                int expected = kTaskRunning;
                if (!task.state.compare_exchange_strong(expected, kTaskAbandoned)) {
                    // Finished in the meantime; its result is picked up next pass
                    abandoned_--;
                    ++it;
                    continue;
                }
                task.cancelled = true;
                SymbolOutcome outcome;
                outcome.symbol = task.symbol;
                outcome.timed_out = true;
                outcome.error = fmt::format("timed out after {}ms", ctx.symbol_timeout_ms);
                settle(*it, std::move(outcome));
                it = running.erase(it);
                continue;
            }
            ++it;
        }
        dispatch();
    }

    for (auto& outcome : outcomes) {
        result.outcomes.push_back(std::move(*outcome));
    }
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (run->aborted) {
        std::string error;
        {
            std::lock_guard<std::mutex> lk(run->mx);
            error = run->systemic_error.empty() ? "run aborted" : run->systemic_error;
        }
        spdlog::error("RUN ABORTED trace_id={} duration_ms={} success={} failed={}: {}",
                      ctx.trace_id, result.duration_ms, result.succeeded, result.failed, error);
        throw SystemicError(error);
    }

    spdlog::info("RUN END trace_id={} mode={} duration_ms={} success={} failed={} timed_out={} "
                 "dry_run={}", ctx.trace_id, to_string(ctx.mode), result.duration_ms,
                 result.succeeded, result.failed, result.timed_out, ctx.dry_run);
    return result;
}

#pragma once

#include "config.hpp"
#include "dealer_metrics.hpp"
#include "snapshot.hpp"
#include "store.hpp"
#include "worker_pool.hpp"
#include "wyckoff.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

enum class ExecutionMode {
    Event,
    Batch
};

std::string to_string(ExecutionMode mode);

// One symbol, typically from a message on the trigger stream
struct EventTrigger {
    std::string symbol;
    std::optional<int64_t> snapshot_time_ms;
    std::optional<double> spot_override;
    bool dry_run = false;
    std::string message_id;
};

// A symbol set, from the command line or the active watchlist
struct BatchTrigger {
    std::vector<std::string> symbols;
    std::optional<int64_t> snapshot_time_ms;
};

using Trigger = std::variant<EventTrigger, BatchTrigger>;

struct ExecutionContext {
    ExecutionMode mode = ExecutionMode::Batch;
    std::vector<std::string> scope;
    std::optional<int64_t> snapshot_time_ms;
    bool dry_run = false;
    std::string trace_id;

    DealerConfig dealer;
    WyckoffConfig wyckoff;
    std::optional<double> spot_override;
    std::string model_version;

    int workers = 1;
    int symbol_timeout_ms = 60000;
    int heartbeat_every = 25;
    int bars_lookback = 400;

    // Effective parameters as logged on the start line
    nlohmann::json parameters_json() const;
};

// Both trigger kinds resolve to the same context; the config supplies defaults
ExecutionContext build_context(const Trigger& trigger, const Config& config);

// Throws ValidationError describing the first problem found
void validate_context(const ExecutionContext& ctx);

// Parses a trigger stream message; throws ValidationError on a malformed payload
EventTrigger parse_event_trigger(const std::string& message_id, const nlohmann::json& data);

struct SymbolOutcome {
    std::string symbol;
    bool ok = false;
    bool timed_out = false;
    bool persisted = false;
    std::string error;
    std::optional<SnapshotRecord> record;
};

struct ExecutionResult {
    std::string trace_id;
    ExecutionMode mode = ExecutionMode::Batch;
    bool dry_run = false;
    int succeeded = 0;
    int failed = 0;
    int timed_out = 0;
    int64_t duration_ms = 0;
    std::vector<SymbolOutcome> outcomes;

    // Summary without the per-symbol records
    nlohmann::json to_json() const;
};

// Owns the worker threads. A symbol abandoned after its timeout keeps its
// thread until it returns; the destructor waits for such stragglers.
class Executor {
public:
    Executor(MarketDataSource& source, SnapshotStore& store);

    // The single entry point for event and batch runs. Throws ValidationError
    // before any I/O for an invalid context and SystemicError when the store
    // is unreachable; per-symbol failures are reported in the result.
    // Returns once every symbol has finished or timed out.
    ExecutionResult execute(const ExecutionContext& ctx);

private:
    MarketDataSource& source_;
    SnapshotStore& store_;

    std::atomic<int> abandoned_{0};  // timed-out tasks still holding a thread
    std::mutex pool_mx_;
    std::unique_ptr<WorkerPool> pool_;  // last: joined before the rest goes

    // Enough threads for `workers` live tasks beside the abandoned ones
    WorkerPool& reserve_workers(unsigned workers);

    SymbolOutcome process_symbol(const ExecutionContext& ctx, const std::string& symbol,
                                 const std::atomic<bool>& cancelled);
};

#pragma once

#include "models.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Per-symbol Wyckoff state carried between invocations. The current regime
// span is event_history[span_start..].
struct RegimeState {
    std::string symbol;
    Regime current_regime = Regime::Unknown;
    std::vector<WyckoffEvent> event_history;
    size_t span_start = 0;
    std::optional<int> last_event_date;
    std::optional<int> last_bar_date;  // last bar consumed by the detector
    std::optional<double> regime_confidence;
    std::optional<WyckoffEventType> regime_set_by_event;

    static RegimeState initial(const std::string& symbol);

    bool span_contains(WyckoffEventType type) const;
    const WyckoffEvent* span_last(WyckoffEventType type) const;

    nlohmann::json to_json() const;
    static RegimeState from_json(const nlohmann::json& j);
};

struct RegimeTransition {
    int day = 0;
    Regime from = Regime::Unknown;
    Regime to = Regime::Unknown;
    WyckoffEventType set_by_event = WyckoffEventType::SC;

    nlohmann::json to_json() const;
};

class RegimeTracker {
public:
    // The regime an event moves the state into, or nullopt if it stays
    static std::optional<Regime> next_regime(Regime current, WyckoffEventType event);

    // Appends to the history and applies any transition; a transition starts a new span
    static std::optional<RegimeTransition> record(RegimeState& state, const WyckoffEvent& event);

    // Keeps the current span plus at most max_older earlier events
    static void trim_history(RegimeState& state, size_t max_older);
};

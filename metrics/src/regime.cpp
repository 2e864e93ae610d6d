#include "regime.hpp"
#include "util.hpp"
#include <stdexcept>

RegimeState RegimeState::initial(const std::string& symbol) {
    RegimeState state;
    state.symbol = symbol;
    return state;
}

bool RegimeState::span_contains(WyckoffEventType type) const {
    return span_last(type) != nullptr;
}

const WyckoffEvent* RegimeState::span_last(WyckoffEventType type) const {
    for (size_t i = event_history.size(); i > span_start; --i) {
        if (event_history[i - 1].type == type) {
            return &event_history[i - 1];
        }
    }
    return nullptr;
}

nlohmann::json RegimeState::to_json() const {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& e : event_history) {
        history.push_back(e.to_json());
    }

    nlohmann::json set_by = regime_set_by_event
        ? nlohmann::json(to_string(*regime_set_by_event)) : nlohmann::json(nullptr);

    return {
        {"symbol", symbol},
        {"current_regime", to_string(current_regime)},
        {"event_history", history},
        {"span_start", span_start},
        {"last_event_date", nullable_date(last_event_date)},
        {"last_bar_date", nullable_date(last_bar_date)},
        {"regime_confidence", nullable(regime_confidence)},
        {"regime_set_by_event", set_by}
    };
}

namespace {

std::optional<int> optional_date(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    auto day = util::parse_date(j[key].get<std::string>());
    if (!day) {
        throw std::runtime_error(std::string("Invalid date for ") + key);
    }
    return day;
}

} // namespace

RegimeState RegimeState::from_json(const nlohmann::json& j) {
    RegimeState state;
    state.symbol = j.at("symbol").get<std::string>();

    auto regime = regime_from_string(j.at("current_regime").get<std::string>());
    if (!regime) {
        throw std::runtime_error("Unknown regime: " + j.at("current_regime").dump());
    }
    state.current_regime = *regime;

    for (const auto& e : j.at("event_history")) {
        state.event_history.push_back(WyckoffEvent::from_json(e));
    }
    state.span_start = j.at("span_start").get<size_t>();
    if (state.span_start > state.event_history.size()) {
        throw std::runtime_error("span_start beyond event history");
    }

    state.last_event_date = optional_date(j, "last_event_date");
    state.last_bar_date = optional_date(j, "last_bar_date");

    if (j.contains("regime_confidence") && !j["regime_confidence"].is_null()) {
        state.regime_confidence = j["regime_confidence"].get<double>();
    }
    if (j.contains("regime_set_by_event") && !j["regime_set_by_event"].is_null()) {
        state.regime_set_by_event =
            event_type_from_string(j["regime_set_by_event"].get<std::string>());
    }
    return state;
}

nlohmann::json RegimeTransition::to_json() const {
    return {
        {"date", util::format_date(day)},
        {"prior_regime", to_string(from)},
        {"new_regime", to_string(to)},
        {"set_by_event", to_string(set_by_event)}
    };
}

std::optional<Regime> RegimeTracker::next_regime(Regime current, WyckoffEventType event) {
    switch (current) {
        case Regime::Unknown:
            return regime_for_event(event);
        case Regime::Accumulation:
            if (event == WyckoffEventType::SOS) return Regime::Markup;
            break;
        case Regime::Markup:
            if (event == WyckoffEventType::BC) return Regime::Distribution;
            break;
        case Regime::Distribution:
            if (event == WyckoffEventType::SOW) return Regime::Markdown;
            break;
        case Regime::Markdown:
            if (event == WyckoffEventType::SC || event == WyckoffEventType::SPRING) {
                return Regime::Accumulation;
            }
            break;
    }
    return std::nullopt;
}

std::optional<RegimeTransition> RegimeTracker::record(RegimeState& state,
                                                      const WyckoffEvent& event) {
    state.event_history.push_back(event);
    state.last_event_date = event.day;

    auto next = next_regime(state.current_regime, event.type);
    if (!next || *next == state.current_regime) {
        return std::nullopt;
    }

    RegimeTransition transition;
    transition.day = event.day;
    transition.from = state.current_regime;
    transition.to = *next;
    transition.set_by_event = event.type;

    state.current_regime = *next;
    state.span_start = state.event_history.size() - 1;
    state.regime_confidence = event.confidence;
    state.regime_set_by_event = event.type;
    return transition;
}

void RegimeTracker::trim_history(RegimeState& state, size_t max_older) {
    if (state.span_start <= max_older) return;

    size_t drop = state.span_start - max_older;
    state.event_history.erase(state.event_history.begin(),
                              state.event_history.begin() + static_cast<std::ptrdiff_t>(drop));
    state.span_start -= drop;
}

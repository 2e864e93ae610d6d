#include "snapshot.hpp"
#include "util.hpp"

std::optional<WyckoffEventType> SnapshotRecord::primary_event() const {
    static const WyckoffEventType priority[] = {
        WyckoffEventType::SC, WyckoffEventType::SPRING, WyckoffEventType::SOS,
        WyckoffEventType::BC, WyckoffEventType::UT, WyckoffEventType::SOW
    };
    for (auto type : priority) {
        for (const auto& e : events) {
            if (e.type == type) return type;
        }
    }
    if (events.empty()) return std::nullopt;
    return events.back().type;
}

std::vector<std::string> SnapshotRecord::events_detected() const {
    std::vector<std::string> names;
    for (const auto& e : events) {
        names.push_back(to_string(e.type));
    }
    return names;
}

nlohmann::json SnapshotRecord::events_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : events) {
        arr.push_back(e.to_json());
    }
    return arr;
}

nlohmann::json SnapshotRecord::derived_json() const {
    nlohmann::json seq = nlohmann::json::array();
    for (const auto& s : sequences) {
        seq.push_back(s.to_json());
    }
    nlohmann::json trans = nlohmann::json::array();
    for (const auto& t : transitions) {
        trans.push_back(t.to_json());
    }
    return {
        {"sequences", seq},
        {"transitions", trans}
    };
}

nlohmann::json SnapshotRecord::to_json() const {
    auto primary = primary_event();
    nlohmann::json set_by = regime.regime_set_by_event
        ? nlohmann::json(to_string(*regime.regime_set_by_event)) : nlohmann::json(nullptr);

    return {
        {"symbol", symbol},
        {"time", util::format_iso8601(time_ms)},
        {"model_version", model_version},
        {"dealer_metrics_json", dealer_metrics},
        {"events_detected", events_detected()},
        {"primary_event", primary ? nlohmann::json(to_string(*primary)) : nlohmann::json(nullptr)},
        {"events_json", events_json()},
        {"bc_score", nullable(bc_score)},
        {"spring_score", nullable(spring_score)},
        {"wyckoff_regime", to_string(regime.current_regime)},
        {"wyckoff_regime_confidence", nullable(regime.regime_confidence)},
        {"wyckoff_regime_set_by_event", set_by},
        {"wyckoff_state_json", regime.to_json()},
        {"wyckoff_sequences_json", derived_json()}
    };
}

void SnapshotRecord::merge_into(nlohmann::json& row) const {
    if (!row.is_object()) {
        row = nlohmann::json::object();
    }
    auto owned = to_json();
    for (auto it = owned.begin(); it != owned.end(); ++it) {
        row[it.key()] = it.value();
    }
}

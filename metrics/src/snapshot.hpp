#pragma once

#include "models.hpp"
#include "regime.hpp"
#include "sequences.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// The fields of a daily snapshot row owned by this service, keyed by
// (symbol, time). Other columns of the row belong to sibling jobs.
struct SnapshotRecord {
    std::string symbol;
    int64_t time_ms = 0;
    std::string model_version;

    nlohmann::json dealer_metrics;
    std::vector<WyckoffEvent> events;
    RegimeState regime;
    std::vector<RegimeTransition> transitions;
    std::vector<SequenceMatch> sequences;
    std::optional<int> bc_score;
    std::optional<int> spring_score;

    // Highest-priority event of this snapshot (SC, SPRING, SOS, BC, UT, SOW),
    // falling back to the latest one
    std::optional<WyckoffEventType> primary_event() const;

    std::vector<std::string> events_detected() const;
    nlohmann::json events_json() const;
    nlohmann::json derived_json() const;

    // Owned columns only; no wall-clock fields so reruns are byte-identical
    nlohmann::json to_json() const;

    // Replaces the owned keys of an existing row, leaving sibling keys alone
    void merge_into(nlohmann::json& row) const;
};

#pragma once

#include "models.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct SequenceMatch {
    std::string sequence_id;
    int start_day = 0;
    int completion_day = 0;
    std::vector<WyckoffEventType> events;
    bool failed = false;  // window closed without the confirming event

    nlohmann::json to_json() const;
};

// Multi-event patterns completed within max_days of their first event.
// Only matches whose completion falls in (after_day, through_day] are
// returned, ordered by (completion_day, sequence_id).
std::vector<SequenceMatch> find_sequences(const std::vector<WyckoffEvent>& history,
                                          const std::optional<int>& after_day,
                                          int through_day,
                                          int max_days = 30);

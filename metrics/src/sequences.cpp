#include "sequences.hpp"
#include "util.hpp"
#include <algorithm>
#include <tuple>

namespace {

struct SequencePattern {
    const char* id;
    std::vector<WyckoffEventType> events;
};

const std::vector<SequencePattern>& patterns() {
    static const std::vector<SequencePattern> all = {
        {"SEQ_ACCUM_BREAKOUT", {WyckoffEventType::SC, WyckoffEventType::AR,
                                WyckoffEventType::SPRING, WyckoffEventType::SOS}},
        {"SEQ_DISTRIBUTION_TOP", {WyckoffEventType::BC, WyckoffEventType::UT}},
        {"SEQ_MARKDOWN_START", {WyckoffEventType::BC, WyckoffEventType::SOW}},
        {"SEQ_RECOVERY", {WyckoffEventType::SOW, WyckoffEventType::SC}},
    };
    return all;
}

const std::vector<WyckoffEventType> kFailedAccumulation = {
    WyckoffEventType::SC, WyckoffEventType::AR, WyckoffEventType::SPRING
};

// Ordered search from history[start]; returns the index of the last matched event
std::optional<size_t> match_from(const std::vector<WyckoffEvent>& history, size_t start,
                                 const std::vector<WyckoffEventType>& pattern, int max_days) {
    if (history[start].type != pattern.front()) return std::nullopt;

    int window_end = history[start].day + max_days;
    size_t step = 1;
    size_t last = start;
    for (size_t k = start + 1; k < history.size() && step < pattern.size(); ++k) {
        if (history[k].day > window_end) break;
        if (history[k].type == pattern[step]) {
            last = k;
            ++step;
        }
    }
    if (step < pattern.size()) return std::nullopt;
    return last;
}

bool in_range(int day, const std::optional<int>& after_day, int through_day) {
    return (!after_day || day > *after_day) && day <= through_day;
}

} // namespace

nlohmann::json SequenceMatch::to_json() const {
    nlohmann::json types = nlohmann::json::array();
    for (auto t : events) {
        types.push_back(to_string(t));
    }
    return {
        {"sequence_id", sequence_id},
        {"start_date", util::format_date(start_day)},
        {"completion_date", util::format_date(completion_day)},
        {"events", types},
        {"failed", failed}
    };
}

std::vector<SequenceMatch> find_sequences(const std::vector<WyckoffEvent>& history,
                                          const std::optional<int>& after_day,
                                          int through_day,
                                          int max_days) {
    std::vector<SequenceMatch> matches;

    for (size_t start = 0; start < history.size(); ++start) {
        for (const auto& pattern : patterns()) {
            auto last = match_from(history, start, pattern.events, max_days);
            if (!last || !in_range(history[*last].day, after_day, through_day)) continue;

            SequenceMatch m;
            m.sequence_id = pattern.id;
            m.start_day = history[start].day;
            m.completion_day = history[*last].day;
            m.events = pattern.events;
            matches.push_back(m);
        }

        // Accumulation that never confirmed: the window closes without an SOS
        auto last = match_from(history, start, kFailedAccumulation, max_days);
        if (!last) continue;

        int window_end = history[start].day + max_days;
        if (!in_range(window_end, after_day, through_day)) continue;

        bool confirmed = false;
        for (size_t k = *last + 1; k < history.size() && history[k].day <= window_end; ++k) {
            if (history[k].type == WyckoffEventType::SOS) {
                confirmed = true;
                break;
            }
        }
        if (confirmed) continue;

        SequenceMatch m;
        m.sequence_id = "SEQ_FAILED_ACCUM";
        m.start_day = history[start].day;
        m.completion_day = window_end;
        m.events = kFailedAccumulation;
        m.failed = true;
        matches.push_back(m);
    }

    std::sort(matches.begin(), matches.end(), [](const SequenceMatch& a, const SequenceMatch& b) {
        return std::tie(a.completion_day, a.sequence_id, a.start_day) <
               std::tie(b.completion_day, b.sequence_id, b.start_day);
    });
    return matches;
}

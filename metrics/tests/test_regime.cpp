#include <catch2/catch_test_macros.hpp>
#include "../src/regime.hpp"

namespace {

WyckoffEvent event_on(int day, WyckoffEventType type, double confidence = 0.5) {
    WyckoffEvent e;
    e.symbol = "SPY";
    e.day = day;
    e.type = type;
    e.confidence = confidence;
    e.price_level = 400.0;
    return e;
}

} // namespace

TEST_CASE("Regime transitions", "[regime]") {
    SECTION("Unknown adopts the regime of the first event") {
        REQUIRE(RegimeTracker::next_regime(Regime::Unknown, WyckoffEventType::SC) ==
                Regime::Accumulation);
        REQUIRE(RegimeTracker::next_regime(Regime::Unknown, WyckoffEventType::BC) ==
                Regime::Distribution);
        REQUIRE(RegimeTracker::next_regime(Regime::Unknown, WyckoffEventType::SOW) ==
                Regime::Markdown);
    }

    SECTION("The cycle advances on its confirming events only") {
        REQUIRE(RegimeTracker::next_regime(Regime::Accumulation, WyckoffEventType::SOS) ==
                Regime::Markup);
        REQUIRE(RegimeTracker::next_regime(Regime::Markup, WyckoffEventType::BC) ==
                Regime::Distribution);
        REQUIRE(RegimeTracker::next_regime(Regime::Distribution, WyckoffEventType::SOW) ==
                Regime::Markdown);
        REQUIRE(RegimeTracker::next_regime(Regime::Markdown, WyckoffEventType::SC) ==
                Regime::Accumulation);
        REQUIRE_FALSE(RegimeTracker::next_regime(Regime::Accumulation,
                                                 WyckoffEventType::SPRING).has_value());
        REQUIRE_FALSE(RegimeTracker::next_regime(Regime::Markup,
                                                 WyckoffEventType::SOW).has_value());
    }
}

TEST_CASE("Recording events into a state", "[regime]") {
    auto state = RegimeState::initial("SPY");

    auto t1 = RegimeTracker::record(state, event_on(100, WyckoffEventType::SC, 0.8));
    REQUIRE(t1.has_value());
    REQUIRE(t1->from == Regime::Unknown);
    REQUIRE(t1->to == Regime::Accumulation);
    REQUIRE(state.regime_confidence == 0.8);
    REQUIRE(state.span_start == 0);

    REQUIRE_FALSE(RegimeTracker::record(state, event_on(102, WyckoffEventType::AR)).has_value());
    REQUIRE(state.span_contains(WyckoffEventType::AR));

    auto t2 = RegimeTracker::record(state, event_on(110, WyckoffEventType::SOS, 0.6));
    REQUIRE(t2.has_value());
    REQUIRE(t2->to == Regime::Markup);
    REQUIRE(t2->set_by_event == WyckoffEventType::SOS);

    SECTION("A transition opens a new span") {
        REQUIRE(state.span_start == 2);
        REQUIRE_FALSE(state.span_contains(WyckoffEventType::SC));
        REQUIRE(state.span_contains(WyckoffEventType::SOS));
        REQUIRE(state.last_event_date == 110);
    }

    SECTION("Trimming keeps the current span") {
        RegimeTracker::trim_history(state, 1);
        REQUIRE(state.event_history.size() == 2);
        REQUIRE(state.span_start == 1);
        REQUIRE(state.event_history[state.span_start].type == WyckoffEventType::SOS);
    }

    SECTION("JSON round trip") {
        state.last_bar_date = 111;
        auto restored = RegimeState::from_json(state.to_json());
        REQUIRE(restored.to_json() == state.to_json());
        REQUIRE(restored.current_regime == Regime::Markup);
        REQUIRE(restored.regime_set_by_event == WyckoffEventType::SOS);
        REQUIRE(restored.last_bar_date == 111);
    }

    SECTION("Corrupt state is rejected") {
        auto j = state.to_json();
        j["current_regime"] = "SIDEWAYS";
        REQUIRE_THROWS(RegimeState::from_json(j));
    }
}

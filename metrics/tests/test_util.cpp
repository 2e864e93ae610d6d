#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"
#include <cmath>

TEST_CASE("Calendar arithmetic", "[util]") {
    REQUIRE(util::days_from_civil(1970, 1, 1) == 0);
    REQUIRE(util::days_from_civil(2024, 3, 15) == 19797);
    REQUIRE(util::format_date(19797) == "2024-03-15");
    REQUIRE(util::parse_date("2024-02-29") == util::days_from_civil(2024, 2, 29));
    REQUIRE_FALSE(util::parse_date("2023-02-29").has_value());
    REQUIRE(util::day_from_ms(-1) == -1);
}

TEST_CASE("ISO-8601 timestamps", "[util]") {
    SECTION("A bare date means the end of that UTC day") {
        auto ms = util::parse_iso8601("2024-03-15");
        REQUIRE(ms.has_value());
        REQUIRE(util::format_iso8601(*ms) == "2024-03-15T23:59:59.999Z");
    }

    SECTION("Full timestamps with and without fractions") {
        REQUIRE(util::format_iso8601(*util::parse_iso8601("2024-03-15T14:30:00Z")) ==
                "2024-03-15T14:30:00.000Z");
        REQUIRE(util::format_iso8601(*util::parse_iso8601("2024-03-15T14:30:00.25")) ==
                "2024-03-15T14:30:00.250Z");
    }

    SECTION("Garbage") {
        REQUIRE_FALSE(util::parse_iso8601("").has_value());
        REQUIRE_FALSE(util::parse_iso8601("2024-13-01").has_value());
        REQUIRE_FALSE(util::parse_iso8601("2024-03-15T25:00:00Z").has_value());
        REQUIRE_FALSE(util::parse_iso8601("2024-03-15T14:30:00+02:00").has_value());
    }
}

TEST_CASE("String helpers", "[util]") {
    REQUIRE(util::trim("  aapl \n") == "aapl");
    REQUIRE(util::to_upper("brk.b") == "BRK.B");
    REQUIRE(util::split("a,b,,c", ',').size() == 4);
    REQUIRE(util::redact_dsn("postgresql://user:hunter2@db:5432/market") ==
            "postgresql://user:***@db:5432/market");
    REQUIRE(util::redact_dsn("host=db dbname=market") == "host=db dbname=market");
}

TEST_CASE("Rounding", "[util]") {
    REQUIRE(util::round_to(147.0833, 2) == 147.08);
    REQUIRE_FALSE(std::signbit(util::round_to(-0.001, 2)));
    REQUIRE(util::clamp01(1.5) == 1.0);
    REQUIRE(util::clamp01(std::nan("")) == 0.0);
}

TEST_CASE("Trace ids", "[util]") {
    auto a = util::make_trace_id("batch", {"AAPL", "MSFT"}, 1700000000000);
    REQUIRE(a == util::make_trace_id("batch", {"AAPL", "MSFT"}, 1700000000000));
    REQUIRE(a != util::make_trace_id("batch", {"AAPL"}, 1700000000000));
    REQUIRE(a.rfind("batch-", 0) == 0);
}

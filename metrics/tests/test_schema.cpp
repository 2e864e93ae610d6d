#include <catch2/catch_test_macros.hpp>
#include "../src/schema.hpp"
#include <stdexcept>

namespace {

class FakeSchema : public SchemaAdmin {
public:
    std::vector<std::string> missing;
    int ddl_calls = 0;
    int checks = 0;

    void init_schema() override {
        ddl_calls++;
        missing.clear();
    }

    std::vector<std::string> missing_columns() override {
        checks++;
        return missing;
    }
};

} // namespace

TEST_CASE("Schema preparation", "[schema]") {
    FakeSchema schema;

    SECTION("A normal run creates the schema") {
        schema.missing = {"dealer_metrics_json"};
        prepare_schema(schema, false);
        REQUIRE(schema.ddl_calls == 1);
        REQUIRE(schema.missing.empty());
    }

    SECTION("A dry run only reads the catalogue") {
        prepare_schema(schema, true);
        REQUIRE(schema.ddl_calls == 0);
        REQUIRE(schema.checks == 1);
    }

    SECTION("A dry run against an unprepared store fails without altering it") {
        schema.missing = {"wyckoff_state_json", "bc_score"};
        REQUIRE_THROWS_AS(prepare_schema(schema, true), std::runtime_error);
        REQUIRE(schema.ddl_calls == 0);
        REQUIRE(schema.missing.size() == 2);
    }
}

TEST_CASE("Owned snapshot columns", "[schema]") {
    const auto& columns = snapshot_columns();
    REQUIRE(columns.size() == 13);
    REQUIRE(columns.front().name == "price_metrics_json");

    bool has_state = false;
    for (const auto& c : columns) {
        REQUIRE_FALSE(c.type.empty());
        if (c.name == "wyckoff_state_json") has_state = c.type == "JSONB";
    }
    REQUIRE(has_state);
}

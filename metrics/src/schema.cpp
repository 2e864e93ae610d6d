#include "schema.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

const std::vector<ColumnSpec>& snapshot_columns() {
    // price_metrics_json is written by the ingestion side and only read here
    static const std::vector<ColumnSpec> columns = {
        {"price_metrics_json", "JSONB"},
        {"dealer_metrics_json", "JSONB"},
        {"model_version", "VARCHAR(50)"},
        {"events_detected", "TEXT[]"},
        {"primary_event", "VARCHAR(20)"},
        {"events_json", "JSONB"},
        {"bc_score", "INTEGER"},
        {"spring_score", "INTEGER"},
        {"wyckoff_regime", "VARCHAR(20)"},
        {"wyckoff_regime_confidence", "NUMERIC"},
        {"wyckoff_regime_set_by_event", "VARCHAR(20)"},
        {"wyckoff_state_json", "JSONB"},
        {"wyckoff_sequences_json", "JSONB"}
    };
    return columns;
}

void prepare_schema(SchemaAdmin& admin, bool dry_run) {
    if (!dry_run) {
        admin.init_schema();
        return;
    }

    auto missing = admin.missing_columns();
    if (missing.empty()) {
        spdlog::info("Dry run: schema present, not altering it");
        return;
    }

    std::string names;
    for (const auto& name : missing) {
        if (!names.empty()) names += ", ";
        names += name;
    }
    throw std::runtime_error("daily_snapshots is missing columns (" + names +
                             "); run once without dry-run to create them");
}

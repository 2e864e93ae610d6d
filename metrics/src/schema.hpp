#pragma once

#include <string>
#include <vector>

struct ColumnSpec {
    std::string name;
    std::string type;
};

// daily_snapshots columns this service reads or writes, besides the key
const std::vector<ColumnSpec>& snapshot_columns();

class SchemaAdmin {
public:
    virtual ~SchemaAdmin() = default;

    // DDL: creates daily_snapshots if missing and adds missing columns
    virtual void init_schema() = 0;

    // Read-only: names from snapshot_columns() that the table lacks
    // (all of them if the table does not exist)
    virtual std::vector<std::string> missing_columns() = 0;
};

// Brings the schema up to date. In dry-run nothing is altered; the schema is
// only checked and std::runtime_error lists whatever is missing.
void prepare_schema(SchemaAdmin& admin, bool dry_run);

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "sqlconnection.hpp"

/**
 * Generates every statement the migration store runs, per dialect.
 *
 * Row-returning statements select RECORD_COLUMNS. Parameters are positional:
 * placeholder(n) renders "$n" on Postgres and "?n" on SQLite.
 */
class StoreSQL {
public:
    explicit StoreSQL(std::string state_schema) : state_schema_(std::move(state_schema)) {}
    virtual ~StoreSQL() = default;

    // Idempotent DDL, run in order inside one transaction.
    virtual std::vector<std::string> init_statements() const = 0;
    // Returns one row when the tracking table exists.
    virtual std::string is_initialized() const = 0;
    // Fully qualified tracking table.
    virtual std::string table() const = 0;
    virtual std::string placeholder(int n) const = 0;

    // Per-schema lock held until the transaction ends; empty when the dialect has none.
    // Param 1: schema name. Returns one row {locked: bool}.
    virtual std::string try_lock() const { return ""; }
    // Bounds each statement of the current transaction; empty when unsupported.
    virtual std::string statement_timeout(std::chrono::milliseconds) const { return ""; }

    // 1 schema_name, 2 name, 3 migration, 4 status, 5 started_schema. Parent is the
    // latest completed migration of the schema. Returns the inserted record.
    std::string insert() const;
    // 1 schema_name
    std::string latest() const;
    // 1 schema_name, 2 name
    std::string find() const;
    // 1 schema_name
    std::string history() const;
    // 1 schema_name
    std::string latest_complete() const;
    // 1 new status, 2 completed_schema, 3 id; only touches in_progress rows.
    std::string set_status() const;

    static const char* const RECORD_COLUMNS;

    const std::string& state_schema() const { return state_schema_; }

protected:
    std::string state_schema_;
};

class PgStoreSQL final : public StoreSQL {
public:
    using StoreSQL::StoreSQL;

    std::vector<std::string> init_statements() const override;
    std::string is_initialized() const override;
    std::string table() const override;
    std::string placeholder(int n) const override { return "$" + std::to_string(n); }
    std::string try_lock() const override;
    std::string statement_timeout(std::chrono::milliseconds timeout) const override;
};

class SqliteStoreSQL final : public StoreSQL {
public:
    using StoreSQL::StoreSQL;

    std::vector<std::string> init_statements() const override;
    std::string is_initialized() const override;
    std::string table() const override;
    std::string placeholder(int n) const override { return "?" + std::to_string(n); }
};

std::unique_ptr<StoreSQL> make_store_sql(Dialect dialect, const std::string& state_schema);

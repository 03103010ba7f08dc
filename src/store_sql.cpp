#include "store_sql.hpp"
#include <sstream>
#include "lib.hpp"

const char* const StoreSQL::RECORD_COLUMNS =
    "id, schema_name, name, parent, migration, status, started_schema, completed_schema, created_at, updated_at";

std::string StoreSQL::insert() const {
    std::ostringstream sql;
    sql << "INSERT INTO " << table()
        << " (schema_name, name, parent, migration, status, started_schema) VALUES ("
        << placeholder(1) << ", " << placeholder(2) << ", "
        << "(SELECT name FROM " << table() << " WHERE schema_name = " << placeholder(1)
        << " AND status = 'complete' ORDER BY id DESC LIMIT 1), "
        << placeholder(3) << ", " << placeholder(4) << ", " << placeholder(5) << ") "
        << "RETURNING " << RECORD_COLUMNS;
    return sql.str();
}

std::string StoreSQL::latest() const {
    return "SELECT " + std::string(RECORD_COLUMNS) + " FROM " + table()
        + " WHERE schema_name = " + placeholder(1) + " ORDER BY id DESC LIMIT 1";
}

std::string StoreSQL::find() const {
    return "SELECT " + std::string(RECORD_COLUMNS) + " FROM " + table()
        + " WHERE schema_name = " + placeholder(1) + " AND name = " + placeholder(2)
        + " ORDER BY id DESC LIMIT 1";
}

std::string StoreSQL::history() const {
    return "SELECT " + std::string(RECORD_COLUMNS) + " FROM " + table()
        + " WHERE schema_name = " + placeholder(1) + " ORDER BY id ASC";
}

std::string StoreSQL::latest_complete() const {
    return "SELECT " + std::string(RECORD_COLUMNS) + " FROM " + table()
        + " WHERE schema_name = " + placeholder(1) + " AND status = 'complete' ORDER BY id DESC LIMIT 1";
}

std::string StoreSQL::set_status() const {
    return "UPDATE " + table() + " SET status = " + placeholder(1)
        + ", completed_schema = " + placeholder(2)
        + ", updated_at = CURRENT_TIMESTAMP WHERE id = " + placeholder(3)
        + " AND status = 'in_progress' RETURNING " + RECORD_COLUMNS;
}

/* ---------- PostgreSQL ---------- */

std::string PgStoreSQL::table() const {
    return quote_ident(state_schema_) + ".migrations";
}

std::vector<std::string> PgStoreSQL::init_statements() const {
    const std::string t = table();
    return {
        // Serializes concurrent init calls.
        "SELECT pg_advisory_xact_lock(hashtext(" + quote_literal(state_schema_ + ":init") + "))",
        "CREATE SCHEMA IF NOT EXISTS " + quote_ident(state_schema_),
        "CREATE TABLE IF NOT EXISTS " + t + " ("
        " id BIGSERIAL PRIMARY KEY,"
        " schema_name TEXT NOT NULL,"
        " name TEXT NOT NULL,"
        " parent TEXT,"
        " migration JSONB NOT NULL,"
        " status TEXT NOT NULL CHECK (status IN ('in_progress', 'complete', 'rolled_back')),"
        " started_schema JSONB NOT NULL,"
        " completed_schema JSONB,"
        " created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        " updated_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP)",
        "CREATE UNIQUE INDEX IF NOT EXISTS only_one_active ON " + t + " (schema_name) WHERE status = 'in_progress'",
        "CREATE UNIQUE INDEX IF NOT EXISTS unique_name ON " + t + " (schema_name, name) WHERE status <> 'rolled_back'",
        "CREATE INDEX IF NOT EXISTS history_by_schema ON " + t + " (schema_name, id)",
    };
}

std::string PgStoreSQL::is_initialized() const {
    return "SELECT 1 AS found FROM pg_catalog.pg_tables WHERE schemaname = "
        + quote_literal(state_schema_) + " AND tablename = 'migrations'";
}

std::string PgStoreSQL::try_lock() const {
    return "SELECT pg_try_advisory_xact_lock(hashtext(" + quote_literal(state_schema_ + ":")
        + " || $1::text)) AS locked";
}

std::string PgStoreSQL::statement_timeout(std::chrono::milliseconds timeout) const {
    auto ms = timeout.count() < 1 ? 1 : timeout.count();
    return "SET LOCAL statement_timeout = " + std::to_string(ms);
}

/* ---------- SQLite ---------- */

// No schemas in SQLite: the state schema becomes a table-name prefix.
std::string SqliteStoreSQL::table() const {
    return quote_ident(state_schema_ + "_migrations");
}

std::vector<std::string> SqliteStoreSQL::init_statements() const {
    const std::string t = table();
    const std::string p = state_schema_ + "_";
    return {
        "CREATE TABLE IF NOT EXISTS " + t + " ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " schema_name TEXT NOT NULL,"
        " name TEXT NOT NULL,"
        " parent TEXT,"
        " migration TEXT NOT NULL,"
        " status TEXT NOT NULL CHECK (status IN ('in_progress', 'complete', 'rolled_back')),"
        " started_schema TEXT NOT NULL,"
        " completed_schema TEXT,"
        " created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        " updated_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP)",
        "CREATE UNIQUE INDEX IF NOT EXISTS " + quote_ident(p + "only_one_active") + " ON " + t
            + " (schema_name) WHERE status = 'in_progress'",
        "CREATE UNIQUE INDEX IF NOT EXISTS " + quote_ident(p + "unique_name") + " ON " + t
            + " (schema_name, name) WHERE status <> 'rolled_back'",
        "CREATE INDEX IF NOT EXISTS " + quote_ident(p + "history_by_schema") + " ON " + t + " (schema_name, id)",
    };
}

std::string SqliteStoreSQL::is_initialized() const {
    return "SELECT 1 AS found FROM sqlite_master WHERE type = 'table' AND name = "
        + quote_literal(state_schema_ + "_migrations");
}

std::unique_ptr<StoreSQL> make_store_sql(Dialect dialect, const std::string& state_schema) {
    if (dialect == Dialect::Postgres) return std::make_unique<PgStoreSQL>(state_schema);
    return std::make_unique<SqliteStoreSQL>(state_schema);
}

#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "jsonhlp.hpp"
#include "errors.hpp"

enum class Dialect { SQLite, Postgres };

std::string dialect_name(Dialect dialect);
Dialect parse_dialect(const std::string& name); // "postgres" | "sqlite", throws otherwise

class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    // Positional parameters are 1-based.
    void bind(int idx, const std::string& value) { set_text(idx, value); }
    void bind_int(int idx, int64_t value) { set_int(idx, value); }
    void bind_bool(int idx, bool value) { set_bool(idx, value); }
    void bind_null(int idx) { set_null(idx); }
    void bind_opt(int idx, const std::optional<std::string>& value) {
        if (value) set_text(idx, *value);
        else set_null(idx);
    }

    virtual int exec() = 0;  // return rows affected

    // Run a row-returning statement. Result is a JSON array with one object per
    // row, {column: "text value" | null}, in the order the server returned them.
    virtual jdoc query() = 0;

    const std::string& sql() const { return sql_; }

protected:
    std::string sql_;
    virtual void set_null(int idx) = 0;
    virtual void set_text(int idx, const std::string& value) = 0;

    virtual void set_int(int idx, int64_t value) {
        set_text(idx, std::to_string(value));
    }

    virtual void set_bool(int idx, bool value) {
        set_text(idx, value ? "true" : "false");
    }
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // Connect using a DSN / path (SQLite: filename; Postgres: conninfo).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    // Transaction control; failures throw DbError.
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    virtual Dialect dialect() const = 0;

    // False after disconnect() or a failed connect().
    virtual bool connected() const = 0;

    bool in_transaction() const { return tr_started_; }

    // One-shot statement without parameters.
    int execute(const std::string& sql) {
        return prepare(sql)->exec();
    }

protected:
    bool tr_started_ = false;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();
#if HAVE_POSTGRESQL
PSQLConnection make_postgres_connection();
#endif

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <random>
#include <string>
#include "dbpool.hpp"
#include "fake_sql.hpp"
#include "migration.hpp"
#include "schema.hpp"
#include "state.hpp"

using namespace std::chrono_literals;

// users(id PK, email UNIQUE, age CHECK) + orders(user_id FK -> users.id, (a, b) UNIQUE)
inline schema::Schema sample_schema(const std::string& name = "public") {
    schema::Schema s;
    s.name = name;

    schema::Table users;
    users.name = "users";
    users.oid = "16384";
    users.columns["id"] = { "id", "integer", false, true };
    users.columns["email"] = { "email", "text", false, true };
    users.columns["age"] = { "age", "integer", true, false };
    users.primary_key = { "id" };
    users.indexes["users_pkey"] = { "users_pkey" };
    users.indexes["users_email_key"] = { "users_email_key" };
    users.unique_constraints["users_email_key"] = { "users_email_key", { "email" } };
    users.check_constraints["age_check"] = { "age_check", { "age" }, "CHECK ((age > 18))" };
    s.tables["users"] = users;

    schema::Table orders;
    orders.name = "orders";
    orders.oid = "16400";
    orders.columns["user_id"] = { "user_id", "integer", true, false };
    orders.columns["a"] = { "a", "text", true, false };
    orders.columns["b"] = { "b", "character varying(255)", true, false };
    orders.indexes["orders_a_b_key"] = { "orders_a_b_key" };
    orders.unique_constraints["orders_a_b_key"] = { "orders_a_b_key", { "a", "b" } };
    orders.foreign_keys["orders_user_fkey"] = { "orders_user_fkey", { "user_id" }, "users", { "id" } };
    s.tables["orders"] = orders;
    return s;
}

inline Migration sample_migration(const std::string& name = "01_add_phone") {
    Migration m;
    m.name = name;
    OpAddColumn op;
    op.table = "users";
    op.column.name = "phone";
    op.column.type = "text";
    m.operations.push_back(op);
    return m;
}

// Connection pool over SQLite whose connections carry switchable faults.
inline std::shared_ptr<pool::DbPool> sqlite_pool(const std::string& dsn, std::size_t capacity,
                                                std::shared_ptr<Faults> faults = std::make_shared<Faults>(),
                                                std::chrono::milliseconds acquire_timeout = 500ms) {
    pool::AcquirePolicy policy;
    policy.acquire_timeout = acquire_timeout;
    return std::make_shared<pool::DbPool>(capacity, dsn, [faults]() -> PSQLConnection {
        return std::make_unique<FaultyConnection>(make_sqlite_connection(), faults);
    }, policy);
}

inline StateOptions sqlite_options() {
    StateOptions o;
    o.dialect = Dialect::SQLite;
    return o;
}

using SchemaMap = std::map<std::string, schema::Schema>;

// State over an in-memory SQLite store and a stub catalog holding sample_schema("public").
struct StateFixture {
    std::shared_ptr<Faults> faults = std::make_shared<Faults>();
    std::shared_ptr<SchemaMap> catalog = std::make_shared<SchemaMap>(SchemaMap { { "public", sample_schema() } });
    StubIntrospector* introspector = nullptr;
    std::unique_ptr<State> state;
    Context ctx;

    explicit StateFixture(const std::string& dsn = ":memory:", std::size_t capacity = 1) {
        auto stub = std::make_unique<StubIntrospector>(catalog);
        introspector = stub.get();
        state = std::make_unique<State>(sqlite_pool(dsn, capacity, faults), sqlite_options(), std::move(stub));
        state->init(ctx);
    }
};

// Unique database file under the temp directory, removed on destruction.
struct TempDbFile {
    std::string path;

    TempDbFile() {
        std::random_device rd;
        path = (std::filesystem::temp_directory_path()
                / ("pgshift_test_" + std::to_string(rd()) + ".db")).string();
    }
    ~TempDbFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(path + "-journal", ec);
    }
};

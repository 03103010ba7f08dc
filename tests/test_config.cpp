#include <catch2/catch.hpp>
#include <cstdlib>
#include <fstream>
#include "config.hpp"
#include "fixtures.hpp"

TEST_CASE("Config defaults", "[config]")
{
    Config c = Config::from_string("{}");
    CHECK(c.dialect == Dialect::Postgres);
    CHECK(c.dsn.empty());
    CHECK(c.state_schema == "pgshift");
    CHECK(c.pool_size == 4u);
    CHECK(c.acquire_timeout == 1500ms);
    CHECK(c.log_level == "info");
}

TEST_CASE("Config is read from JSON", "[config]")
{
    Config c = Config::from_string(R"({
        "dialect": "sqlite",
        "dsn": ":memory:",
        "state_schema": "migrations",
        "pool_size": 2,
        "acquire_timeout_ms": 250,
        "log_level": "debug"
    })");
    CHECK(c.dialect == Dialect::SQLite);
    CHECK(c.dsn == ":memory:");
    CHECK(c.state_schema == "migrations");
    CHECK(c.pool_size == 2u);
    CHECK(c.acquire_timeout == 250ms);
    CHECK(c.log_level == "debug");

    StateOptions o = c.state_options();
    CHECK(o.dialect == Dialect::SQLite);
    CHECK(o.state_schema == "migrations");
    CHECK(o.acquire_timeout == 250ms);

    CHECK(Config::from_string(R"({"dialect": "postgresql"})").dialect == Dialect::Postgres);
}

TEST_CASE("Config file", "[config]")
{
    TempDbFile file;
    {
        std::ofstream out(file.path);
        out << R"({"dialect": "sqlite", "dsn": "state.db"})";
    }
    CHECK(Config::from_file(file.path).dsn == "state.db");
    CHECK_THROWS_AS(Config::from_file(file.path + ".missing"), std::runtime_error);
}

TEST_CASE("Bad config values are rejected", "[config]")
{
    CHECK_THROWS_AS(Config::from_string("{"), std::runtime_error);
    CHECK_THROWS_AS(Config::from_string("[]"), std::runtime_error);
    CHECK_THROWS_AS(Config::from_string(R"({"dialect": "mysql"})"), std::runtime_error);
    CHECK_THROWS_AS(Config::from_string(R"({"log_level": "loud"})"), std::runtime_error);
    CHECK_THROWS_AS(Config::from_string(R"({"pool_size": 0})"), std::runtime_error);
    CHECK_THROWS_AS(Config::from_string(R"({"acquire_timeout_ms": -5})"), std::runtime_error);
    CHECK_THROWS_AS(Config::from_string(R"({"state_schema": ""})"), std::runtime_error);
}

TEST_CASE("PGSHIFT_DSN overrides the configured dsn", "[config][env]")
{
    Config c = Config::from_string(R"({"dsn": "dbname=file"})");

    ::unsetenv("PGSHIFT_DSN");
    c.apply_env();
    CHECK(c.dsn == "dbname=file");

    ::setenv("PGSHIFT_DSN", "dbname=env", 1);
    c.apply_env();
    ::unsetenv("PGSHIFT_DSN");
    CHECK(c.dsn == "dbname=env");
}

TEST_CASE("Config builds a working SQLite pool", "[config][pool]")
{
    Config c = Config::from_string(R"({"dialect": "sqlite", "dsn": ":memory:", "pool_size": 1})");
    auto db = c.make_pool();
    REQUIRE(db);
    CHECK(db->dialect() == Dialect::SQLite);
    CHECK(db->stats().size == 1u);

    auto catalog = std::make_shared<SchemaMap>();
    State state(db, c.state_options(), std::make_unique<StubIntrospector>(catalog));
    Context ctx;
    state.init(ctx);
    CHECK(state.is_initialized(ctx));
}

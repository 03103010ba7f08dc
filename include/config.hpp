#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "dbpool.hpp"
#include "jsonhlp.hpp"
#include "state.hpp"

/**
 * Driver configuration, read from a JSON file:
 *
 *   {
 *     "dialect": "postgres",
 *     "dsn": "host=localhost dbname=app",
 *     "state_schema": "pgshift",
 *     "pool_size": 4,
 *     "acquire_timeout_ms": 1500,
 *     "log_level": "info"
 *   }
 *
 * Missing keys keep their defaults.
 */
struct Config {
    Dialect dialect = Dialect::Postgres;
    std::string dsn;
    std::string state_schema = "pgshift";
    std::size_t pool_size = 4;
    std::chrono::milliseconds acquire_timeout { 1500 };
    std::string log_level = "info";

    // Throw std::runtime_error on malformed JSON, an unknown dialect or log level.
    static Config from_json(const jval& value);
    static Config from_string(const std::string& text);
    static Config from_file(const std::string& path);

    // PGSHIFT_DSN overrides dsn when set.
    void apply_env();

    StateOptions state_options() const;

    std::shared_ptr<pool::DbPool> make_pool() const;
};

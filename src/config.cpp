#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

Config Config::from_json(const jval& value) {
    if (!value.IsObject()) throw std::runtime_error("config: top level must be an object");
    Config c;
    c.dialect = parse_dialect(jhlp::get<std::string>(value, "dialect", dialect_name(c.dialect)));
    c.dsn = jhlp::get<std::string>(value, "dsn", c.dsn);
    c.state_schema = jhlp::get<std::string>(value, "state_schema", c.state_schema);

    int64_t size = jhlp::get<int64_t>(value, "pool_size", static_cast<int64_t>(c.pool_size));
    if (size < 1) throw std::runtime_error("config: pool_size must be >= 1");
    c.pool_size = static_cast<std::size_t>(size);

    int64_t timeout = jhlp::get<int64_t>(value, "acquire_timeout_ms", c.acquire_timeout.count());
    if (timeout < 1) throw std::runtime_error("config: acquire_timeout_ms must be >= 1");
    c.acquire_timeout = std::chrono::milliseconds(timeout);

    c.log_level = jhlp::get<std::string>(value, "log_level", c.log_level);
    Logger::parse_level(c.log_level);

    if (c.state_schema.empty()) throw std::runtime_error("config: state_schema must not be empty");
    return c;
}

Config Config::from_string(const std::string& text) {
    jdoc doc;
    if (!jhlp::parse_str(text, doc)) throw std::runtime_error("config: invalid JSON");
    return from_json(doc);
}

Config Config::from_file(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) throw std::runtime_error("config: cannot read " + path);
    return from_json(doc);
}

void Config::apply_env() {
    if (const char* dsn_env = std::getenv("PGSHIFT_DSN"); dsn_env && *dsn_env) dsn = dsn_env;
}

StateOptions Config::state_options() const {
    StateOptions o;
    o.dialect = dialect;
    o.state_schema = state_schema;
    o.acquire_timeout = acquire_timeout;
    return o;
}

std::shared_ptr<pool::DbPool> Config::make_pool() const {
    std::function<PSQLConnection()> factory;
    switch (dialect) {
        case Dialect::SQLite:
            factory = make_sqlite_connection;
            break;
        case Dialect::Postgres:
#if HAVE_POSTGRESQL
            factory = make_postgres_connection;
            break;
#else
            throw std::runtime_error("config: built without PostgreSQL support");
#endif
    }
    pool::AcquirePolicy policy;
    policy.acquire_timeout = acquire_timeout;
    return std::make_shared<pool::DbPool>(pool_size, dsn, std::move(factory), policy);
}

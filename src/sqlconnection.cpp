#include "sqlconnection.hpp"

std::string dialect_name(Dialect dialect) {
    switch (dialect) {
        case Dialect::SQLite:   return "sqlite";
        case Dialect::Postgres: return "postgres";
    }
    return "unknown";
}

Dialect parse_dialect(const std::string& name) {
    if (name == "sqlite"  ) return Dialect::SQLite  ;
    if (name == "postgres") return Dialect::Postgres;
    if (name == "postgresql") return Dialect::Postgres;
    THROW("Invalid dialect name: %s", name.c_str());
}

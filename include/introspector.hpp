#pragma once
#include <string>
#include "context.hpp"
#include "schema.hpp"
#include "sqlconnection.hpp"

/**
 * Reads the catalog of one logical schema into a schema::Schema.
 *
 * Runs on the caller's connection and inside the caller's transaction when one
 * is open, so a baseline read during Start sees the same catalog the record is
 * written against. Never opens a transaction of its own.
 */
class Introspector {
public:
    virtual ~Introspector() = default;

    // Throws NotFoundError (empty or unknown schema), IntrospectionError, CancelledError.
    virtual schema::Schema read_schema(const Context& ctx, SQLConnection& conn, const std::string& schema_name) = 0;
};

class PgIntrospector final : public Introspector {
public:
    schema::Schema read_schema(const Context& ctx, SQLConnection& conn, const std::string& schema_name) override;

    /**
     * Whole-schema catalog read, parameterized by the schema name ($1).
     *
     * One statement, so tables, columns, indexes and constraints come from a
     * single snapshot. Returns no row when the schema does not exist, otherwise
     * one row whose "tables" column is a JSON array (NULL for an empty schema):
     *
     *   [{"oid", "name",
     *     "columns":     [{"name", "type", "not_null"}],
     *     "indexes":     ["name"],
     *     "constraints": [{"name", "type", "columns", "referenced_table",
     *                      "referenced_columns", "definition"}]}]
     */
    static const char* const SCHEMA_SQL;
};

#include "introspector.hpp"
#include "logger.hpp"

// Tables and everything hanging off them, aggregated per table. Constraints are
// correlated to the loaded tables, so no row can name a relation outside the set.
// Key columns are aggregated in conkey/confkey order, which is the declared order.
const char* const PgIntrospector::SCHEMA_SQL =
    "SELECT ("
    " SELECT json_agg(json_build_object("
    "   'oid', c.oid::text,"
    "   'name', c.relname,"
    "   'columns', (SELECT COALESCE(json_agg(json_build_object("
    "       'name', a.attname,"
    "       'type', pg_catalog.format_type(a.atttypid, a.atttypmod),"
    "       'not_null', a.attnotnull) ORDER BY a.attnum), '[]'::json)"
    "     FROM pg_catalog.pg_attribute a"
    "     WHERE a.attrelid = c.oid AND a.attnum > 0 AND NOT a.attisdropped),"
    "   'indexes', (SELECT COALESCE(json_agg(i.relname ORDER BY i.relname), '[]'::json)"
    "     FROM pg_catalog.pg_index x"
    "     JOIN pg_catalog.pg_class i ON i.oid = x.indexrelid"
    "     WHERE x.indrelid = c.oid),"
    "   'constraints', (SELECT COALESCE(json_agg(json_build_object("
    "       'name', con.conname,"
    "       'type', con.contype::text,"
    "       'columns', (SELECT json_agg(ka.attname ORDER BY k.ord)"
    "         FROM unnest(con.conkey) WITH ORDINALITY AS k(attnum, ord)"
    "         JOIN pg_catalog.pg_attribute ka ON ka.attrelid = con.conrelid AND ka.attnum = k.attnum),"
    "       'referenced_table', ft.relname,"
    "       'referenced_columns', (SELECT json_agg(fa.attname ORDER BY k.ord)"
    "         FROM unnest(con.confkey) WITH ORDINALITY AS k(attnum, ord)"
    "         JOIN pg_catalog.pg_attribute fa ON fa.attrelid = con.confrelid AND fa.attnum = k.attnum),"
    "       'definition', pg_catalog.pg_get_constraintdef(con.oid)) ORDER BY con.conname), '[]'::json)"
    "     FROM pg_catalog.pg_constraint con"
    "     LEFT JOIN pg_catalog.pg_class ft ON ft.oid = con.confrelid"
    "     WHERE con.conrelid = c.oid AND con.contype IN ('p', 'u', 'f', 'c'))"
    " ) ORDER BY c.relname)"
    " FROM pg_catalog.pg_class c"
    " WHERE c.relnamespace = n.oid AND c.relkind IN ('r', 'p')"
    ") AS tables "
    "FROM pg_catalog.pg_namespace n "
    "WHERE n.nspname = $1";

namespace {

    constexpr const char* kOp = "read_schema";

    std::string cell(const jval& row, const char* key) {
        return jhlp::get<std::string>(row, key);
    }

    IntrospectionError malformed(const std::string& schema_name, const std::string& what) {
        return IntrospectionError(kOp, schema_name, "malformed catalog payload: " + what);
    }

    // Nested array member; nullptr when absent or NULL.
    const jval* list(const jval& obj, const char* key, const std::string& schema_name) {
        const jval* v = jhlp::member(obj, key);
        if (!v || v->IsNull()) return nullptr;
        if (!v->IsArray()) throw malformed(schema_name, std::string(key) + " is not an array");
        return v;
    }

    // Ordered key column names; NULL aggregates (no key columns) are empty.
    strings cell_names(const jval& row, const char* key, const std::string& schema_name) {
        const jval* v = list(row, key, schema_name);
        return v ? jhlp::to_strings(*v) : strings {};
    }

    void apply_constraint(schema::Table& t, const jval& row, const std::string& schema_name) {
        std::string name = cell(row, "name");
        std::string type = cell(row, "type");
        strings cols = cell_names(row, "columns", schema_name);

        if (type == "p") {
            t.primary_key = cols;
            for (const auto& c : cols) {
                auto it = t.columns.find(c);
                if (it == t.columns.end()) continue;
                it->second.nullable = false;
                if (cols.size() == 1) it->second.unique = true;
            }
        } else if (type == "u") {
            t.unique_constraints[name] = { name, cols };
            if (cols.size() == 1) {
                auto it = t.columns.find(cols.front());
                if (it != t.columns.end()) it->second.unique = true;
            }
        } else if (type == "f") {
            t.foreign_keys[name] = { name, cols, cell(row, "referenced_table"),
                                     cell_names(row, "referenced_columns", schema_name) };
        } else if (type == "c") {
            t.check_constraints[name] = { name, cols, cell(row, "definition") };
        }
    }

    schema::Table decode_table(const jval& tv, const std::string& schema_name) {
        if (!tv.IsObject()) throw malformed(schema_name, "table entry is not an object");
        schema::Table t;
        t.name = cell(tv, "name");
        t.oid = cell(tv, "oid");
        if (t.name.empty()) throw malformed(schema_name, "table without a name");

        if (const jval* cols = list(tv, "columns", schema_name)) {
            for (const auto& cv : cols->GetArray()) {
                schema::Column c;
                c.name = cell(cv, "name");
                c.type = cell(cv, "type");
                c.nullable = !jhlp::get<bool>(cv, "not_null");
                t.columns[c.name] = std::move(c);
            }
        }
        if (const jval* idx = list(tv, "indexes", schema_name)) {
            for (const auto& name : jhlp::to_strings(*idx)) t.indexes[name] = { name };
        }
        if (const jval* cons = list(tv, "constraints", schema_name)) {
            for (const auto& con : cons->GetArray()) apply_constraint(t, con, schema_name);
        }
        return t;
    }

} // namespace

schema::Schema PgIntrospector::read_schema(const Context& ctx, SQLConnection& conn, const std::string& schema_name) {
    if (schema_name.empty()) throw NotFoundError(kOp, schema_name, "schema name is empty");
    ctx.check(kOp, schema_name);
    LOG_DEBUG("catalog read for schema '{}'", schema_name);

    jdoc rows;
    try {
        auto stmt = conn.prepare(SCHEMA_SQL);
        stmt->bind(1, schema_name);
        rows = stmt->query();
    } catch (const DbError& e) {
        LOG_ERROR("introspection of schema '{}' failed: {}", schema_name, e.what());
        throw IntrospectionError(kOp, schema_name, e.what());
    }
    if (!rows.IsArray() || rows.Empty()) throw NotFoundError(kOp, schema_name, "schema does not exist");

    schema::Schema s;
    s.name = schema_name;
    const jval* payload = jhlp::member(rows[0u], "tables");
    if (payload && !payload->IsNull()) {
        if (!payload->IsString()) throw malformed(schema_name, "tables is not text");
        std::string text(payload->GetString(), payload->GetStringLength());
        jdoc doc;
        if (!jhlp::parse_str(text, doc) || !doc.IsArray()) throw malformed(schema_name, "tables is not a JSON array");
        for (const auto& tv : doc.GetArray()) {
            schema::Table t = decode_table(tv, schema_name);
            std::string name = t.name;
            s.tables.emplace(std::move(name), std::move(t));
        }
    }

    auto problems = s.validate();
    if (!problems.empty()) {
        LOG_WARN("schema '{}' read from the catalog violates model invariants: {}", schema_name, join(problems, "; "));
    }
    LOG_DEBUG("schema '{}' read: {} tables", schema_name, s.tables.size());
    return s;
}

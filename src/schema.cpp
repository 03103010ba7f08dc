#include "schema.hpp"

#define PROP_NAME               "name"
#define PROP_TABLES             "tables"
#define PROP_COLUMNS            "columns"
#define PROP_TYPE               "type"
#define PROP_NULLABLE           "nullable"
#define PROP_UNIQUE             "unique"
#define PROP_INDEXES            "indexes"
#define PROP_PRIMARY_KEY        "primaryKey"
#define PROP_UNIQUE_CONSTRAINTS "uniqueConstraints"
#define PROP_FOREIGN_KEYS       "foreignKeys"
#define PROP_CHECK_CONSTRAINTS  "checkConstraints"
#define PROP_REFERENCED_TABLE   "referencedTable"
#define PROP_REFERENCED_COLUMNS "referencedColumns"
#define PROP_DEFINITION         "definition"

namespace schema {

namespace {

    // Each map is serialized as an object keyed by entry name.
    template<typename T, typename F>
    jval map_to_json(const std::map<std::string, T>& items, jalloc& a, F&& one) {
        jval obj(json::kObjectType);
        for (const auto& [name, item] : items) {
            jval v(json::kObjectType);
            one(item, v);
            obj.AddMember(jhlp::str_val(name, a), v, a);
        }
        return obj;
    }

    // Decodes an object of entries with `one`; a missing member is an empty map.
    template<typename T, typename F>
    bool map_from_json(const jval& parent, const char* key, std::map<std::string, T>& out, F&& one) {
        out.clear();
        const jval* obj = jhlp::member(parent, key);
        if (!obj || obj->IsNull()) return true;
        if (!obj->IsObject()) return false;
        for (jit it = obj->MemberBegin(); it != obj->MemberEnd(); ++it) {
            if (!it->value.IsObject()) return false;
            T item;
            if (!one(it->value, item)) return false;
            if (item.name.empty()) item.name = it->name.GetString();
            out.emplace(it->name.GetString(), std::move(item));
        }
        return true;
    }

    bool table_from_json(const jval& j, Table& t) {
        t.name = jhlp::get<std::string>(j, PROP_NAME);

        bool ok = map_from_json(j, PROP_COLUMNS, t.columns, [](const jval& v, Column& c) {
            c.name = jhlp::get<std::string>(v, PROP_NAME);
            c.type = jhlp::get<std::string>(v, PROP_TYPE);
            c.nullable = jhlp::get<bool>(v, PROP_NULLABLE, true);
            c.unique = jhlp::get<bool>(v, PROP_UNIQUE, false);
            return !c.type.empty();
        });
        ok = ok && map_from_json(j, PROP_INDEXES, t.indexes, [](const jval& v, Index& i) {
            i.name = jhlp::get<std::string>(v, PROP_NAME);
            return true;
        });
        ok = ok && map_from_json(j, PROP_UNIQUE_CONSTRAINTS, t.unique_constraints, [](const jval& v, UniqueConstraint& u) {
            u.name = jhlp::get<std::string>(v, PROP_NAME);
            u.columns = jhlp::get_strings(v, PROP_COLUMNS);
            return true;
        });
        ok = ok && map_from_json(j, PROP_FOREIGN_KEYS, t.foreign_keys, [](const jval& v, ForeignKey& fk) {
            fk.name = jhlp::get<std::string>(v, PROP_NAME);
            fk.columns = jhlp::get_strings(v, PROP_COLUMNS);
            fk.referenced_table = jhlp::get<std::string>(v, PROP_REFERENCED_TABLE);
            fk.referenced_columns = jhlp::get_strings(v, PROP_REFERENCED_COLUMNS);
            return true;
        });
        ok = ok && map_from_json(j, PROP_CHECK_CONSTRAINTS, t.check_constraints, [](const jval& v, CheckConstraint& cc) {
            cc.name = jhlp::get<std::string>(v, PROP_NAME);
            cc.columns = jhlp::get_strings(v, PROP_COLUMNS);
            cc.definition = jhlp::get<std::string>(v, PROP_DEFINITION);
            return true;
        });
        t.primary_key = jhlp::get_strings(j, PROP_PRIMARY_KEY);
        return ok;
    }

} // namespace

bool Table::operator==(const Table& other) const {
    return name == other.name
        && columns == other.columns
        && indexes == other.indexes
        && primary_key == other.primary_key
        && unique_constraints == other.unique_constraints
        && foreign_keys == other.foreign_keys
        && check_constraints == other.check_constraints;
}

const Column* Table::column(const std::string& name) const {
    auto it = columns.find(name);
    return it == columns.end() ? nullptr : &it->second;
}

const Table* Schema::table(const std::string& name) const {
    auto it = tables.find(name);
    return it == tables.end() ? nullptr : &it->second;
}

std::vector<std::string> Schema::validate() const {
    std::vector<std::string> problems;
    for (const auto& [tname, t] : tables) {
        auto where = [&](const std::string& what) { return "table " + tname + ": " + what; };
        if (t.name != tname) problems.push_back(where("name does not match its key"));

        auto known = [&](const std::vector<std::string>& cols, const std::string& owner) {
            for (const auto& c : cols) {
                if (!t.column(c)) problems.push_back(where(owner + " references unknown column " + c));
            }
        };

        for (const auto& pk : t.primary_key) {
            const Column* c = t.column(pk);
            if (!c) {
                problems.push_back(where("primary key references unknown column " + pk));
            } else if (c->nullable) {
                problems.push_back(where("primary key column " + pk + " is nullable"));
            }
        }
        if (t.primary_key.size() == 1) {
            const Column* c = t.column(t.primary_key.front());
            if (c && !c->unique) problems.push_back(where("single-column primary key " + c->name + " is not unique"));
        }
        for (const auto& [n, uc] : t.unique_constraints) known(uc.columns, "unique constraint " + n);
        for (const auto& [n, cc] : t.check_constraints) known(cc.columns, "check constraint " + n);
        for (const auto& [n, fk] : t.foreign_keys) {
            known(fk.columns, "foreign key " + n);
            if (fk.columns.empty() || fk.columns.size() != fk.referenced_columns.size()) {
                problems.push_back(where("foreign key " + n + " has mismatched column lists"));
            }
        }
    }
    return problems;
}

jval Schema::to_json(jalloc& a) const {
    jval root(json::kObjectType);
    jhlp::set(root, PROP_NAME, name, a);

    jval tbls = map_to_json(tables, a, [&a](const Table& t, jval& v) {
        jhlp::set(v, PROP_NAME, t.name, a);

        jval cols = map_to_json(t.columns, a, [&a](const Column& c, jval& cv) {
            jhlp::set(cv, PROP_NAME, c.name, a);
            jhlp::set(cv, PROP_TYPE, c.type, a);
            jhlp::set(cv, PROP_NULLABLE, c.nullable, a);
            jhlp::set(cv, PROP_UNIQUE, c.unique, a);
        });
        jhlp::set(v, PROP_COLUMNS, cols, a);

        jval idxs = map_to_json(t.indexes, a, [&a](const Index& i, jval& iv) {
            jhlp::set(iv, PROP_NAME, i.name, a);
        });
        jhlp::set(v, PROP_INDEXES, idxs, a);

        jhlp::set(v, PROP_PRIMARY_KEY, t.primary_key, a);

        jval ucs = map_to_json(t.unique_constraints, a, [&a](const UniqueConstraint& u, jval& uv) {
            jhlp::set(uv, PROP_NAME, u.name, a);
            jhlp::set(uv, PROP_COLUMNS, u.columns, a);
        });
        jhlp::set(v, PROP_UNIQUE_CONSTRAINTS, ucs, a);

        jval fks = map_to_json(t.foreign_keys, a, [&a](const ForeignKey& fk, jval& fv) {
            jhlp::set(fv, PROP_NAME, fk.name, a);
            jhlp::set(fv, PROP_COLUMNS, fk.columns, a);
            jhlp::set(fv, PROP_REFERENCED_TABLE, fk.referenced_table, a);
            jhlp::set(fv, PROP_REFERENCED_COLUMNS, fk.referenced_columns, a);
        });
        jhlp::set(v, PROP_FOREIGN_KEYS, fks, a);

        jval ccs = map_to_json(t.check_constraints, a, [&a](const CheckConstraint& cc, jval& ccv) {
            jhlp::set(ccv, PROP_NAME, cc.name, a);
            jhlp::set(ccv, PROP_COLUMNS, cc.columns, a);
            jhlp::set(ccv, PROP_DEFINITION, cc.definition, a);
        });
        jhlp::set(v, PROP_CHECK_CONSTRAINTS, ccs, a);
    });
    jhlp::set(root, PROP_TABLES, tbls, a);
    return root;
}

std::string Schema::to_json() const {
    jdoc doc;
    jval v = to_json(doc.GetAllocator());
    return jhlp::stringify(v);
}

bool Schema::from_json(const jval& j, Schema& schema) {
    if (!j.IsObject()) return false;
    const jval* name = jhlp::member(j, PROP_NAME);
    if (!name || !name->IsString()) return false;
    schema.name = name->GetString();
    return map_from_json(j, PROP_TABLES, schema.tables, table_from_json);
}

bool Schema::from_json(const std::string& text, Schema& schema) {
    jdoc doc;
    if (!jhlp::parse_str(text, doc)) return false;
    return from_json(doc, schema);
}

} // namespace schema

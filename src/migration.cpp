#include "migration.hpp"
#include <array>
#include <stdexcept>

#define PROP_NAME        "name"
#define PROP_OPERATIONS  "operations"
#define PROP_TABLE       "table"
#define PROP_COLUMN      "column"
#define PROP_COLUMNS     "columns"
#define PROP_TYPE        "type"
#define PROP_NULLABLE    "nullable"
#define PROP_UNIQUE      "unique"
#define PROP_PK          "pk"
#define PROP_DEFAULT     "default"
#define PROP_REFERENCES  "references"
#define PROP_CHECK       "check"
#define PROP_CONSTRAINT  "constraint"
#define PROP_FROM        "from"
#define PROP_TO          "to"
#define PROP_UP          "up"
#define PROP_DOWN        "down"

namespace {

    constexpr std::array<const char*, 15> kOpNames = {
        "create_table", "rename_table", "drop_table",
        "add_column", "drop_column", "rename_column", "alter_column",
        "create_index", "drop_index",
        "set_not_null", "set_unique", "set_check_constraint", "set_foreign_key", "drop_constraint",
        "raw_sql"
    };

    constexpr std::array<const char*, 3> kStatusNames = { "in_progress", "complete", "rolled_back" };

    void set_opt(jval& v, const char* key, const std::optional<std::string>& value, jalloc& a) {
        if (value) jhlp::set(v, key, *value, a);
    }

    std::optional<std::string> get_opt(const jval& v, const char* key) {
        const jval* m = jhlp::member(v, key);
        if (!m || m->IsNull()) return std::nullopt;
        if (!m->IsString()) throw std::runtime_error(std::string("field '") + key + "' must be a string");
        return std::string(m->GetString(), m->GetStringLength());
    }

    std::string get_str(const jval& v, const char* key) {
        return jhlp::get<std::string>(v, key);
    }

    /****************** encoding ******************/

    jval fk_ref_json(const ForeignKeyRef& r, jalloc& a) {
        jval v(json::kObjectType);
        jhlp::set(v, PROP_NAME, r.name, a);
        jhlp::set(v, PROP_TABLE, r.table, a);
        jhlp::set(v, PROP_COLUMN, r.column, a);
        return v;
    }

    jval check_json(const CheckDef& c, jalloc& a) {
        jval v(json::kObjectType);
        jhlp::set(v, PROP_NAME, c.name, a);
        jhlp::set(v, PROP_CONSTRAINT, c.constraint, a);
        return v;
    }

    jval column_json(const ColumnDef& c, jalloc& a) {
        jval v(json::kObjectType);
        jhlp::set(v, PROP_NAME, c.name, a);
        jhlp::set(v, PROP_TYPE, c.type, a);
        jhlp::set(v, PROP_NULLABLE, c.nullable, a);
        jhlp::set(v, PROP_UNIQUE, c.unique, a);
        jhlp::set(v, PROP_PK, c.pk, a);
        set_opt(v, PROP_DEFAULT, c.default_value, a);
        if (c.references) {
            jval r = fk_ref_json(*c.references, a);
            jhlp::set(v, PROP_REFERENCES, r, a);
        }
        if (c.check) {
            jval ch = check_json(*c.check, a);
            jhlp::set(v, PROP_CHECK, ch, a);
        }
        return v;
    }

    struct PayloadWriter {
        jalloc& a;

        jval operator()(const OpCreateTable& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_NAME, op.name, a);
            jval cols(json::kArrayType);
            for (const auto& c : op.columns) cols.PushBack(column_json(c, a), a);
            jhlp::set(v, PROP_COLUMNS, cols, a);
            return v;
        }
        jval operator()(const OpRenameTable& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_FROM, op.from, a);
            jhlp::set(v, PROP_TO, op.to, a);
            return v;
        }
        jval operator()(const OpDropTable& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_NAME, op.name, a);
            return v;
        }
        jval operator()(const OpAddColumn& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_TABLE, op.table, a);
            jval c = column_json(op.column, a);
            jhlp::set(v, PROP_COLUMN, c, a);
            set_opt(v, PROP_UP, op.up, a);
            return v;
        }
        jval operator()(const OpDropColumn& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_TABLE, op.table, a);
            jhlp::set(v, PROP_COLUMN, op.column, a);
            set_opt(v, PROP_DOWN, op.down, a);
            return v;
        }
        jval operator()(const OpRenameColumn& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_TABLE, op.table, a);
            jhlp::set(v, PROP_FROM, op.from, a);
            jhlp::set(v, PROP_TO, op.to, a);
            return v;
        }
        jval operator()(const OpAlterColumn& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_TABLE, op.table, a);
            jhlp::set(v, PROP_COLUMN, op.column, a);
            set_opt(v, PROP_NAME, op.name, a);
            set_opt(v, PROP_TYPE, op.type, a);
            if (op.nullable) jhlp::set(v, PROP_NULLABLE, *op.nullable, a);
            set_opt(v, PROP_UP, op.up, a);
            set_opt(v, PROP_DOWN, op.down, a);
            return v;
        }
        jval operator()(const OpCreateIndex& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_NAME, op.name, a);
            jhlp::set(v, PROP_TABLE, op.table, a);
            jhlp::set(v, PROP_COLUMNS, op.columns, a);
            return v;
        }
        jval operator()(const OpDropIndex& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_NAME, op.name, a);
            return v;
        }
        jval operator()(const OpSetNotNull& op) const {
            jval v = target(op.table, op.column);
            updown(v, op.up, op.down);
            return v;
        }
        jval operator()(const OpSetUnique& op) const {
            jval v = target(op.table, op.column);
            jhlp::set(v, PROP_NAME, op.name, a);
            updown(v, op.up, op.down);
            return v;
        }
        jval operator()(const OpSetCheckConstraint& op) const {
            jval v = target(op.table, op.column);
            jval c = check_json(op.check, a);
            jhlp::set(v, PROP_CHECK, c, a);
            updown(v, op.up, op.down);
            return v;
        }
        jval operator()(const OpSetForeignKey& op) const {
            jval v = target(op.table, op.column);
            jval r = fk_ref_json(op.references, a);
            jhlp::set(v, PROP_REFERENCES, r, a);
            updown(v, op.up, op.down);
            return v;
        }
        jval operator()(const OpDropConstraint& op) const {
            jval v = target(op.table, op.column);
            jhlp::set(v, PROP_NAME, op.name, a);
            updown(v, op.up, op.down);
            return v;
        }
        jval operator()(const OpRawSQL& op) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_UP, op.up, a);
            set_opt(v, PROP_DOWN, op.down, a);
            return v;
        }

    private:
        jval target(const std::string& table, const std::string& column) const {
            jval v(json::kObjectType);
            jhlp::set(v, PROP_TABLE, table, a);
            jhlp::set(v, PROP_COLUMN, column, a);
            return v;
        }
        void updown(jval& v, const std::optional<std::string>& up, const std::optional<std::string>& down) const {
            set_opt(v, PROP_UP, up, a);
            set_opt(v, PROP_DOWN, down, a);
        }
    };

    /****************** decoding ******************/

    const jval& object_member(const jval& v, const char* key) {
        const jval* m = jhlp::member(v, key);
        if (!m || !m->IsObject()) throw std::runtime_error(std::string("field '") + key + "' must be an object");
        return *m;
    }

    ForeignKeyRef fk_ref_from(const jval& v) {
        return { get_str(v, PROP_NAME), get_str(v, PROP_TABLE), get_str(v, PROP_COLUMN) };
    }

    CheckDef check_from(const jval& v) {
        return { get_str(v, PROP_NAME), get_str(v, PROP_CONSTRAINT) };
    }

    ColumnDef column_from(const jval& v) {
        if (!v.IsObject()) throw std::runtime_error("column definition must be an object");
        ColumnDef c;
        c.name = get_str(v, PROP_NAME);
        c.type = get_str(v, PROP_TYPE);
        c.nullable = jhlp::get<bool>(v, PROP_NULLABLE, true);
        c.unique = jhlp::get<bool>(v, PROP_UNIQUE, false);
        c.pk = jhlp::get<bool>(v, PROP_PK, false);
        c.default_value = get_opt(v, PROP_DEFAULT);
        if (jhlp::has(v, PROP_REFERENCES)) c.references = fk_ref_from(object_member(v, PROP_REFERENCES));
        if (jhlp::has(v, PROP_CHECK)) c.check = check_from(object_member(v, PROP_CHECK));
        return c;
    }

    Operation payload_from(OpKind kind, const jval& v) {
        switch (kind) {
            case OpKind::CreateTable: {
                OpCreateTable op { get_str(v, PROP_NAME), {} };
                if (const jval* cols = jhlp::member(v, PROP_COLUMNS)) {
                    if (!cols->IsArray()) throw std::runtime_error("create_table.columns must be an array");
                    for (const auto& c : cols->GetArray()) op.columns.push_back(column_from(c));
                }
                return op;
            }
            case OpKind::RenameTable:
                return OpRenameTable { get_str(v, PROP_FROM), get_str(v, PROP_TO) };
            case OpKind::DropTable:
                return OpDropTable { get_str(v, PROP_NAME) };
            case OpKind::AddColumn: {
                OpAddColumn op;
                op.table = get_str(v, PROP_TABLE);
                if (jhlp::has(v, PROP_COLUMN)) op.column = column_from(object_member(v, PROP_COLUMN));
                op.up = get_opt(v, PROP_UP);
                return op;
            }
            case OpKind::DropColumn:
                return OpDropColumn { get_str(v, PROP_TABLE), get_str(v, PROP_COLUMN), get_opt(v, PROP_DOWN) };
            case OpKind::RenameColumn:
                return OpRenameColumn { get_str(v, PROP_TABLE), get_str(v, PROP_FROM), get_str(v, PROP_TO) };
            case OpKind::AlterColumn: {
                OpAlterColumn op;
                op.table = get_str(v, PROP_TABLE);
                op.column = get_str(v, PROP_COLUMN);
                op.name = get_opt(v, PROP_NAME);
                op.type = get_opt(v, PROP_TYPE);
                if (const jval* n = jhlp::member(v, PROP_NULLABLE); n && n->IsBool()) op.nullable = n->GetBool();
                op.up = get_opt(v, PROP_UP);
                op.down = get_opt(v, PROP_DOWN);
                return op;
            }
            case OpKind::CreateIndex:
                return OpCreateIndex { get_str(v, PROP_NAME), get_str(v, PROP_TABLE), jhlp::get_strings(v, PROP_COLUMNS) };
            case OpKind::DropIndex:
                return OpDropIndex { get_str(v, PROP_NAME) };
            case OpKind::SetNotNull:
                return OpSetNotNull { get_str(v, PROP_TABLE), get_str(v, PROP_COLUMN), get_opt(v, PROP_UP), get_opt(v, PROP_DOWN) };
            case OpKind::SetUnique:
                return OpSetUnique { get_str(v, PROP_NAME), get_str(v, PROP_TABLE), get_str(v, PROP_COLUMN),
                                     get_opt(v, PROP_UP), get_opt(v, PROP_DOWN) };
            case OpKind::SetCheckConstraint: {
                OpSetCheckConstraint op;
                op.table = get_str(v, PROP_TABLE);
                op.column = get_str(v, PROP_COLUMN);
                if (jhlp::has(v, PROP_CHECK)) op.check = check_from(object_member(v, PROP_CHECK));
                op.up = get_opt(v, PROP_UP);
                op.down = get_opt(v, PROP_DOWN);
                return op;
            }
            case OpKind::SetForeignKey: {
                OpSetForeignKey op;
                op.table = get_str(v, PROP_TABLE);
                op.column = get_str(v, PROP_COLUMN);
                if (jhlp::has(v, PROP_REFERENCES)) op.references = fk_ref_from(object_member(v, PROP_REFERENCES));
                op.up = get_opt(v, PROP_UP);
                op.down = get_opt(v, PROP_DOWN);
                return op;
            }
            case OpKind::DropConstraint:
                return OpDropConstraint { get_str(v, PROP_TABLE), get_str(v, PROP_COLUMN), get_str(v, PROP_NAME),
                                          get_opt(v, PROP_UP), get_opt(v, PROP_DOWN) };
            case OpKind::RawSQL:
                return OpRawSQL { get_str(v, PROP_UP), get_opt(v, PROP_DOWN) };
        }
        throw std::runtime_error("unhandled operation kind");
    }

    /****************** required fields ******************/

    void require(strings& out, const std::string& field, const std::string& value) {
        if (value.empty()) out.push_back(field);
    }

    void require_column(strings& out, const std::string& prefix, const ColumnDef& c) {
        require(out, prefix + "name", c.name);
        require(out, prefix + "type", c.type);
        if (c.references) {
            require(out, prefix + "references.table", c.references->table);
            require(out, prefix + "references.column", c.references->column);
        }
        if (c.check) require(out, prefix + "check.constraint", c.check->constraint);
    }

    struct RequiredFields {
        strings& out;

        void operator()(const OpCreateTable& op) const {
            require(out, "name", op.name);
            if (op.columns.empty()) out.push_back("columns");
            for (std::size_t i = 0; i < op.columns.size(); ++i) {
                require_column(out, "columns[" + std::to_string(i) + "].", op.columns[i]);
            }
        }
        void operator()(const OpRenameTable& op) const {
            require(out, "from", op.from);
            require(out, "to", op.to);
        }
        void operator()(const OpDropTable& op) const { require(out, "name", op.name); }
        void operator()(const OpAddColumn& op) const {
            require(out, "table", op.table);
            require_column(out, "column.", op.column);
        }
        void operator()(const OpDropColumn& op) const {
            require(out, "table", op.table);
            require(out, "column", op.column);
        }
        void operator()(const OpRenameColumn& op) const {
            require(out, "table", op.table);
            require(out, "from", op.from);
            require(out, "to", op.to);
        }
        void operator()(const OpAlterColumn& op) const {
            require(out, "table", op.table);
            require(out, "column", op.column);
            if (!op.name && !op.type && !op.nullable) out.push_back("name|type|nullable");
        }
        void operator()(const OpCreateIndex& op) const {
            require(out, "name", op.name);
            require(out, "table", op.table);
            if (op.columns.empty()) out.push_back("columns");
        }
        void operator()(const OpDropIndex& op) const { require(out, "name", op.name); }
        void operator()(const OpSetNotNull& op) const {
            require(out, "table", op.table);
            require(out, "column", op.column);
        }
        void operator()(const OpSetUnique& op) const {
            require(out, "name", op.name);
            require(out, "table", op.table);
            require(out, "column", op.column);
        }
        void operator()(const OpSetCheckConstraint& op) const {
            require(out, "table", op.table);
            require(out, "column", op.column);
            require(out, "check.name", op.check.name);
            require(out, "check.constraint", op.check.constraint);
        }
        void operator()(const OpSetForeignKey& op) const {
            require(out, "table", op.table);
            require(out, "column", op.column);
            require(out, "references.name", op.references.name);
            require(out, "references.table", op.references.table);
            require(out, "references.column", op.references.column);
        }
        void operator()(const OpDropConstraint& op) const {
            require(out, "table", op.table);
            require(out, "column", op.column);
            require(out, "name", op.name);
        }
        void operator()(const OpRawSQL& op) const { require(out, "up", op.up); }
    };

} // namespace

std::string opkind(OpKind kind) {
    return kOpNames.at(static_cast<std::size_t>(kind));
}

std::optional<OpKind> opkind(const std::string& name) {
    for (std::size_t i = 0; i < kOpNames.size(); ++i) {
        if (name == kOpNames[i]) return static_cast<OpKind>(i);
    }
    return std::nullopt;
}

OpKind kind_of(const Operation& op) {
    return static_cast<OpKind>(op.index());
}

std::vector<std::string> missing_fields(const Operation& op) {
    strings out;
    std::visit(RequiredFields { out }, op);
    return out;
}

jval operation_to_json(const Operation& op, jalloc& a) {
    jval payload = std::visit(PayloadWriter { a }, op);
    jval v(json::kObjectType);
    jhlp::set(v, opkind(kind_of(op)), payload, a);
    return v;
}

Operation operation_from_json(const jval& value) {
    if (!value.IsObject() || value.MemberCount() != 1) {
        throw std::runtime_error("operation must be an object with exactly one kind");
    }
    const auto& m = *value.MemberBegin();
    std::string name(m.name.GetString(), m.name.GetStringLength());
    auto kind = opkind(name);
    if (!kind) throw std::runtime_error("unknown operation kind '" + name + "'");
    if (!m.value.IsObject()) throw std::runtime_error("payload of '" + name + "' must be an object");
    return payload_from(*kind, m.value);
}

std::vector<std::string> Migration::validate() const {
    strings problems;
    if (name.empty()) problems.push_back("migration has no name");
    if (operations.empty()) problems.push_back("migration has no operations");
    for (std::size_t i = 0; i < operations.size(); ++i) {
        auto missing = missing_fields(operations[i]);
        if (!missing.empty()) {
            problems.push_back("operation " + std::to_string(i) + " (" + opkind(kind_of(operations[i]))
                               + ") is missing " + join(missing));
        }
    }
    return problems;
}

jval Migration::to_json(jalloc& a) const {
    jval v(json::kObjectType);
    jhlp::set(v, PROP_NAME, name, a);
    jval ops(json::kArrayType);
    for (const auto& op : operations) ops.PushBack(operation_to_json(op, a), a);
    jhlp::set(v, PROP_OPERATIONS, ops, a);
    return v;
}

std::string Migration::to_json() const {
    jdoc doc;
    jval v = to_json(doc.GetAllocator());
    return jhlp::stringify(v);
}

Migration Migration::from_json(const jval& value) {
    if (!value.IsObject()) throw std::runtime_error("migration must be a JSON object");
    Migration m;
    m.name = get_str(value, PROP_NAME);
    if (const jval* ops = jhlp::member(value, PROP_OPERATIONS)) {
        if (!ops->IsArray()) throw std::runtime_error("migration.operations must be an array");
        for (const auto& op : ops->GetArray()) m.operations.push_back(operation_from_json(op));
    }
    return m;
}

Migration Migration::from_json(const std::string& text) {
    jdoc doc;
    if (!jhlp::parse_str(text, doc)) throw std::runtime_error("migration is not valid JSON");
    return from_json(doc);
}

Migration Migration::from_file(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) throw std::runtime_error("cannot read migration file " + path);
    return from_json(doc);
}

std::string status_name(MigrationStatus status) {
    return kStatusNames.at(static_cast<std::size_t>(status));
}

std::optional<MigrationStatus> parse_status(const std::string& name) {
    for (std::size_t i = 0; i < kStatusNames.size(); ++i) {
        if (name == kStatusNames[i]) return static_cast<MigrationStatus>(i);
    }
    return std::nullopt;
}

jval MigrationRecord::to_json(jalloc& a) const {
    jval v(json::kObjectType);
    jhlp::set(v, "id", id, a);
    jhlp::set(v, "schema", schema_name, a);
    jhlp::set(v, PROP_NAME, migration.name, a);
    if (parent) jhlp::set(v, "parent", *parent, a);
    else v.AddMember("parent", jval(json::kNullType), a);
    jhlp::set(v, "status", status_name(status), a);
    jval m = migration.to_json(a);
    jhlp::set(v, "migration", m, a);
    jval started = started_schema.to_json(a);
    jhlp::set(v, "startedSchema", started, a);
    if (completed_schema) {
        jval completed = completed_schema->to_json(a);
        jhlp::set(v, "completedSchema", completed, a);
    } else {
        v.AddMember("completedSchema", jval(json::kNullType), a);
    }
    jhlp::set(v, "createdAt", created_at, a);
    jhlp::set(v, "updatedAt", updated_at, a);
    return v;
}

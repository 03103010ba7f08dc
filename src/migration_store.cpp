#include "migration_store.hpp"
#include "logger.hpp"

namespace {

    std::string text(const jval& row, const char* key) {
        return jhlp::get<std::string>(row, key);
    }

    std::optional<std::string> opt_text(const jval& row, const char* key) {
        const jval* v = jhlp::member(row, key);
        if (!v || v->IsNull()) return std::nullopt;
        return std::string(v->GetString(), v->GetStringLength());
    }

    // The name index rejects a reused migration name; the active index a second in-progress row.
    // Postgres reports the index name, SQLite the indexed columns.
    bool name_taken(const DbError& e) {
        const std::string& c = e.constraint();
        if (!c.empty()) return c.find("unique_name") != std::string::npos;
        return std::string(e.what()).find(".name") != std::string::npos;
    }

} // namespace

MigrationStore::MigrationStore(Dialect dialect, std::string state_schema)
    : sql_(make_store_sql(dialect, state_schema)) {}

void MigrationStore::rollback_quietly(SQLConnection& conn) {
    try {
        conn.rollback();
    } catch (const std::exception& e) {
        LOG_ERROR("MigrationStore: rollback failed: {}", e.what());
    }
}

void MigrationStore::apply_deadline(const Context& ctx, SQLConnection& conn) const {
    if (!ctx.has_deadline()) return;
    std::string stmt = sql_->statement_timeout(ctx.remaining());
    if (!stmt.empty()) conn.execute(stmt);
}

jdoc MigrationStore::run(const Context& ctx, SQLConnection& conn, const char* op, const std::string& schema_name,
                         const std::string& sql, const Params& params) {
    ctx.check(op, schema_name);
    auto stmt = conn.prepare(sql);
    for (std::size_t i = 0; i < params.size(); ++i) {
        stmt->bind_opt(static_cast<int>(i) + 1, params[i]);
    }
    return stmt->query();
}

std::vector<MigrationRecord> MigrationStore::query(const Context& ctx, SQLConnection& conn, const char* op,
                                                   const std::string& schema_name, const std::string& sql,
                                                   const Params& params) {
    jdoc rows;
    try {
        rows = run(ctx, conn, op, schema_name, sql, params);
    } catch (const DbError& e) {
        throw StoreError(op, schema_name, e.what());
    }
    std::vector<MigrationRecord> out;
    for (const auto& row : rows.GetArray()) out.push_back(decode(row, op, schema_name));
    return out;
}

MigrationRecord MigrationStore::decode(const jval& row, const char* op, const std::string& schema_name) const {
    MigrationRecord r;
    try {
        r.id = std::stoll(text(row, "id"));
        r.schema_name = text(row, "schema_name");
        r.migration = Migration::from_json(text(row, "migration"));
    } catch (const std::exception& e) {
        throw StoreError(op, schema_name, std::string("corrupt migration record: ") + e.what());
    }
    r.parent = opt_text(row, "parent");

    auto status = parse_status(text(row, "status"));
    if (!status) throw StoreError(op, schema_name, "unknown migration status '" + text(row, "status") + "'");
    r.status = *status;

    if (!schema::Schema::from_json(text(row, "started_schema"), r.started_schema)) {
        throw StoreError(op, schema_name, "cannot decode started schema of record " + std::to_string(r.id));
    }
    if (auto completed = opt_text(row, "completed_schema")) {
        schema::Schema s;
        if (!schema::Schema::from_json(*completed, s)) {
            throw StoreError(op, schema_name, "cannot decode completed schema of record " + std::to_string(r.id));
        }
        r.completed_schema = std::move(s);
    }
    r.created_at = text(row, "created_at");
    r.updated_at = text(row, "updated_at");
    return r;
}

void MigrationStore::init(const Context& ctx, SQLConnection& conn) {
    ctx.check("init", "");
    try {
        with_tx(ctx, conn, [&]() {
            for (const auto& stmt : sql_->init_statements()) {
                ctx.check("init", "");
                conn.execute(stmt);
            }
        });
    } catch (const DbError& e) {
        throw StoreError("init", "", e.what());
    }
    LOG_DEBUG("MigrationStore: tracking table {} ready", sql_->table());
}

bool MigrationStore::is_initialized(const Context& ctx, SQLConnection& conn) {
    try {
        return !run(ctx, conn, "is_initialized", "", sql_->is_initialized(), {}).Empty();
    } catch (const DbError& e) {
        throw StoreError("is_initialized", "", e.what());
    }
}

void MigrationStore::save(const Context& ctx, SQLConnection& conn, MigrationRecord& record) {
    const std::string& schema_name = record.schema_name;
    std::vector<MigrationRecord> rows;

    if (record.id == 0) {
        Params params {
            schema_name,
            record.migration.name,
            record.migration.to_json(),
            status_name(record.status),
            record.started_schema.to_json(),
        };
        try {
            rows = with_tx(ctx, conn, [&]() {
                jdoc res = run(ctx, conn, "save", schema_name, sql_->insert(), params);
                std::vector<MigrationRecord> out;
                for (const auto& row : res.GetArray()) out.push_back(decode(row, "save", schema_name));
                return out;
            });
        } catch (const DbError& e) {
            if (e.unique_violation()) {
                if (name_taken(e)) {
                    throw InvalidMigrationError("save", schema_name,
                        "migration name '" + record.migration.name + "' is already used");
                }
                LOG_WARN("MigrationStore: second in-progress record for '{}' rejected", schema_name);
                throw AlreadyActiveError("save", schema_name);
            }
            throw StoreError("save", schema_name, e.what());
        }
        if (rows.empty()) throw StoreError("save", schema_name, "insert returned no row");
    } else {
        Params params {
            status_name(record.status),
            record.completed_schema ? std::optional<std::string>(record.completed_schema->to_json()) : std::nullopt,
            std::to_string(record.id),
        };
        try {
            rows = with_tx(ctx, conn, [&]() { return query(ctx, conn, "save", schema_name, sql_->set_status(), params); });
        } catch (const DbError& e) {
            throw StoreError("save", schema_name, e.what());
        }
        if (rows.empty()) {
            throw NotFoundError("save", schema_name, "no in-progress record with id " + std::to_string(record.id));
        }
    }
    record = std::move(rows.front());
    LOG_DEBUG("MigrationStore: saved record {} ({}) for '{}'", record.id, status_name(record.status), schema_name);
}

std::optional<MigrationRecord> MigrationStore::latest(const Context& ctx, SQLConnection& conn, const std::string& schema_name) {
    auto rows = query(ctx, conn, "latest", schema_name, sql_->latest(), { schema_name });
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

MigrationRecord MigrationStore::set_status(const Context& ctx, SQLConnection& conn, const std::string& schema_name,
                                           MigrationStatus status, const std::optional<schema::Schema>& completed_schema) {
    if (status == MigrationStatus::InProgress) {
        throw StoreError("set_status", schema_name, "target status must be complete or rolled_back");
    }
    try {
        return with_tx(ctx, conn, [&]() {
            auto current = latest(ctx, conn, schema_name);
            if (!current || current->status != MigrationStatus::InProgress) {
                throw NotFoundError("set_status", schema_name, "no migration in progress");
            }
            current->status = status;
            current->completed_schema = status == MigrationStatus::Complete ? completed_schema : std::nullopt;
            save(ctx, conn, *current);
            return *current;
        });
    } catch (const DbError& e) {
        throw StoreError("set_status", schema_name, e.what());
    }
}

std::optional<MigrationRecord> MigrationStore::find(const Context& ctx, SQLConnection& conn,
                                                    const std::string& schema_name, const std::string& migration_name) {
    auto rows = query(ctx, conn, "find", schema_name, sql_->find(), { schema_name, migration_name });
    if (rows.empty()) return std::nullopt;
    return std::move(rows.front());
}

std::vector<MigrationRecord> MigrationStore::history(const Context& ctx, SQLConnection& conn, const std::string& schema_name) {
    return query(ctx, conn, "history", schema_name, sql_->history(), { schema_name });
}

std::optional<std::string> MigrationStore::latest_version(const Context& ctx, SQLConnection& conn, const std::string& schema_name) {
    auto rows = query(ctx, conn, "latest_version", schema_name, sql_->latest_complete(), { schema_name });
    if (rows.empty()) return std::nullopt;
    return rows.front().migration.name;
}

std::optional<std::string> MigrationStore::previous_version(const Context& ctx, SQLConnection& conn, const std::string& schema_name) {
    auto rows = query(ctx, conn, "previous_version", schema_name, sql_->latest_complete(), { schema_name });
    if (rows.empty()) return std::nullopt;
    return rows.front().parent;
}

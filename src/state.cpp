#include "state.hpp"
#include <stdexcept>
#include "logger.hpp"

State::State(std::shared_ptr<pool::IDbPool> pool, StateOptions options, std::unique_ptr<Introspector> introspector)
    : pool_(std::move(pool))
    , options_(std::move(options))
    , introspector_(std::move(introspector))
    , store_(options_.dialect, options_.state_schema)
    , guard_(store_) {
    if (!pool_) throw std::invalid_argument("State: null connection pool");
    if (!introspector_) throw std::invalid_argument("State: null introspector");
    if (pool_->dialect() != options_.dialect) {
        throw std::invalid_argument("State: pool dialect " + dialect_name(pool_->dialect())
                                    + " does not match configured dialect " + dialect_name(options_.dialect));
    }
}

void State::init(const Context& ctx) {
    with_conn(ctx, "init", "", pool::DbIntent::Write, [&](SQLConnection& conn) {
        store_.init(ctx, conn);
    });
    LOG_INFO("state store initialized in '{}'", options_.state_schema);
}

bool State::is_initialized(const Context& ctx) {
    return with_conn(ctx, "is_initialized", "", pool::DbIntent::Read, [&](SQLConnection& conn) {
        return store_.is_initialized(ctx, conn);
    });
}

schema::Schema State::start(const Context& ctx, const std::string& schema_name, const Migration& migration) {
    auto problems = migration.validate();
    if (!problems.empty()) {
        throw InvalidMigrationError("start", schema_name, join(problems, "; "));
    }
    if (schema_name.empty()) throw NotFoundError("start", schema_name, "schema name is empty");

    schema::Schema baseline;
    MigrationRecord record = with_conn(ctx, "start", schema_name, pool::DbIntent::Write, [&](SQLConnection& conn) {
        GuardLease lease = guard_.acquire(ctx, conn, schema_name);
        try {
            auto previous = store_.find(ctx, conn, schema_name, migration.name);
            if (previous && previous->status != MigrationStatus::RolledBack) {
                throw InvalidMigrationError("start", schema_name, "migration name '" + migration.name
                                            + "' is already used (" + status_name(previous->status) + ")");
            }

            baseline = introspector_->read_schema(ctx, conn, schema_name);

            MigrationRecord rec;
            rec.schema_name = schema_name;
            rec.migration = migration;
            rec.status = MigrationStatus::InProgress;
            rec.started_schema = baseline;
            store_.save(ctx, conn, rec);

            ctx.check("start", schema_name);
            lease.commit();
            return rec;
        } catch (const std::exception& e) {
            // a failed release replaces the original error with release_failed()
            if (lease.held()) LOG_WARN("start on schema '{}' failed, releasing the guard: {}", schema_name, e.what());
            lease.release();
            throw;
        }
    });

    LOG_INFO("migration '{}' started on schema '{}' (record {}, {} tables)",
             migration.name, schema_name, record.id, baseline.tables.size());
    if (on_start_) on_start_(schema_name, record);
    return baseline;
}

schema::Schema State::complete(const Context& ctx, const std::string& schema_name) {
    schema::Schema current;
    MigrationRecord record = with_conn(ctx, "complete", schema_name, pool::DbIntent::Write, [&](SQLConnection& conn) {
        return store_.with_tx(ctx, conn, [&]() {
            auto active = store_.latest(ctx, conn, schema_name);
            if (!active || active->status != MigrationStatus::InProgress) {
                throw NotFoundError("complete", schema_name, "no migration in progress");
            }
            current = introspector_->read_schema(ctx, conn, schema_name);
            return store_.set_status(ctx, conn, schema_name, MigrationStatus::Complete, current);
        });
    });

    LOG_INFO("migration '{}' completed on schema '{}'", record.migration.name, schema_name);
    if (on_complete_) on_complete_(schema_name, record);
    return current;
}

void State::rollback(const Context& ctx, const std::string& schema_name) {
    MigrationRecord record = with_conn(ctx, "rollback", schema_name, pool::DbIntent::Write, [&](SQLConnection& conn) {
        return store_.with_tx(ctx, conn, [&]() {
            auto active = store_.latest(ctx, conn, schema_name);
            if (!active || active->status != MigrationStatus::InProgress) {
                throw NotFoundError("rollback", schema_name, "no migration in progress");
            }
            return store_.set_status(ctx, conn, schema_name, MigrationStatus::RolledBack, std::nullopt);
        });
    });

    LOG_INFO("migration '{}' rolled back on schema '{}'", record.migration.name, schema_name);
    if (on_rollback_) on_rollback_(schema_name, record);
}

schema::Schema State::read_schema(const Context& ctx, const std::string& schema_name) {
    if (schema_name.empty()) throw NotFoundError("read_schema", schema_name, "schema name is empty");
    return with_conn(ctx, "read_schema", schema_name, pool::DbIntent::Read, [&](SQLConnection& conn) {
        return introspector_->read_schema(ctx, conn, schema_name);
    });
}

std::optional<MigrationRecord> State::active_migration(const Context& ctx, const std::string& schema_name) {
    return with_conn(ctx, "active_migration", schema_name, pool::DbIntent::Read, [&](SQLConnection& conn) {
        auto latest = store_.latest(ctx, conn, schema_name);
        if (latest && latest->status != MigrationStatus::InProgress) latest.reset();
        return latest;
    });
}

std::optional<std::string> State::latest_version(const Context& ctx, const std::string& schema_name) {
    return with_conn(ctx, "latest_version", schema_name, pool::DbIntent::Read, [&](SQLConnection& conn) {
        return store_.latest_version(ctx, conn, schema_name);
    });
}

std::optional<std::string> State::previous_version(const Context& ctx, const std::string& schema_name) {
    return with_conn(ctx, "previous_version", schema_name, pool::DbIntent::Read, [&](SQLConnection& conn) {
        return store_.previous_version(ctx, conn, schema_name);
    });
}

std::vector<MigrationRecord> State::history(const Context& ctx, const std::string& schema_name) {
    return with_conn(ctx, "history", schema_name, pool::DbIntent::Read, [&](SQLConnection& conn) {
        return store_.history(ctx, conn, schema_name);
    });
}

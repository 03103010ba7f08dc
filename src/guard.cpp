#include "guard.hpp"
#include "logger.hpp"

GuardLease::~GuardLease() {
    if (!conn_) return;
    try {
        release();
    } catch (const StoreError& e) {
        LOG_CRITICAL("guard of schema '{}' dropped with a failed release: {}", schema_, e.what());
    }
}

void GuardLease::commit() {
    if (!conn_) throw StoreError("commit", schema_, "guard is not held");
    try {
        conn_->commit();
    } catch (const DbError& e) {
        LOG_ERROR("guard of schema '{}': commit failed: {}", schema_, e.what());
        release();
        throw StoreError("commit", schema_, e.what());
    }
    conn_ = nullptr;
}

void GuardLease::release() {
    if (!conn_) return;
    SQLConnection* conn = conn_;
    conn_ = nullptr;
    try {
        conn->rollback();
    } catch (const DbError& e) {
        // closing the session is the only way left to end the transaction and its locks
        conn->disconnect();
        LOG_CRITICAL("guard of schema '{}' could not be released, connection closed: {}", schema_, e.what());
        throw StoreError("release", schema_, std::string("guard release failed: ") + e.what(), true);
    }
}

GuardLease ConcurrencyGuard::acquire(const Context& ctx, SQLConnection& conn, const std::string& schema_name) {
    ctx.check("acquire", schema_name);
    if (conn.in_transaction()) {
        throw StoreError("acquire", schema_name, "connection already has an open transaction");
    }
    try {
        conn.begin();
    } catch (const DbError& e) {
        throw StoreError("acquire", schema_name, e.what());
    }
    GuardLease lease(&conn, schema_name);

    try {
        store_.apply_deadline(ctx, conn);

        const std::string lock_sql = store_.sql().try_lock();
        if (!lock_sql.empty()) {
            ctx.check("acquire", schema_name);
            auto stmt = conn.prepare(lock_sql);
            stmt->bind(1, schema_name);
            jdoc rows = stmt->query();
            std::string locked = rows.Empty() ? "" : jhlp::get<std::string>(rows[0u], "locked");
            if (locked != "t" && locked != "true") {
                // the key is a 32-bit hash and may be shared with another schema;
                // the in-progress check and only_one_active decide
                LOG_DEBUG("advisory lock of schema '{}' is contended, checking the store", schema_name);
            }
        }
    } catch (const DbError& e) {
        throw StoreError("acquire", schema_name, e.what());
    }

    auto latest = store_.latest(ctx, conn, schema_name);
    if (latest && latest->status == MigrationStatus::InProgress) {
        LOG_WARN("migration '{}' is already in progress on schema '{}'", latest->migration.name, schema_name);
        throw AlreadyActiveError("acquire", schema_name);
    }
    return lease;
}

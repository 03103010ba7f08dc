#pragma once
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "context.hpp"
#include "migration.hpp"
#include "sqlconnection.hpp"
#include "store_sql.hpp"

/**
 * Durable history of migrations, one row per attempt.
 *
 * Every method runs on the connection it is given. A method opens and commits
 * its own transaction unless the connection is already inside one; then it
 * joins it and the caller decides the outcome. Driver failures surface as
 * StoreError; nothing is retried here.
 */
class MigrationStore {
public:
    MigrationStore(Dialect dialect, std::string state_schema);

    /**
     * @brief Provision the tracking table and its indexes.
     *
     * Idempotent: every statement is CREATE ... IF NOT EXISTS. On Postgres the
     * statements run under a transaction-scoped advisory lock so concurrent
     * callers do not collide in the catalog.
     */
    void init(const Context& ctx, SQLConnection& conn);

    bool is_initialized(const Context& ctx, SQLConnection& conn);

    /**
     * @brief Persist a record.
     *
     * A record with id 0 is inserted: id, parent and timestamps are filled in
     * from the stored row. Otherwise the stored in-progress row with that id gets
     * the record's status and completed schema.
     *
     * Throws AlreadyActiveError when the insert would create a second in-progress
     * record for the schema, InvalidMigrationError when the name is taken by a
     * migration that was not rolled back, NotFoundError when the update finds
     * no in-progress row.
     */
    void save(const Context& ctx, SQLConnection& conn, MigrationRecord& record);

    // Most recent record of the schema, whatever its status.
    std::optional<MigrationRecord> latest(const Context& ctx, SQLConnection& conn, const std::string& schema_name);

    /**
     * @brief Move the in-progress record of a schema to a terminal status.
     *
     * @param status Complete or RolledBack.
     * @param completed_schema stored with Complete, ignored otherwise.
     * @return the updated record.
     * @throws NotFoundError if the schema has no in-progress record.
     */
    MigrationRecord set_status(const Context& ctx, SQLConnection& conn, const std::string& schema_name,
                               MigrationStatus status, const std::optional<schema::Schema>& completed_schema);

    // Latest record with that migration name.
    std::optional<MigrationRecord> find(const Context& ctx, SQLConnection& conn,
                                        const std::string& schema_name, const std::string& migration_name);

    // Oldest first.
    std::vector<MigrationRecord> history(const Context& ctx, SQLConnection& conn, const std::string& schema_name);

    // Name of the latest completed migration.
    std::optional<std::string> latest_version(const Context& ctx, SQLConnection& conn, const std::string& schema_name);

    // Parent of the latest completed migration.
    std::optional<std::string> previous_version(const Context& ctx, SQLConnection& conn, const std::string& schema_name);

    const StoreSQL& sql() const { return *sql_; }

    // Pushes the context deadline into the open transaction where the dialect supports it.
    void apply_deadline(const Context& ctx, SQLConnection& conn) const;

    // Runs fn inside a transaction on conn, joining one that is already open.
    template <class F>
    auto with_tx(const Context& ctx, SQLConnection& conn, F&& fn) -> std::invoke_result_t<F> {
        if (conn.in_transaction()) return std::forward<F>(fn)();

        conn.begin();
        try {
            apply_deadline(ctx, conn);
            if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
                std::forward<F>(fn)();
                conn.commit();
            } else {
                auto result = std::forward<F>(fn)();
                conn.commit();
                return result;
            }
        } catch (...) {
            rollback_quietly(conn);
            throw;
        }
    }

private:
    static void rollback_quietly(SQLConnection& conn);

    using Params = std::vector<std::optional<std::string>>;

    // Raw rows; DbError passes through.
    jdoc run(const Context& ctx, SQLConnection& conn, const char* op, const std::string& schema_name,
             const std::string& sql, const Params& params);
    // Decoded records; DbError becomes StoreError.
    std::vector<MigrationRecord> query(const Context& ctx, SQLConnection& conn, const char* op,
                                       const std::string& schema_name, const std::string& sql,
                                       const Params& params);
    MigrationRecord decode(const jval& row, const char* op, const std::string& schema_name) const;

    std::unique_ptr<StoreSQL> sql_;
};

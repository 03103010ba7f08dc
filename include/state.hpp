#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "context.hpp"
#include "dbpool.hpp"
#include "guard.hpp"
#include "introspector.hpp"
#include "migration.hpp"
#include "migration_store.hpp"

using namespace std::literals::chrono_literals;

struct StateOptions {
    Dialect dialect = Dialect::Postgres;
    std::string state_schema = "pgshift";          // namespace of the tracking objects
    std::chrono::milliseconds acquire_timeout { 1500 }; // upper bound on waiting for a pooled connection
};

/**
 * Migration lifecycle of logical schemas:
 * no active migration -> in_progress -> complete | rolled_back.
 *
 * The engine never executes a migration's DDL. start() hands the baseline to
 * the caller, who applies the operations and then calls complete() or
 * rollback(). Between the two the in-progress record keeps any other start()
 * on that schema out.
 *
 * Thread-safe as long as the pool is; every call takes its own connection.
 */
class State {
public:
    // Invoked after the transition is committed; exceptions reach the caller unchanged.
    using Hook = std::function<void(const std::string& schema_name, const MigrationRecord& record)>;

    State(std::shared_ptr<pool::IDbPool> pool,
          StateOptions options = {},
          std::unique_ptr<Introspector> introspector = std::make_unique<PgIntrospector>());

    // Provision the store. Calling it again is a no-op.
    void init(const Context& ctx);
    bool is_initialized(const Context& ctx);

    /**
     * @brief Begin a migration on a schema.
     *
     * This method performs the following steps:
     * 1. reject a migration without a name, without operations or with
     *    incomplete operations (InvalidMigrationError)
     * 2. take the concurrency guard of the schema (AlreadyActiveError)
     * 3. reject a name already used by a migration that was not rolled back
     * 4. read the live schema as the baseline
     * 5. persist an in-progress record with that baseline
     * 6. commit, which releases the guard's lock
     *
     * Steps 2 to 6 share one transaction: a failure or a crash before step 6
     * leaves no record and the schema free.
     *
     * @return the baseline schema.
     */
    schema::Schema start(const Context& ctx, const std::string& schema_name, const Migration& migration);

    /**
     * @brief Finish the in-progress migration of a schema.
     *
     * Re-reads the live schema and stores it as the completed schema in the same
     * transaction as the status change.
     *
     * @return the schema after the migration.
     * @throws NotFoundError if no migration is in progress.
     */
    schema::Schema complete(const Context& ctx, const std::string& schema_name);

    // Records the in-progress migration as rolled back. Undoing its DDL is up to the caller.
    void rollback(const Context& ctx, const std::string& schema_name);

    // Live schema, independent of migration status.
    schema::Schema read_schema(const Context& ctx, const std::string& schema_name);

    std::optional<MigrationRecord> active_migration(const Context& ctx, const std::string& schema_name);
    std::optional<std::string> latest_version(const Context& ctx, const std::string& schema_name);
    std::optional<std::string> previous_version(const Context& ctx, const std::string& schema_name);
    std::vector<MigrationRecord> history(const Context& ctx, const std::string& schema_name);

    void set_on_start(Hook hook) { on_start_ = std::move(hook); }
    void set_on_complete(Hook hook) { on_complete_ = std::move(hook); }
    void set_on_rollback(Hook hook) { on_rollback_ = std::move(hook); }

    const StateOptions& options() const { return options_; }

private:
    // Runs fn with a pooled connection. Pool failures and stray driver errors become StoreError.
    template <class F>
    auto with_conn(const Context& ctx, const char* op, const std::string& schema_name,
                   pool::DbIntent intent, F&& fn) -> std::invoke_result_t<F, SQLConnection&> {
        ctx.check(op, schema_name);
        auto wait = std::max(ctx.bound(options_.acquire_timeout), 1ms);
        auto ac = pool_->acquire(intent, wait);
        if (!ac.ok) {
            ctx.check(op, schema_name);
            LOG_ERROR("{} '{}': no database connection: {}", op, schema_name,
                      ac.error == pool::PoolAcquireError::Shutdown ? "pool shut down" : "timeout");
            throw StoreError(op, schema_name, ac.error == pool::PoolAcquireError::Shutdown
                ? "connection pool is shut down"
                : "no database connection available within " + std::to_string(wait.count()) + " ms");
        }
        auto& lease = ac.lease; // keep lease alive for the whole call
        try {
            return std::forward<F>(fn)(lease.conn());
        } catch (const DbError& e) {
            LOG_ERROR("{} '{}' failed: {}", op, schema_name, e.what());
            throw StoreError(op, schema_name, e.what());
        }
    }

    std::shared_ptr<pool::IDbPool> pool_;
    StateOptions options_;
    std::unique_ptr<Introspector> introspector_;
    MigrationStore store_;
    ConcurrencyGuard guard_;

    Hook on_start_;
    Hook on_complete_;
    Hook on_rollback_;
};

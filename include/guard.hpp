#pragma once
#include <string>
#include "context.hpp"
#include "migration_store.hpp"
#include "sqlconnection.hpp"

/**
 * Exclusive right to start a migration on one schema.
 *
 * Holds the transaction opened by ConcurrencyGuard::acquire. commit() makes the
 * work done under it durable; release() or destruction without commit() rolls
 * it back. Either way the lease ends and the connection is left without a
 * transaction.
 */
class GuardLease {
public:
    GuardLease(SQLConnection* conn, std::string schema_name)
        : conn_(conn), schema_(std::move(schema_name)) {}

    GuardLease(const GuardLease&) = delete;
    GuardLease& operator=(const GuardLease&) = delete;

    GuardLease(GuardLease&& other) noexcept
        : conn_(other.conn_), schema_(std::move(other.schema_)) { other.conn_ = nullptr; }
    GuardLease& operator=(GuardLease&& other) = delete;

    ~GuardLease();

    // Throws StoreError; the lease is released before it does.
    void commit();

    // Throws StoreError with release_failed() when the rollback fails; the connection is closed then.
    void release();

    bool held() const { return conn_ != nullptr; }
    const std::string& schema_name() const { return schema_; }

private:
    SQLConnection* conn_;
    std::string schema_;
};

class ConcurrencyGuard {
public:
    explicit ConcurrencyGuard(MigrationStore& store) : store_(store) {}

    /**
     * @brief Take the guard for a schema on conn.
     *
     * Opens a transaction on conn (which must not have one) and, inside it:
     * 1. on Postgres, tries the schema's transaction-scoped advisory lock. A
     *    contended lock is not a conflict by itself (the key is a hash shared
     *    with other schemas); the unique index only_one_active rejects a second
     *    in-progress row when two Starts on one schema pass step 2 together.
     *    SQLite's write-reserving BEGIN already serializes writers;
     * 2. reads the latest record of the schema and fails if it is in progress.
     *
     * @throws AlreadyActiveError on conflict, StoreError, CancelledError.
     */
    GuardLease acquire(const Context& ctx, SQLConnection& conn, const std::string& schema_name);

private:
    MigrationStore& store_;
};

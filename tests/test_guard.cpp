#include <catch2/catch.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include "fixtures.hpp"
#include "guard.hpp"

namespace {

struct GuardFixture {
    std::shared_ptr<Faults> faults = std::make_shared<Faults>();
    FaultyConnection conn { make_sqlite_connection(), faults };
    MigrationStore store { Dialect::SQLite, "pgshift" };
    ConcurrencyGuard guard { store };
    Context ctx;

    GuardFixture() {
        conn.connect(":memory:");
        store.init(ctx, conn);
    }

    void insert_in_progress(const std::string& schema_name) {
        MigrationRecord r;
        r.schema_name = schema_name;
        r.migration = sample_migration();
        r.started_schema = sample_schema(schema_name);
        store.save(ctx, conn, r);
    }
};

}

TEST_CASE("Guard on a free schema holds a transaction until released", "[guard]")
{
    GuardFixture f;
    {
        GuardLease lease = f.guard.acquire(f.ctx, f.conn, "public");
        CHECK(lease.held());
        CHECK(lease.schema_name() == "public");
        CHECK(f.conn.in_transaction());
    }
    CHECK_FALSE(f.conn.in_transaction());
}

TEST_CASE("Guard refuses a schema with a migration in progress", "[guard]")
{
    GuardFixture f;
    f.insert_in_progress("public");

    CHECK_THROWS_AS(f.guard.acquire(f.ctx, f.conn, "public"), AlreadyActiveError);
    CHECK_FALSE(f.conn.in_transaction());

    GuardLease other = f.guard.acquire(f.ctx, f.conn, "billing");
    CHECK(other.held());
    other.release();
    CHECK_FALSE(other.held());
    CHECK_FALSE(f.conn.in_transaction());
}

TEST_CASE("Committed work under the guard is durable, released work is not", "[guard]")
{
    GuardFixture f;
    {
        GuardLease lease = f.guard.acquire(f.ctx, f.conn, "public");
        f.insert_in_progress("public");
        lease.release();
    }
    CHECK_FALSE(f.store.latest(f.ctx, f.conn, "public").has_value());

    {
        GuardLease lease = f.guard.acquire(f.ctx, f.conn, "public");
        f.insert_in_progress("public");
        lease.commit();
        CHECK_FALSE(lease.held());
    }
    REQUIRE(f.store.latest(f.ctx, f.conn, "public").has_value());
    CHECK_THROWS_AS(f.guard.acquire(f.ctx, f.conn, "public"), AlreadyActiveError);
}

TEST_CASE("Guard needs a connection without a transaction", "[guard]")
{
    GuardFixture f;
    f.conn.begin();
    CHECK_THROWS_AS(f.guard.acquire(f.ctx, f.conn, "public"), StoreError);
    f.conn.rollback();
}

TEST_CASE("Failed release is reported as release_failed", "[guard][errors]")
{
    GuardFixture f;
    GuardLease lease = f.guard.acquire(f.ctx, f.conn, "public");
    f.faults->fail_rollback = true;

    try {
        lease.release();
        FAIL("expected StoreError");
    } catch (const StoreError& e) {
        CHECK(e.release_failed());
        CHECK(e.schema_name() == "public");
    }
    CHECK_FALSE(lease.held());
    CHECK_FALSE(f.conn.connected());
    CHECK_FALSE(f.conn.in_transaction());
    f.faults->fail_rollback = false;
}

TEST_CASE("Failed commit releases the guard", "[guard][errors]")
{
    GuardFixture f;
    GuardLease lease = f.guard.acquire(f.ctx, f.conn, "public");
    f.insert_in_progress("public");
    f.faults->fail_commit = true;

    try {
        lease.commit();
        FAIL("expected StoreError");
    } catch (const StoreError& e) {
        CHECK_FALSE(e.release_failed());
    }
    f.faults->fail_commit = false;
    CHECK_FALSE(f.conn.in_transaction());
    CHECK_FALSE(f.store.latest(f.ctx, f.conn, "public").has_value());
}

TEST_CASE("Cancelled context does not take the guard", "[guard][cancel]")
{
    GuardFixture f;
    Context cancelled;
    cancelled.cancel();
    CHECK_THROWS_AS(f.guard.acquire(cancelled, f.conn, "public"), CancelledError);
    CHECK_FALSE(f.conn.in_transaction());
}

TEST_CASE("Guard serializes writers on a shared database file", "[guard][concurrency]")
{
    TempDbFile db;
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    {
        auto setup = make_sqlite_connection();
        setup->connect(db.path);
        store.init(ctx, *setup);
    }

    constexpr int kThreads = 4;
    std::atomic<int> acquired { 0 };
    std::atomic<int> refused { 0 };
    std::atomic<int> failed { 0 };
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            try {
                auto conn = make_sqlite_connection();
                conn->connect(db.path);
                GuardLease lease = ConcurrencyGuard(store).acquire(ctx, *conn, "public");
                MigrationRecord r;
                r.schema_name = "public";
                r.migration = sample_migration();
                r.started_schema = sample_schema();
                store.save(ctx, *conn, r);
                lease.commit();
                ++acquired;
            } catch (const AlreadyActiveError&) {
                ++refused;
            } catch (const std::exception&) {
                ++failed;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(acquired.load() == 1);
    CHECK(refused.load() == kThreads - 1);
    CHECK(failed.load() == 0);
}

TEST_CASE("Contended advisory lock falls back to the in-progress check", "[guard][pg]")
{
    MigrationStore store(Dialect::Postgres, "pgshift");
    ConcurrencyGuard guard(store);
    Context ctx;
    FakeSQLConnection conn(Dialect::Postgres);
    conn.connect("fake");
    // another schema whose name hashes to the same key holds the lock
    conn.on_query(store.sql().try_lock(), R"([{"locked": "f"}])");

    GuardLease lease = guard.acquire(ctx, conn, "billing");
    CHECK(lease.held());
    REQUIRE(conn.executed.size() == 2);
    CHECK(conn.executed[0].sql == store.sql().try_lock());
    CHECK(conn.executed[1].sql == store.sql().latest());
    CHECK(conn.executed[1].binds.at(1) == std::optional<std::string>("billing"));

    lease.release();
    CHECK(conn.rollbacks == 1);
    CHECK_FALSE(conn.in_transaction());
}

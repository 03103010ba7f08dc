#include <catch2/catch.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "fixtures.hpp"
#include "state.hpp"

namespace {

schema::Schema with_phone(const std::string& name = "public") {
    schema::Schema s = sample_schema(name);
    s.tables["users"].columns["phone"] = { "phone", "text", true, false };
    return s;
}

}

TEST_CASE("Start, complete and the version trail", "[state][lifecycle]")
{
    StateFixture f;

    schema::Schema baseline = f.state->start(f.ctx, "public", sample_migration("01_add_phone"));
    CHECK(baseline == sample_schema());
    // the caller gets the live oids back, the stored snapshot does not keep them
    CHECK(baseline.table("users")->oid == "16384");

    auto active = f.state->active_migration(f.ctx, "public");
    REQUIRE(active);
    CHECK(active->migration.name == "01_add_phone");
    CHECK(active->status == MigrationStatus::InProgress);
    CHECK(active->started_schema == sample_schema());
    CHECK(active->started_schema.table("users")->oid.empty());
    CHECK_FALSE(f.state->latest_version(f.ctx, "public").has_value());

    (*f.catalog)["public"] = with_phone();
    schema::Schema after = f.state->complete(f.ctx, "public");
    CHECK(after == with_phone());
    CHECK_FALSE(f.state->active_migration(f.ctx, "public").has_value());
    CHECK(f.state->latest_version(f.ctx, "public") == std::optional<std::string>("01_add_phone"));
    CHECK_FALSE(f.state->previous_version(f.ctx, "public").has_value());

    f.state->start(f.ctx, "public", sample_migration("02_more"));
    f.state->complete(f.ctx, "public");
    CHECK(f.state->latest_version(f.ctx, "public") == std::optional<std::string>("02_more"));
    CHECK(f.state->previous_version(f.ctx, "public") == std::optional<std::string>("01_add_phone"));

    auto history = f.state->history(f.ctx, "public");
    REQUIRE(history.size() == 2);
    CHECK(history[0].migration.name == "01_add_phone");
    REQUIRE(history[0].completed_schema);
    CHECK(*history[0].completed_schema == with_phone());
    CHECK(history[1].parent == std::optional<std::string>("01_add_phone"));
    CHECK(f.state->history(f.ctx, "billing").empty());
}

TEST_CASE("Second start on a busy schema is refused", "[state][guard]")
{
    StateFixture f;
    (*f.catalog)["billing"] = sample_schema("billing");

    f.state->start(f.ctx, "public", sample_migration("01_a"));
    try {
        f.state->start(f.ctx, "public", sample_migration("02_b"));
        FAIL("expected AlreadyActiveError");
    } catch (const AlreadyActiveError& e) {
        CHECK(e.schema_name() == "public");
    }
    CHECK(f.state->active_migration(f.ctx, "public")->migration.name == "01_a");

    // other schemas are unaffected
    CHECK_NOTHROW(f.state->start(f.ctx, "billing", sample_migration("02_b")));

    f.state->rollback(f.ctx, "public");
    CHECK_NOTHROW(f.state->start(f.ctx, "public", sample_migration("02_b")));
}

TEST_CASE("Invalid migrations are rejected before touching the store", "[state][validate]")
{
    StateFixture f;

    Migration empty;
    empty.name = "01_empty";
    CHECK_THROWS_AS(f.state->start(f.ctx, "public", empty), InvalidMigrationError);
    CHECK_THROWS_AS(f.state->start(f.ctx, "public", sample_migration("")), InvalidMigrationError);
    CHECK(f.introspector->calls.load() == 0);
    CHECK(f.state->history(f.ctx, "public").empty());
}

TEST_CASE("Migration names cannot be reused unless rolled back", "[state][names]")
{
    StateFixture f;

    f.state->start(f.ctx, "public", sample_migration("01_a"));
    f.state->complete(f.ctx, "public");
    CHECK_THROWS_AS(f.state->start(f.ctx, "public", sample_migration("01_a")), InvalidMigrationError);
    CHECK_FALSE(f.state->active_migration(f.ctx, "public").has_value());

    f.state->start(f.ctx, "public", sample_migration("02_b"));
    f.state->rollback(f.ctx, "public");
    CHECK_NOTHROW(f.state->start(f.ctx, "public", sample_migration("02_b")));
    CHECK(f.state->history(f.ctx, "public").size() == 3);
}

TEST_CASE("Complete and rollback need a migration in progress", "[state][lifecycle]")
{
    StateFixture f;

    CHECK_THROWS_AS(f.state->complete(f.ctx, "public"), NotFoundError);
    CHECK_THROWS_AS(f.state->rollback(f.ctx, "public"), NotFoundError);

    f.state->start(f.ctx, "public", sample_migration("01_a"));
    f.state->rollback(f.ctx, "public");
    CHECK_THROWS_AS(f.state->rollback(f.ctx, "public"), NotFoundError);
    CHECK_THROWS_AS(f.state->complete(f.ctx, "public"), NotFoundError);

    auto history = f.state->history(f.ctx, "public");
    REQUIRE(history.size() == 1);
    CHECK(history[0].status == MigrationStatus::RolledBack);
    CHECK_FALSE(history[0].completed_schema.has_value());
    CHECK_FALSE(f.state->latest_version(f.ctx, "public").has_value());
}

TEST_CASE("Unknown schema leaves no record", "[state][errors]")
{
    StateFixture f;

    CHECK_THROWS_AS(f.state->start(f.ctx, "missing", sample_migration()), NotFoundError);
    CHECK_THROWS_AS(f.state->start(f.ctx, "", sample_migration()), NotFoundError);
    CHECK_THROWS_AS(f.state->read_schema(f.ctx, "missing"), NotFoundError);
    CHECK(f.state->history(f.ctx, "missing").empty());

    // the failed start released the guard
    (*f.catalog)["missing"] = sample_schema("missing");
    CHECK_NOTHROW(f.state->start(f.ctx, "missing", sample_migration()));
}

TEST_CASE("Store failure during start releases the guard", "[state][errors]")
{
    StateFixture f;

    f.faults->fail_on = "INSERT INTO";
    try {
        f.state->start(f.ctx, "public", sample_migration());
        FAIL("expected StoreError");
    } catch (const StoreError& e) {
        CHECK(e.operation() == "start");
        CHECK_FALSE(e.release_failed());
    }
    f.faults->fail_on.clear();

    CHECK_FALSE(f.state->active_migration(f.ctx, "public").has_value());
    CHECK_NOTHROW(f.state->start(f.ctx, "public", sample_migration()));
}

TEST_CASE("Failed guard release during start is reported", "[state][errors]")
{
    // a file database survives the pool replacing the closed connection
    TempDbFile db;
    StateFixture f(db.path, 1);

    f.faults->fail_on = "INSERT INTO";
    f.faults->fail_rollback = true;
    try {
        f.state->start(f.ctx, "public", sample_migration());
        FAIL("expected StoreError");
    } catch (const StoreError& e) {
        CHECK(e.release_failed());
        CHECK(e.schema_name() == "public");
    }
    f.faults->fail_on.clear();
    f.faults->fail_rollback = false;

    CHECK_FALSE(f.state->active_migration(f.ctx, "public").has_value());
    CHECK_NOTHROW(f.state->start(f.ctx, "public", sample_migration()));
}

TEST_CASE("Failed commit of complete keeps the migration in progress", "[state][errors]")
{
    StateFixture f;
    f.state->start(f.ctx, "public", sample_migration());

    f.faults->fail_commit = true;
    CHECK_THROWS_AS(f.state->complete(f.ctx, "public"), StoreError);
    f.faults->fail_commit = false;

    auto active = f.state->active_migration(f.ctx, "public");
    REQUIRE(active);
    CHECK(active->status == MigrationStatus::InProgress);
    CHECK_NOTHROW(f.state->complete(f.ctx, "public"));
}

TEST_CASE("Read schema is independent of migration status", "[state][read]")
{
    StateFixture f;
    CHECK(f.state->read_schema(f.ctx, "public") == sample_schema());

    f.state->start(f.ctx, "public", sample_migration());
    (*f.catalog)["public"] = with_phone();
    CHECK(f.state->read_schema(f.ctx, "public") == with_phone());
}

TEST_CASE("Hooks run after each committed transition", "[state][hooks]")
{
    StateFixture f;
    std::vector<std::string> seen;
    f.state->set_on_start([&](const std::string& s, const MigrationRecord& r) {
        seen.push_back("start " + s + " " + r.migration.name + " " + status_name(r.status));
    });
    f.state->set_on_complete([&](const std::string& s, const MigrationRecord& r) {
        seen.push_back("complete " + s + " " + status_name(r.status));
    });
    f.state->set_on_rollback([&](const std::string& s, const MigrationRecord& r) {
        seen.push_back("rollback " + s + " " + status_name(r.status));
    });

    f.state->start(f.ctx, "public", sample_migration("01_a"));
    f.state->complete(f.ctx, "public");
    f.state->start(f.ctx, "public", sample_migration("02_b"));
    f.state->rollback(f.ctx, "public");
    CHECK_THROWS_AS(f.state->rollback(f.ctx, "public"), NotFoundError);

    REQUIRE(seen.size() == 4);
    CHECK(seen[0] == "start public 01_a in_progress");
    CHECK(seen[1] == "complete public complete");
    CHECK(seen[2] == "start public 02_b in_progress");
    CHECK(seen[3] == "rollback public rolled_back");
}

TEST_CASE("Hook exception reaches the caller after the commit", "[state][hooks]")
{
    StateFixture f;
    f.state->set_on_start([](const std::string&, const MigrationRecord&) {
        throw std::runtime_error("notify failed");
    });

    CHECK_THROWS_WITH(f.state->start(f.ctx, "public", sample_migration()), "notify failed");
    CHECK(f.state->active_migration(f.ctx, "public").has_value());
}

TEST_CASE("Cancelled context stops every operation", "[state][cancel]")
{
    StateFixture f;
    Context cancelled;
    cancelled.cancel();

    CHECK_THROWS_AS(f.state->start(cancelled, "public", sample_migration()), CancelledError);
    CHECK_THROWS_AS(f.state->complete(cancelled, "public"), CancelledError);
    CHECK_THROWS_AS(f.state->read_schema(cancelled, "public"), CancelledError);
    CHECK_THROWS_AS(f.state->history(cancelled, "public"), CancelledError);
    CHECK_FALSE(f.state->active_migration(f.ctx, "public").has_value());
}

TEST_CASE("Exhausted pool surfaces as StoreError", "[state][pool]")
{
    auto db = sqlite_pool(":memory:", 1);
    StateOptions options = sqlite_options();
    options.acquire_timeout = 50ms;
    auto catalog = std::make_shared<SchemaMap>(SchemaMap { { "public", sample_schema() } });
    State state(db, options, std::make_unique<StubIntrospector>(catalog));
    Context ctx;
    state.init(ctx);

    {
        auto held = db->acquire(pool::DbIntent::Write);
        REQUIRE(held.ok);
        CHECK_THROWS_AS(state.start(ctx, "public", sample_migration()), StoreError);
        CHECK_THROWS_AS(state.history(ctx, "public"), StoreError);
    }
    CHECK_NOTHROW(state.start(ctx, "public", sample_migration()));

    db->shutdown();
    CHECK_THROWS_AS(state.active_migration(ctx, "public"), StoreError);
}

TEST_CASE("Concurrent starts admit exactly one migration", "[state][concurrency]")
{
    TempDbFile db;
    StateFixture f(db.path, 4);

    constexpr int kThreads = 4;
    std::atomic<int> started { 0 };
    std::atomic<int> refused { 0 };
    std::atomic<int> failed { 0 };
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            try {
                f.state->start(f.ctx, "public", sample_migration("0" + std::to_string(i) + "_m"));
                ++started;
            } catch (const AlreadyActiveError&) {
                ++refused;
            } catch (const std::exception&) {
                ++failed;
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(started.load() == 1);
    CHECK(refused.load() == kThreads - 1);
    CHECK(failed.load() == 0);
    CHECK(f.state->history(f.ctx, "public").size() == 1);
}

TEST_CASE("Init is idempotent and reported", "[state][init]")
{
    auto db = sqlite_pool(":memory:", 1);
    auto catalog = std::make_shared<SchemaMap>();
    State state(db, sqlite_options(), std::make_unique<StubIntrospector>(catalog));
    Context ctx;

    CHECK_FALSE(state.is_initialized(ctx));
    state.init(ctx);
    CHECK(state.is_initialized(ctx));
    CHECK_NOTHROW(state.init(ctx));
    CHECK(state.options().state_schema == "pgshift");
}

TEST_CASE("State rejects a mismatched or missing collaborator", "[state][init]")
{
    auto db = sqlite_pool(":memory:", 1);
    auto catalog = std::make_shared<SchemaMap>();

    StateOptions pg;
    pg.dialect = Dialect::Postgres;
    CHECK_THROWS_AS(State(db, pg, std::make_unique<StubIntrospector>(catalog)), std::invalid_argument);
    CHECK_THROWS_AS(State(nullptr, sqlite_options(), std::make_unique<StubIntrospector>(catalog)),
                    std::invalid_argument);
    CHECK_THROWS_AS(State(db, sqlite_options(), nullptr), std::invalid_argument);
}

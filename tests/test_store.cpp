#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include "migration_store.hpp"
#include "store_sql.hpp"

namespace {

PSQLConnection open_memory_db()
{
    PSQLConnection conn = make_sqlite_connection();
    conn->connect(":memory:");
    return conn;
}

MigrationRecord new_record(const std::string& schema_name, const std::string& name)
{
    MigrationRecord r;
    r.schema_name = schema_name;
    r.migration = sample_migration(name);
    r.status = MigrationStatus::InProgress;
    r.started_schema = sample_schema(schema_name);
    return r;
}

}

TEST_CASE("Store SQL is generated per dialect", "[store][sql]")
{
    PgStoreSQL pg("pgshift");
    SqliteStoreSQL lite("pgshift");

    CHECK(pg.table() == "\"pgshift\".migrations");
    CHECK(lite.table() == "\"pgshift_migrations\"");
    CHECK(pg.latest().find("$1") != std::string::npos);
    CHECK(lite.latest().find("?1") != std::string::npos);
    CHECK(pg.insert().find("RETURNING") != std::string::npos);

    CHECK_FALSE(pg.try_lock().empty());
    CHECK(lite.try_lock().empty());
    CHECK(pg.statement_timeout(250ms) == "SET LOCAL statement_timeout = 250");
    CHECK(lite.statement_timeout(250ms).empty());

    auto pg_init = pg.init_statements();
    REQUIRE_FALSE(pg_init.empty());
    CHECK(pg_init.front().find("pg_advisory_xact_lock") != std::string::npos);
    CHECK(join(pg_init).find("only_one_active") != std::string::npos);
    CHECK(join(lite.init_statements()).find("WHERE status = 'in_progress'") != std::string::npos);

    CHECK(dynamic_cast<PgStoreSQL*>(make_store_sql(Dialect::Postgres, "x").get()) != nullptr);
    CHECK(dynamic_cast<SqliteStoreSQL*>(make_store_sql(Dialect::SQLite, "x").get()) != nullptr);
}

TEST_CASE("Store init is idempotent", "[store][init]")
{
    auto conn = open_memory_db();
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;

    CHECK_FALSE(store.is_initialized(ctx, *conn));
    store.init(ctx, *conn);
    CHECK(store.is_initialized(ctx, *conn));
    CHECK_NOTHROW(store.init(ctx, *conn));
    CHECK(store.is_initialized(ctx, *conn));
    CHECK_FALSE(conn->in_transaction());

    // one table, three indexes: the second init created nothing
    auto rows = conn->prepare("SELECT count(*) AS n FROM sqlite_master WHERE tbl_name = 'pgshift_migrations'")->query();
    CHECK(jhlp::get<std::string>(rows[0u], "n") == "4");
}

TEST_CASE("Saved record round-trips with its snapshots", "[store][save]")
{
    auto conn = open_memory_db();
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    store.init(ctx, *conn);

    MigrationRecord rec = new_record("public", "01_add_phone");
    store.save(ctx, *conn, rec);

    CHECK(rec.id > 0);
    CHECK_FALSE(rec.parent.has_value());
    CHECK_FALSE(rec.created_at.empty());

    auto latest = store.latest(ctx, *conn, "public");
    REQUIRE(latest);
    CHECK(latest->id == rec.id);
    CHECK(latest->status == MigrationStatus::InProgress);
    CHECK(latest->migration == sample_migration("01_add_phone"));
    CHECK(latest->started_schema == sample_schema("public"));
    CHECK_FALSE(latest->completed_schema.has_value());

    CHECK_FALSE(store.latest(ctx, *conn, "other").has_value());
}

TEST_CASE("Status transitions only leave in_progress", "[store][status]")
{
    auto conn = open_memory_db();
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    store.init(ctx, *conn);

    CHECK_THROWS_AS(store.set_status(ctx, *conn, "public", MigrationStatus::Complete, std::nullopt), NotFoundError);

    MigrationRecord rec = new_record("public", "01_add_phone");
    store.save(ctx, *conn, rec);

    schema::Schema after = sample_schema("public");
    after.tables["users"].columns["phone"] = { "phone", "text", true, false };
    MigrationRecord done = store.set_status(ctx, *conn, "public", MigrationStatus::Complete, after);

    CHECK(done.id == rec.id);
    CHECK(done.status == MigrationStatus::Complete);
    REQUIRE(done.completed_schema);
    CHECK(*done.completed_schema == after);

    CHECK_THROWS_AS(store.set_status(ctx, *conn, "public", MigrationStatus::RolledBack, std::nullopt), NotFoundError);
    CHECK_THROWS_AS(store.set_status(ctx, *conn, "public", MigrationStatus::InProgress, std::nullopt), StoreError);
    CHECK_FALSE(conn->in_transaction());
}

TEST_CASE("Database rejects a second in-progress record", "[store][guard]")
{
    auto conn = open_memory_db();
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    store.init(ctx, *conn);

    MigrationRecord first = new_record("public", "01_a");
    store.save(ctx, *conn, first);

    MigrationRecord second = new_record("public", "02_b");
    CHECK_THROWS_AS(store.save(ctx, *conn, second), AlreadyActiveError);
    CHECK(second.id == 0);

    // other schemas are independent
    MigrationRecord elsewhere = new_record("billing", "02_b");
    CHECK_NOTHROW(store.save(ctx, *conn, elsewhere));
    CHECK_FALSE(conn->in_transaction());
}

TEST_CASE("Migration names are unique unless rolled back", "[store][names]")
{
    auto conn = open_memory_db();
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    store.init(ctx, *conn);

    MigrationRecord rec = new_record("public", "01_a");
    store.save(ctx, *conn, rec);
    store.set_status(ctx, *conn, "public", MigrationStatus::Complete, sample_schema());

    MigrationRecord again = new_record("public", "01_a");
    CHECK_THROWS_AS(store.save(ctx, *conn, again), InvalidMigrationError);

    MigrationRecord retry = new_record("public", "02_b");
    store.save(ctx, *conn, retry);
    store.set_status(ctx, *conn, "public", MigrationStatus::RolledBack, std::nullopt);

    MigrationRecord retry2 = new_record("public", "02_b");
    CHECK_NOTHROW(store.save(ctx, *conn, retry2));
}

TEST_CASE("History, versions and parents", "[store][history]")
{
    auto conn = open_memory_db();
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    store.init(ctx, *conn);

    CHECK_FALSE(store.latest_version(ctx, *conn, "public").has_value());
    CHECK_FALSE(store.previous_version(ctx, *conn, "public").has_value());

    MigrationRecord a = new_record("public", "01_a");
    store.save(ctx, *conn, a);
    store.set_status(ctx, *conn, "public", MigrationStatus::Complete, sample_schema());

    MigrationRecord b = new_record("public", "02_b");
    store.save(ctx, *conn, b);
    CHECK(b.parent == std::optional<std::string>("01_a"));
    store.set_status(ctx, *conn, "public", MigrationStatus::RolledBack, std::nullopt);

    MigrationRecord c = new_record("public", "03_c");
    store.save(ctx, *conn, c);
    store.set_status(ctx, *conn, "public", MigrationStatus::Complete, sample_schema());

    CHECK(store.latest_version(ctx, *conn, "public") == std::optional<std::string>("03_c"));
    CHECK(store.previous_version(ctx, *conn, "public") == std::optional<std::string>("01_a"));

    auto history = store.history(ctx, *conn, "public");
    REQUIRE(history.size() == 3);
    CHECK(history[0].migration.name == "01_a");
    CHECK(history[1].status == MigrationStatus::RolledBack);
    CHECK(history[2].migration.name == "03_c");
    CHECK(history[0].id < history[1].id);
    CHECK(history[1].id < history[2].id);

    auto found = store.find(ctx, *conn, "public", "02_b");
    REQUIRE(found);
    CHECK(found->id == b.id);
    CHECK_FALSE(store.find(ctx, *conn, "public", "99_missing").has_value());
}

TEST_CASE("State schema namespaces the tracking table", "[store][init]")
{
    auto conn = open_memory_db();
    Context ctx;
    MigrationStore a(Dialect::SQLite, "team_a");
    MigrationStore b(Dialect::SQLite, "team_b");
    a.init(ctx, *conn);

    CHECK(a.is_initialized(ctx, *conn));
    CHECK_FALSE(b.is_initialized(ctx, *conn));

    MigrationRecord rec = new_record("public", "01_a");
    a.save(ctx, *conn, rec);
    b.init(ctx, *conn);
    CHECK_FALSE(b.latest(ctx, *conn, "public").has_value());
}

TEST_CASE("Store joins the caller's transaction", "[store][tx]")
{
    auto conn = open_memory_db();
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    store.init(ctx, *conn);

    conn->begin();
    MigrationRecord rec = new_record("public", "01_a");
    store.save(ctx, *conn, rec);
    CHECK(conn->in_transaction());
    conn->rollback();

    CHECK_FALSE(store.latest(ctx, *conn, "public").has_value());
}

TEST_CASE("Store failures are StoreError and leave no transaction", "[store][errors]")
{
    auto faults = std::make_shared<Faults>();
    FaultyConnection conn(make_sqlite_connection(), faults);
    conn.connect(":memory:");
    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    store.init(ctx, conn);

    faults->fail_on = "INSERT INTO";
    MigrationRecord rec = new_record("public", "01_a");
    CHECK_THROWS_AS(store.save(ctx, conn, rec), StoreError);
    CHECK_FALSE(conn.in_transaction());

    faults->fail_on.clear();
    CHECK_FALSE(store.latest(ctx, conn, "public").has_value());

    Context cancelled;
    cancelled.cancel();
    CHECK_THROWS_AS(store.latest(cancelled, conn, "public"), CancelledError);
}

TEST_CASE("Closed connection fails with a database error", "[store][errors]")
{
    PSQLConnection conn = make_sqlite_connection();
    CHECK_FALSE(conn->connected());
    CHECK_THROWS_AS(conn->prepare("SELECT 1"), DbError);
    CHECK_THROWS_AS(conn->execute("SELECT 1"), DbError);
    CHECK_THROWS_AS(conn->begin(), DbError);
    CHECK_FALSE(conn->in_transaction());

    conn->connect(":memory:");
    CHECK(conn->connected());
    conn->disconnect();
    try {
        conn->prepare("SELECT 1");
        FAIL("expected DbError");
    } catch (const DbError& e) {
        CHECK(e.sqlstate() == "08003");
    }

    MigrationStore store(Dialect::SQLite, "pgshift");
    Context ctx;
    CHECK_THROWS_AS(store.latest(ctx, *conn, "public"), StoreError);
}

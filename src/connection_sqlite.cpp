#include "sqlconnection.hpp"
#include <sqlite3.h>
#include <string>
#include "lib.hpp"
#include "logger.hpp"

namespace {

    // Writers wait this long for a competing write transaction instead of failing at once.
    constexpr int kBusyTimeoutMs = 10000;

    // SQLite result code -> SQLSTATE class used by the rest of the engine.
    std::string sqlstate_of(int extended_rc) {
        switch (extended_rc) {
            case SQLITE_CONSTRAINT_UNIQUE:
            case SQLITE_CONSTRAINT_PRIMARYKEY: return "23505";
            case SQLITE_CONSTRAINT_NOTNULL:    return "23502";
            case SQLITE_CONSTRAINT_FOREIGNKEY: return "23503";
            case SQLITE_CONSTRAINT_CHECK:      return "23514";
            case SQLITE_BUSY:                  return "55P03";
            default:                           return "HY000";
        }
    }

    DbError sqlite_error(sqlite3* db, const std::string& what) {
        int rc = db ? sqlite3_extended_errcode(db) : SQLITE_ERROR;
        std::string msg = db ? sqlite3_errmsg(db) : "no connection";
        return DbError("SQLite " + what + " failed: " + msg, sqlstate_of(rc));
    }

    [[noreturn]] void raise_sqlite(sqlite3* db, const std::string& what) {
        throw sqlite_error(db, what);
    }

}

class SQLiteStatement final : public SQLStatement {
public:
    SQLiteStatement(sqlite3* db, sqlite3_stmt* stmt, std::string sql)
        : db_(db), stmt_(stmt) { sql_ = std::move(sql); }

    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    int exec() override {
        int rc;
        while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {}
        if (rc != SQLITE_DONE) {
            DbError err = sqlite_error(db_, "exec");
            sqlite3_reset(stmt_);
            throw err;
        }
        sqlite3_reset(stmt_);
        return sqlite3_changes(db_);
    }

    jdoc query() override {
        jdoc out;
        out.SetArray();
        auto& a = out.GetAllocator();
        const int ncols = sqlite3_column_count(stmt_);
        int rc;
        while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
            jval row(json::kObjectType);
            for (int c = 0; c < ncols; ++c) {
                jval key = jhlp::str_val(sqlite3_column_name(stmt_, c), a);
                if (sqlite3_column_type(stmt_, c) == SQLITE_NULL) {
                    row.AddMember(key, jval(json::kNullType), a);
                } else {
                    const char* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, c));
                    int len = sqlite3_column_bytes(stmt_, c);
                    jval v(txt ? txt : "", static_cast<json::SizeType>(len), a);
                    row.AddMember(key, v, a);
                }
            }
            out.PushBack(row, a);
        }
        if (rc != SQLITE_DONE) {
            DbError err = sqlite_error(db_, "query");
            sqlite3_reset(stmt_);
            throw err;
        }
        sqlite3_reset(stmt_);
        return out;
    }

protected:
    void set_text(int idx, const std::string& value) override {
        //handle unicode string UTF-8
        check_(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void set_int(int idx, int64_t value) override {
        check_(sqlite3_bind_int64(stmt_, idx, value));
    }

    void set_bool(int idx, bool value) override {
        check_(sqlite3_bind_int(stmt_, idx, value ? 1 : 0));
    }

    void set_null(int idx) override {
        check_(sqlite3_bind_null(stmt_, idx));
    }

private:
    void check_(int rc) {
        if (rc != SQLITE_OK) raise_sqlite(db_, "bind");
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        if (sqlite3_open(dsn.c_str(), &db_) != SQLITE_OK) {
            std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
            disconnect();
            throw DbError("Failed to open SQLite DB " + dsn + ": " + err, "08001");
        }
        sqlite3_extended_result_codes(db_, 1);
        sqlite3_busy_timeout(db_, kBusyTimeoutMs);
        LOG_DEBUG("SQLite database opened: {}", dsn);
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    // IMMEDIATE takes the write lock up front, so two writers never both read
    // "no active migration" before one of them writes.
    void begin() override {
        if (tr_started_) return;
        execSQL("BEGIN IMMEDIATE;");
        tr_started_ = true;
    }

    void commit() override {
        if (!tr_started_) return;
        execSQL("COMMIT;");
        tr_started_ = false;
    }

    // A failed ROLLBACK leaves the server side unknown: closing the handle ends
    // the transaction and frees its write lock.
    void rollback() override {
        if (!tr_started_) return;
        try {
            execSQL("ROLLBACK;");
        } catch (const DbError& e) {
            LOG_ERROR("SQLite rollback failed, closing the connection: {}", e.what());
            disconnect();
            throw;
        }
        tr_started_ = false;
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) throw DbError("prepare: not connected", "08003");
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt, nullptr) != SQLITE_OK) {
            raise_sqlite(db_, "prepare");
        }
        return std::make_unique<SQLiteStatement>(db_, stmt, sql);
    }

    Dialect dialect() const override { return Dialect::SQLite; }
    bool connected() const override { return db_ != nullptr; }

private:
    void execSQL(const char* sql) {
        if (!db_) throw DbError("execSQL: not connected", "08003");
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string err = errmsg ? errmsg : "unknown";
            sqlite3_free(errmsg);
            throw DbError("SQLite error on '" + std::string(sql) + "': " + err,
                          sqlstate_of(sqlite3_extended_errcode(db_)));
        }
    }

    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}

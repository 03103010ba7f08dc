// connection_postgres.cpp
#include <libpq-fe.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "lib.hpp"
#include "logger.hpp"
#include "sqlconnection.hpp"

namespace {

    // Build a DbError from a failed result (res may be null) and free it.
    [[noreturn]] void raise_pg(PGconn* conn, PGresult* res, const std::string& what) {
        std::string msg = conn ? PQerrorMessage(conn) : "no connection";
        std::string sqlstate;
        std::string constraint;
        if (res) {
            if (const char* m = PQresultErrorMessage(res); m && *m) msg = m;
            if (const char* s = PQresultErrorField(res, PG_DIAG_SQLSTATE)) sqlstate = s;
            if (const char* c = PQresultErrorField(res, PG_DIAG_CONSTRAINT_NAME)) constraint = c;
            PQclear(res);
        }
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) msg.pop_back();
        throw DbError("Postgres " + what + " failed: " + msg, sqlstate, constraint);
    }

    // Owns a PGresult for the scope of a call.
    struct ResultGuard {
        PGresult* res;
        ~ResultGuard() { if (res) PQclear(res); }
    };

}

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PGconn* conn, std::string sql)
        : conn_(conn) { sql_ = std::move(sql); }

    ~PgStatement() override = default;

    int exec() override {
        PGresult* res = run_();
        auto st = PQresultStatus(res);
        int rows = 0;
        if (st == PGRES_COMMAND_OK) {
            const char* t = PQcmdTuples(res);
            rows = (t && *t) ? std::atoi(t) : 0;
        } else { // PGRES_TUPLES_OK
            rows = PQntuples(res);
        }
        PQclear(res);
        return rows;
    }

    jdoc query() override {
        ResultGuard guard{ run_() };
        PGresult* res = guard.res;

        jdoc out;
        out.SetArray();
        auto& a = out.GetAllocator();
        const int nrows = PQntuples(res);
        const int ncols = PQnfields(res);
        for (int r = 0; r < nrows; ++r) {
            jval row(json::kObjectType);
            for (int c = 0; c < ncols; ++c) {
                jval key = jhlp::str_val(PQfname(res, c), a);
                if (PQgetisnull(res, r, c)) {
                    row.AddMember(key, jval(json::kNullType), a);
                } else {
                    jval v(PQgetvalue(res, r, c), static_cast<json::SizeType>(PQgetlength(res, r, c)), a);
                    row.AddMember(key, v, a);
                }
            }
            out.PushBack(row, a);
        }
        return out;
    }

protected:
    void set_null(int idx) override {
        ensure_slot_(idx);
        present_[idx-1] = false; // SQL NULL
    }

    void set_text(int idx, const std::string& value) override {
        ensure_slot_(idx);
        values_[idx-1]  = value; // own storage
        present_[idx-1] = true;
    }

private:
    void ensure_slot_(int idx) {
        if (idx < 1) throw DbError("bind: index must be >= 1", "42P02");
        if (static_cast<size_t>(idx) > values_.size()) {
            values_.resize(idx);
            present_.resize(idx, false);
        }
    }

    // Execute with all parameters in text format; returns a successful result or throws.
    PGresult* run_() {
        if (!conn_) throw DbError("Postgres exec: not connected", "08003");
        const int nParams = static_cast<int>(values_.size());
        std::vector<const char*> params(nParams, nullptr);
        std::vector<int> lengths(nParams, 0);
        for (int i = 0; i < nParams; ++i) {
            if (present_[i]) {
                params[i] = values_[i].c_str();
                lengths[i] = static_cast<int>(values_[i].size());
            }
        }
        PGresult* res = PQexecParams(
            conn_,
            sql_.c_str(),
            nParams,
            nullptr,                                  // let server infer types
            (nParams ? params.data()  : nullptr),
            (nParams ? lengths.data() : nullptr),
            nullptr,                                  // all text format
            0                                         // text results
        );
        if (!res) raise_pg(conn_, nullptr, "exec");

        auto st = PQresultStatus(res);
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            raise_pg(conn_, res, "exec");
        }
        return res;
    }

    PGconn* conn_;
    std::vector<std::string> values_;
    std::vector<bool> present_;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = conn_ ? PQerrorMessage(conn_) : "no connection";
            disconnect();
            throw DbError("Postgres connect failed: " + err, "08001");
        }
        LOG_DEBUG("Postgres connection opened (server version {})", PQserverVersion(conn_));
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

    void begin() override {
        if (tr_started_) return;
        execSQL("BEGIN");
        tr_started_ = true;
    }

    void commit() override {
        if (!tr_started_) return;
        // A failed COMMIT leaves no transaction open on the server either way.
        tr_started_ = false;
        execSQL("COMMIT");
    }

    // A session whose ROLLBACK failed may still hold the transaction and its
    // advisory locks; closing it makes the server drop both.
    void rollback() override {
        if (!tr_started_) return;
        try {
            execSQL("ROLLBACK");
        } catch (const DbError& e) {
            LOG_ERROR("Postgres rollback failed, closing the connection: {}", e.what());
            disconnect();
            throw;
        }
        tr_started_ = false;
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!conn_) throw DbError("prepare: not connected", "08003");
        return std::make_unique<PgStatement>(conn_, sql);
    }

    Dialect dialect() const override { return Dialect::Postgres; }
    bool connected() const override { return conn_ && PQstatus(conn_) == CONNECTION_OK; }

private:
    void execSQL(const char* sql) {
        if (!conn_) throw DbError("execSQL: not connected", "08003");
        PGresult* res = PQexec(conn_, sql);
        if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
            raise_pg(conn_, res, std::string("'") + sql + "'");
        }
        PQclear(res);
    }

    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}

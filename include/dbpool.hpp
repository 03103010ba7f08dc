#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include "logger.hpp"
#include "sqlconnection.hpp"

using PConn = std::shared_ptr<SQLConnection>;

namespace pool {

enum class DbIntent { Read,
    Write };
enum class PoolAcquireError { Timeout,
    Shutdown };

struct PoolStats {
    std::size_t size { 0 };
    std::size_t in_use { 0 };
    std::size_t waiters { 0 };
};

struct AcquirePolicy {
    std::chrono::milliseconds acquire_timeout { 1500 }; // never block forever
};

// Forward decl
class IDbPool;

// --------- RAII Lease ----------
class Lease {
public:
    Lease(IDbPool* owner, PConn conn, DbIntent intent)
        : owner_(owner)
        , conn_(std::move(conn))
        , intent_(intent) { }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept { move_from(other); }
    Lease& operator=(Lease&& other) noexcept {
        if (this != &other) {
            release_();
            move_from(other);
        }
        return *this;
    }

    ~Lease() { release_(); }

    SQLConnection& conn() const { return *conn_; }
    DbIntent intent() const { return intent_; }
    explicit operator bool() const { return !!conn_; }

private:
    void release_();
    void move_from(Lease& o) noexcept {
        owner_ = o.owner_;
        o.owner_ = nullptr;
        conn_ = std::move(o.conn_);
        intent_ = o.intent_;
    }

    IDbPool* owner_ { nullptr };
    PConn conn_ {};
    DbIntent intent_ { DbIntent::Read };
};

// --------- Pool interface (polymorphic) ----------
class IDbPool {
public:
    virtual ~IDbPool() = default;

    struct AcquireResult {
        bool ok { false };
        Lease lease { nullptr, nullptr, DbIntent::Read };
        PoolAcquireError error { PoolAcquireError::Timeout };
    };

    virtual AcquireResult acquire(DbIntent intent,
        std::chrono::milliseconds timeoutOverride = std::chrono::milliseconds::zero())
        = 0;

    virtual Dialect dialect() const = 0;
    virtual PoolStats stats() const = 0;
    virtual void shutdown() = 0;

protected:
    // Only pools are allowed to "return" leases:
    virtual void release(PConn conn, DbIntent intent) = 0;
    friend class Lease;
};

inline void Lease::release_() {
    if (owner_ && conn_) {
        owner_->release(conn_, intent_);
    }
    owner_ = nullptr;
    conn_.reset();
}

/**
 * Fixed-capacity pool. All connections are opened up front with the factory;
 * acquire() blocks until one is free, the deadline passes or the pool shuts down.
 * A connection never goes back to the free list with a transaction open.
 */
class DbPool final : public IDbPool {
public:
    DbPool(std::size_t capacity,
        std::string dsn,
        std::function<PSQLConnection()> factory,
        AcquirePolicy policy = {})
        : cap_(capacity)
        , dsn_(std::move(dsn))
        , policy_(policy)
        , factory_(std::move(factory)) { load_(); }

    AcquireResult acquire(
        DbIntent intent,
        std::chrono::milliseconds to = std::chrono::milliseconds::zero()) override {
        auto deadline = std::chrono::steady_clock::now() + (to.count() > 0 ? to : policy_.acquire_timeout);

        std::unique_lock<std::mutex> lk(mx_);
        ++stats_.waiters;
        Finally on_exit([&]() { --stats_.waiters; });

        while (!shutdown_ && free_.empty()) {
            if (cv_.wait_until(lk, deadline) == std::cv_status::timeout && free_.empty()) {
                return { false, { nullptr, nullptr, intent }, PoolAcquireError::Timeout };
            }
        }
        if (shutdown_) {
            return { false, { nullptr, nullptr, intent }, PoolAcquireError::Shutdown };
        }

        auto conn = std::move(free_.front());
        free_.pop_front();
        ++stats_.in_use;

        return { true, Lease { this, std::move(conn), intent }, {} };
    }

    Dialect dialect() const override { return dialect_; }

    PoolStats stats() const override {
        std::lock_guard<std::mutex> lk(mx_);
        auto s = stats_;
        s.size = cap_;
        return s;
    }

    void shutdown() override {
        std::lock_guard<std::mutex> lk(mx_);
        shutdown_ = true;
        cv_.notify_all();
    }

protected:
    void release(PConn conn, DbIntent) override {
        if (conn && conn->in_transaction()) {
            try {
                conn->rollback();
            } catch (const std::exception& e) {
                LOG_ERROR("DbPool: dropping connection, rollback on release failed: {}", e.what());
                conn->disconnect();
            }
        }
        // closed by its user or by the rollback above
        if (conn && !conn->connected()) {
            LOG_WARN("DbPool: replacing a closed connection");
            conn = reconnect_();
        }
        std::lock_guard<std::mutex> lk(mx_);
        if (conn && !shutdown_) {
            free_.push_back(std::move(conn));
        }
        if (stats_.in_use)
            --stats_.in_use;
        cv_.notify_one();
    }

private:
    struct Finally {
        std::function<void()> f;
        explicit Finally(std::function<void()> fn)
            : f(std::move(fn)) { }
        ~Finally() {
            if (f) {
                f();
            }
        }
        Finally(const Finally&) = delete;
        Finally& operator=(const Finally&) = delete;
    };

    PConn open_() {
        PSQLConnection up = factory_();
        if (!up) throw std::runtime_error("DbPool: factory returned null connection");
        up->connect(dsn_);
        return PConn(up.release());
    }

    // Replacement for a connection that could not be cleaned; null when the server is unreachable.
    PConn reconnect_() {
        try {
            return open_();
        } catch (const std::exception& e) {
            LOG_ERROR("DbPool: reconnect failed, pool shrinks by one: {}", e.what());
            return nullptr;
        }
    }

    void load_() {
        if (!factory_) throw std::runtime_error("DbPool: null connection factory");
        if (cap_ == 0) throw std::runtime_error("DbPool: capacity must be > 0");
        std::lock_guard<std::mutex> lk(mx_);
        free_.clear();
        for (std::size_t i = 0; i < cap_; ++i) {
            free_.push_back(open_());
        }
        dialect_ = free_.front()->dialect();
        stats_ = {};
        stats_.size = cap_;
    }

    std::size_t cap_;
    std::string dsn_;
    AcquirePolicy policy_;
    Dialect dialect_ { Dialect::SQLite };

    mutable std::mutex mx_;
    std::condition_variable cv_;
    std::deque<PConn> free_;
    bool shutdown_ { false };
    PoolStats stats_;
    std::function<PSQLConnection()> factory_;
};

} // namespace pool

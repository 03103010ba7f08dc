#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

/**
 * Cancellation / deadline carried through every State operation.
 *
 * Copies share the cancellation flag, so a caller can keep one copy and
 * cancel() it from another thread while the operation runs with the other.
 * A default-constructed Context never expires.
 */
class Context {
public:
    using clock = std::chrono::steady_clock;

    Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    static Context with_timeout(std::chrono::milliseconds timeout);
    static Context with_deadline(clock::time_point deadline);

    void cancel() const { cancelled_->store(true); }

    // True once cancel() was called or the deadline has passed.
    bool cancelled() const;

    bool has_deadline() const { return deadline_.has_value(); }

    // Time left before the deadline, never negative. milliseconds::max() without a deadline.
    std::chrono::milliseconds remaining() const;

    // min(limit, remaining())
    std::chrono::milliseconds bound(std::chrono::milliseconds limit) const;

    // Throws CancelledError naming the operation and schema.
    void check(const std::string& operation, const std::string& schema) const;

private:
    std::optional<clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

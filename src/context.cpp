#include "context.hpp"
#include "errors.hpp"
#include <algorithm>

Context Context::with_timeout(std::chrono::milliseconds timeout) {
    return with_deadline(clock::now() + timeout);
}

Context Context::with_deadline(clock::time_point deadline) {
    Context ctx;
    ctx.deadline_ = deadline;
    return ctx;
}

bool Context::cancelled() const {
    if (cancelled_->load()) return true;
    return deadline_ && clock::now() >= *deadline_;
}

std::chrono::milliseconds Context::remaining() const {
    if (!deadline_) return std::chrono::milliseconds::max();
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - clock::now());
    return std::max(left, std::chrono::milliseconds::zero());
}

std::chrono::milliseconds Context::bound(std::chrono::milliseconds limit) const {
    return std::min(limit, remaining());
}

void Context::check(const std::string& operation, const std::string& schema) const {
    if (cancelled_->load()) throw CancelledError(operation, schema, "operation cancelled");
    if (deadline_ && clock::now() >= *deadline_) throw CancelledError(operation, schema, "deadline exceeded");
}

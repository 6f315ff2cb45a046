#include "mcplink/session.hpp"
#include "mcplink/error.hpp"
#include "mcplink/log.hpp"

namespace mcplink {

Session::Session() = default;

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::set_state(SessionState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Closed) return;
    state_ = s;
}

bool Session::transition(SessionState from, SessionState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != from) return false;
    state_ = to;
    return true;
}

Session::Registration Session::register_request(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Closed) {
        throw ConnectionClosedError("Connection closed");
    }
    int64_t id = next_id_++;
    PendingRequest req;
    req.method = method;
    req.created_at = std::chrono::steady_clock::now();
    auto future = req.slot.get_future();
    pending_requests_.emplace(id, std::move(req));
    return Registration{id, std::move(future)};
}

bool Session::complete_request(const RequestId& id, const JsonRpcResponse& resp) {
    const auto* int_id = std::get_if<int64_t>(&id);
    if (!int_id) return false;

    PendingRequest req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_requests_.find(*int_id);
        if (it == pending_requests_.end()) return false;
        req = std::move(it->second);
        pending_requests_.erase(it);
    }
    auto elapsed = std::chrono::steady_clock::now() - req.created_at;
    log::logger()->debug("response for {} (id {}) after {}us", req.method, *int_id,
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
    req.slot.set_value(resp);
    return true;
}

bool Session::cancel_request(int64_t id, std::exception_ptr reason) {
    PendingRequest req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_requests_.find(id);
        if (it == pending_requests_.end()) return false;
        req = std::move(it->second);
        pending_requests_.erase(it);
    }
    req.slot.set_exception(std::move(reason));
    return true;
}

void Session::fail_all(const std::string& reason) {
    std::map<int64_t, PendingRequest> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Closed;
        orphaned.swap(pending_requests_);
    }
    if (!orphaned.empty()) {
        log::logger()->warn("failing {} pending request(s): {}", orphaned.size(), reason);
    }
    for (auto& entry : orphaned) {
        entry.second.slot.set_exception(std::make_exception_ptr(ConnectionClosedError(reason)));
    }
}

bool Session::has_pending_request(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_requests_.count(id) > 0;
}

size_t Session::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_requests_.size();
}

} // namespace mcplink

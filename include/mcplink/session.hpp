#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace mcplink {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

struct PendingRequest {
    std::string method;
    std::chrono::steady_clock::time_point created_at;
    std::promise<JsonRpcResponse> slot;
};

/// Connection-scoped table of outstanding requests. Every entry is removed
/// exactly once: by complete_request(), cancel_request() or fail_all(),
/// whichever takes the lock first. Only integer ids are issued.
class Session {
public:
    struct Registration {
        int64_t id;
        std::future<JsonRpcResponse> response;
    };

    Session();

    SessionState state() const;
    void set_state(SessionState s);
    /// Move to `to` only if the current state is `from`. Returns whether it did.
    bool transition(SessionState from, SessionState to);

    /// Allocate the next id and insert its pending entry. Ids are never reused.
    /// Throws ConnectionClosedError once the session is closed.
    [[nodiscard]] Registration register_request(const std::string& method);

    /// Deliver a response to its waiter. Returns false (and drops the response)
    /// when no entry is pending for the id.
    bool complete_request(const RequestId& id, const JsonRpcResponse& resp);

    /// Remove the entry for `id` and fail its waiter with `reason`.
    /// Returns false if the id was not pending.
    bool cancel_request(int64_t id, std::exception_ptr reason);

    /// Close the session: every pending waiter fails with ConnectionClosedError.
    void fail_all(const std::string& reason);

    bool has_pending_request(int64_t id) const;
    size_t pending_count() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::map<int64_t, PendingRequest> pending_requests_;
    int64_t next_id_{1};
};

} // namespace mcplink

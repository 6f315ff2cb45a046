#pragma once
#include <cstdint>
#include <functional>
#include <memory>

namespace mcplink {

namespace detail { struct CancellationState; }

class CancellationToken;

/// RAII handle for a callback registered on a token. Destroying it removes
/// the callback; if the callback is running on another thread at that moment
/// the destructor waits for it to return.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& o) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& o) noexcept;

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset();

private:
    friend class CancellationToken;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::CancellationState> state_;
    uint64_t id_{0};
};

/// Read side of a cancellation signal. A default-constructed token never fires.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept;
    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }

    /// Run `fn` once when the token fires. If it already fired, `fn` runs
    /// before this returns and the registration is empty.
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> fn) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/// Write side. Copies share the same signal.
class CancellationSource {
public:
    CancellationSource();

    /// Fire the signal. Idempotent; callbacks run on the calling thread and
    /// must not throw.
    void cancel();

    [[nodiscard]] bool is_cancelled() const noexcept;
    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace mcplink

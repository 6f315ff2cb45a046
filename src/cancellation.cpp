#include "mcplink/cancellation.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace mcplink {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
    std::map<uint64_t, std::function<void()>> callbacks;
    uint64_t next_id{1};

    // Callback currently being run by cancel(), so unregistration can wait for it.
    uint64_t running_id{0};
    std::thread::id running_thread;
};

} // namespace detail

// ---- CancellationRegistration ----

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& o) noexcept
    : state_(std::move(o.state_)), id_(o.id_) {
    o.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& o) noexcept {
    if (this != &o) {
        reset();
        state_ = std::move(o.state_);
        id_ = o.id_;
        o.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (!state_) return;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
        // Wait out a concurrent invocation, unless we are inside it.
        state_->cv.wait(lock, [this] {
            return state_->running_id != id_ ||
                   state_->running_thread == std::this_thread::get_id();
        });
    }
    state_.reset();
    id_ = 0;
}

// ---- CancellationToken ----

bool CancellationToken::is_cancelled() const noexcept {
    return state_ && state_->cancelled.load();
}

CancellationRegistration CancellationToken::on_cancel(std::function<void()> fn) const {
    if (!state_) return {};
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(fn));
            return CancellationRegistration(state_, id);
        }
    }
    fn();
    return {};
}

// ---- CancellationSource ----

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

bool CancellationSource::is_cancelled() const noexcept {
    return state_->cancelled.load();
}

void CancellationSource::cancel() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true)) return;

    state_->running_thread = std::this_thread::get_id();
    while (!state_->callbacks.empty()) {
        auto it = state_->callbacks.begin();
        uint64_t id = it->first;
        auto fn = std::move(it->second);
        state_->callbacks.erase(it);
        state_->running_id = id;

        lock.unlock();
        fn();
        lock.lock();

        state_->running_id = 0;
        state_->cv.notify_all();
    }
    state_->running_thread = std::thread::id();
}

} // namespace mcplink

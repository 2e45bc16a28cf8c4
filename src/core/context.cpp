#include "tokenguard/core/context.h"

#include <map>
#include <mutex>
#include <utility>

namespace tokenguard::core {

struct Context::State {
    std::mutex mutex;
    bool cancelled{false};
    std::optional<Clock::time_point> deadline;
    std::uint64_t next_id{1};
    std::map<std::uint64_t, CancelCallback> callbacks;
};

Context::Registration::Registration(std::weak_ptr<State> state, std::uint64_t id)
    : state_(std::move(state)), id_(id) {}

Context::Registration::Registration(Registration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

Context::Registration& Context::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

Context::Registration::~Registration() { Reset(); }

void Context::Registration::Reset() {
    if (id_ == 0) {
        return;
    }
    // Taking the lock also waits out a Cancel() that is running this callback.
    if (auto state = state_.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

Context::Context(std::optional<Clock::time_point> deadline)
    : state_(std::make_shared<State>()) {
    state_->deadline = deadline;
}

Context Context::Background() { return Context(std::nullopt); }

Context Context::WithDeadline(Clock::time_point deadline) { return Context(deadline); }

Context Context::WithTimeout(std::chrono::milliseconds timeout) {
    return Context(Clock::now() + timeout);
}

void Context::Cancel() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return;
    }
    state_->cancelled = true;
    for (auto& entry : state_->callbacks) {
        entry.second();
    }
    state_->callbacks.clear();
}

bool Context::Done() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return true;
    }
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::optional<Context::Clock::time_point> Context::Deadline() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

std::optional<std::chrono::milliseconds> Context::Remaining() const {
    const auto deadline = Deadline();
    if (!deadline) {
        return std::nullopt;
    }
    const auto now = Clock::now();
    if (now >= *deadline) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
}

Result<void> Context::Check() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return Error{ErrorCode::kCancelled, "context cancelled"};
    }
    if (state_->deadline && Clock::now() >= *state_->deadline) {
        return Error{ErrorCode::kCancelled, "context deadline exceeded"};
    }
    return Ok();
}

Context::Registration Context::OnCancel(CancelCallback callback) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        callback();
        return Registration();
    }
    const auto id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(callback));
    return Registration(state_, id);
}

}  // namespace tokenguard::core

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "tokenguard/core/result.h"

namespace tokenguard::core {

/// @brief Cancellation and deadline carrier for blocking calls.
///
/// Context is a cheap handle: copies share the same cancellation state, so a
/// request thread can hand a copy to a fetch and cancel it from elsewhere.
/// Callbacks registered with OnCancel() run on the cancelling thread while the
/// context's internal lock is held; they must not call back into the context.
class Context {
private:
    struct State;

public:
    using Clock = std::chrono::steady_clock;
    using CancelCallback = std::function<void()>;

    /// @brief RAII handle for a cancel callback; unregisters on destruction.
    class Registration {
    public:
        Registration() = default;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        ~Registration();

    private:
        friend class Context;
        Registration(std::weak_ptr<State> state, std::uint64_t id);
        void Reset();

        std::weak_ptr<State> state_;
        std::uint64_t id_{0};
    };

    /// @brief A context that is never cancelled and has no deadline.
    static Context Background();
    static Context WithDeadline(Clock::time_point deadline);
    static Context WithTimeout(std::chrono::milliseconds timeout);

    void Cancel() const;
    /// @brief True once Cancel() was called or the deadline has passed.
    bool Done() const;
    std::optional<Clock::time_point> Deadline() const;
    /// @brief Time left before the deadline (zero when passed); nullopt without deadline.
    std::optional<std::chrono::milliseconds> Remaining() const;
    /// @brief kCancelled error when the context is done, Ok otherwise.
    Result<void> Check() const;
    /// @brief Registers a callback for Cancel(); runs immediately if already cancelled.
    Registration OnCancel(CancelCallback callback) const;

private:
    explicit Context(std::optional<Clock::time_point> deadline);

    std::shared_ptr<State> state_;
};

}  // namespace tokenguard::core

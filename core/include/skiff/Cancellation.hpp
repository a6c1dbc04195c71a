// Cooperative cancellation: copyable token handles plus a single-slot
// controller that hands out at most one live token at a time.
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace skiff {

class CancellationToken {
public:
    CancellationToken();

    // Once cancelled a token never becomes active again.
    void cancel();
    bool isActive() const;
    bool isCancelled() const { return !isActive(); }

    // Token that is inactive when either itself or this token is cancelled.
    // Cancelling the child leaves this token untouched.
    CancellationToken child() const;

    bool sameAs(const CancellationToken& other) const { return state_ == other.state_; }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::shared_ptr<const State> parent;
    };
    std::shared_ptr<State> state_;
};

// Single-slot registry. newToken() cancels whatever token was handed out
// before, so every transfer observing the previous token stops at its next
// chunk boundary. It does not compose with unrelated concurrent transfers:
// callers wanting independent scopes pass their own CancellationToken, or use
// a separate controller instance.
class CancellationController {
public:
    CancellationController() = default;
    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    // Process-wide default instance used by the façade.
    static CancellationController& global();

    CancellationToken newToken();
    void cancel();
    bool isActive() const;
    std::optional<CancellationToken> current() const;

private:
    mutable std::mutex mtx_;
    std::optional<CancellationToken> current_;
};

} // namespace skiff

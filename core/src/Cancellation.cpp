#include "skiff/Cancellation.hpp"
#include "skiff/Logging.hpp"

namespace skiff {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    state_->cancelled.store(true);
}

bool CancellationToken::isActive() const {
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) return false;
    }
    return true;
}

CancellationToken CancellationToken::child() const {
    CancellationToken c;
    c.state_->parent = state_;
    return c;
}

CancellationController& CancellationController::global() {
    static CancellationController instance;
    return instance;
}

CancellationToken CancellationController::newToken() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (current_ && current_->isActive()) {
        qCInfo(skXfer) << "newToken cancelling previous token";
        current_->cancel();
    }
    current_ = CancellationToken();
    return *current_;
}

void CancellationController::cancel() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (current_ && current_->isActive()) {
        qCInfo(skXfer) << "cancel requested";
        current_->cancel();
    }
}

bool CancellationController::isActive() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return current_ && current_->isActive();
}

std::optional<CancellationToken> CancellationController::current() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return current_;
}

} // namespace skiff

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace loft::http {

/// Cancellation flag plus optional deadline, shared by copies.
/// A default-constructed token never fires.
class CancelToken {
public:
    using clock = std::chrono::steady_clock;

    CancelToken() = default;

    static CancelToken make() {
        CancelToken t;
        t.flag_ = std::make_shared<std::atomic<bool>>(false);
        return t;
    }

    static CancelToken withTimeout(const std::chrono::milliseconds timeout) {
        auto t = make();
        t.deadline_ = clock::now() + timeout;
        return t;
    }

    /// Same flag, tighter of the two deadlines.
    [[nodiscard]] CancelToken withDeadline(const clock::time_point deadline) const {
        CancelToken t = *this;
        if (!t.flag_) t.flag_ = std::make_shared<std::atomic<bool>>(false);
        if (!t.deadline_ || deadline < *t.deadline_) t.deadline_ = deadline;
        return t;
    }

    /// Own flag that also fires when this token does; cancelling the child leaves the parent alone.
    [[nodiscard]] CancelToken child() const {
        CancelToken t = make();
        t.deadline_ = deadline_;
        if (flag_) t.parent_ = std::make_shared<CancelToken>(*this);
        return t;
    }

    void cancel() const { if (flag_) flag_->store(true); }

    [[nodiscard]] bool cancelled() const {
        return (flag_ && flag_->load()) || (parent_ && parent_->cancelled());
    }
    [[nodiscard]] bool expired() const { return deadline_ && clock::now() >= *deadline_; }
    [[nodiscard]] bool stopRequested() const { return cancelled() || expired(); }

    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline_) return std::nullopt;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::optional<clock::time_point> deadline_;
    std::shared_ptr<CancelToken> parent_;
};

}

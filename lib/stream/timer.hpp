// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "lib/stream/event_loop.hpp"

namespace feedpipe {

/// One-shot timer built on IEventLoop::Schedule().
///
/// IEventLoop cannot cancel a scheduled callback, so every Start() stamps
/// the schedule with an arm id; a callback whose id no longer matches (the
/// timer was stopped or re-armed since) is discarded. Safe to destroy while
/// armed.
///
/// @code
/// Timer loading_timeout(loop);
/// loading_timeout.OnTimer([this] { ResolveLoading(); });
/// loading_timeout.Start(std::chrono::seconds(10));
/// @endcode
class Timer {
public:
    using Callback = std::function<void()>;

    /// @param loop  Event loop that drives this timer
    explicit Timer(IEventLoop& loop)
        : loop_(loop), state_(std::make_shared<State>()) {}

    ~Timer() {
        state_->alive = false;
    }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Set the callback invoked when the timer fires.
    void OnTimer(Callback cb) { callback_ = std::move(cb); }

    /// Arm the timer, replacing any pending expiry.
    /// @param delay  Time before the callback fires
    void Start(std::chrono::milliseconds delay) {
        uint64_t arm_id = ++state_->arm_id;
        state_->armed = true;

        std::shared_ptr<State> state = state_;
        Timer* self = this;
        loop_.Schedule(delay, [state, self, arm_id]() {
            if (state->alive && state->armed && state->arm_id == arm_id) {
                state->armed = false;
                self->Fire();
            }
        });
    }

    /// Disarm the timer. The pending callback, if any, will not fire.
    void Stop() {
        state_->armed = false;
        ++state_->arm_id;
    }

    /// Return true if the timer is armed.
    bool IsArmed() const { return state_->armed; }

private:
    struct State {
        bool alive = true;
        bool armed = false;
        uint64_t arm_id = 0;
    };

    void Fire() {
        if (callback_) {
            callback_();
        }
    }

    IEventLoop& loop_;
    Callback callback_;
    std::shared_ptr<State> state_;
};

}  // namespace feedpipe

// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "lib/stream/event_loop.hpp"

namespace feedpipe {

/// Epoll-based event loop for deferred work and timer scheduling.
///
/// Each Schedule() call creates a one-shot timerfd registered with epoll;
/// an internal eventfd wakes the loop when Defer() is called from another
/// thread. Drive the loop with Run() or Poll().
///
/// Thread safety: the loop itself runs on a single thread. Defer(),
/// Schedule(), Stop() and Wake() may be called from any thread.
class EpollEventLoop : public IEventLoop {
public:
    /// Create an epoll instance and an internal eventfd for cross-thread wakeups.
    EpollEventLoop();
    ~EpollEventLoop() override;

    EpollEventLoop(const EpollEventLoop&) = delete;
    EpollEventLoop& operator=(const EpollEventLoop&) = delete;
    EpollEventLoop(EpollEventLoop&&) = delete;
    EpollEventLoop& operator=(EpollEventLoop&&) = delete;

    /// Queue a callback to run on the event-loop thread.
    void Defer(std::function<void()> fn) override;

    /// Schedule a one-shot callback after @p delay.
    void Schedule(std::chrono::milliseconds delay, TimerCallback fn) override;

    /// @return True if the calling thread is the event-loop thread.
    bool IsInEventLoopThread() const override;

    /// Poll for events with the given timeout (milliseconds). -1 blocks.
    /// The calling thread becomes the event-loop thread.
    void Poll(int timeout_ms);

    /// Run the event loop until Stop() is called.
    void Run();

    /// Signal the loop to exit after the current poll completes.
    void Stop();

    /// Wake the event loop from another thread (e.g. after Defer()).
    void Wake();

    /// @return Number of scheduled timers that have not fired yet.
    std::size_t PendingTimers() const;

private:
    void ProcessDeferredCallbacks();
    void HandleTimerExpired(int timer_fd);

    enum class State { Idle, Running, Stopped };

    int epoll_fd_;
    int wake_fd_ = -1;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::thread::id> loop_thread_id_{};

    mutable std::mutex mutex_;
    std::vector<std::function<void()>> deferred_callbacks_;

    // timerfd -> callback (protected by mutex_)
    std::unordered_map<int, TimerCallback> timers_;

    static constexpr int kMaxEvents = 64;
};

}  // namespace feedpipe

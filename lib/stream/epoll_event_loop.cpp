// SPDX-License-Identifier: MIT

#include "lib/stream/epoll_event_loop.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace feedpipe {

namespace {

[[noreturn]] void ThrowSystemError(const char* what) {
    throw std::runtime_error(std::string(what) + " failed: " +
                             std::strerror(errno));
}

}  // namespace

EpollEventLoop::EpollEventLoop() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        ThrowSystemError("epoll_create1");
    }

    // Create eventfd for cross-thread wakeup
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        int saved = errno;
        close(epoll_fd_);
        errno = saved;
        ThrowSystemError("eventfd");
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        int saved = errno;
        close(wake_fd_);
        close(epoll_fd_);
        errno = saved;
        ThrowSystemError("epoll_ctl ADD wake_fd");
    }
}

EpollEventLoop::~EpollEventLoop() {
    // Pending timers never fire once the loop is gone
    for (auto& [fd, callback] : timers_) {
        close(fd);
    }
    timers_.clear();

    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }

    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

void EpollEventLoop::Defer(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deferred_callbacks_.push_back(std::move(fn));
    }

    if (!IsInEventLoopThread()) {
        Wake();
    }
}

void EpollEventLoop::Schedule(std::chrono::milliseconds delay, TimerCallback fn) {
    int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        ThrowSystemError("timerfd_create");
    }

    // A zero it_value disarms a timerfd, so round up to 1ns
    itimerspec ts{};
    ts.it_value.tv_sec = delay.count() / 1000;
    ts.it_value.tv_nsec = (delay.count() % 1000) * 1000000;
    if (ts.it_value.tv_sec <= 0 && ts.it_value.tv_nsec <= 0) {
        ts.it_value.tv_sec = 0;
        ts.it_value.tv_nsec = 1;
    }

    if (timerfd_settime(tfd, 0, &ts, nullptr) < 0) {
        int saved = errno;
        close(tfd);
        errno = saved;
        ThrowSystemError("timerfd_settime");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.emplace(tfd, std::move(fn));
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = tfd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, tfd, &ev) < 0) {
        int saved = errno;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            timers_.erase(tfd);
        }
        close(tfd);
        errno = saved;
        ThrowSystemError("epoll_ctl ADD timerfd");
    }
}

void EpollEventLoop::HandleTimerExpired(int timer_fd) {
    uint64_t expirations = 0;
    [[maybe_unused]] ssize_t n = read(timer_fd, &expirations, sizeof(expirations));

    TimerCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(timer_fd);
        if (it == timers_.end()) {
            return;
        }
        callback = std::move(it->second);
        timers_.erase(it);
    }

    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, timer_fd, nullptr);
    close(timer_fd);

    // Execute callback outside the lock
    if (callback) {
        callback();
    }
}

bool EpollEventLoop::IsInEventLoopThread() const {
    return std::this_thread::get_id() == loop_thread_id_.load();
}

std::size_t EpollEventLoop::PendingTimers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EpollEventLoop::Poll(int timeout_ms) {
    loop_thread_id_.store(std::this_thread::get_id());

    ProcessDeferredCallbacks();

    epoll_event events[kMaxEvents];
    int nfds = epoll_wait(epoll_fd_, events, kMaxEvents, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) {
            return;
        }
        ThrowSystemError("epoll_wait");
    }

    for (int i = 0; i < nfds; ++i) {
        int fd = events[i].data.fd;
        if (fd == wake_fd_) {
            uint64_t val;
            [[maybe_unused]] ssize_t n = read(wake_fd_, &val, sizeof(val));
        } else {
            HandleTimerExpired(fd);
        }
    }

    // Callbacks deferred by timers or by the wakeup run in the same iteration
    ProcessDeferredCallbacks();
}

void EpollEventLoop::Run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Running)) {
        return;  // Already running or stopped
    }
    while (state_.load() == State::Running) {
        Poll(100);  // 100ms timeout to check state_ periodically
    }
}

void EpollEventLoop::Stop() {
    state_.store(State::Stopped);
    Wake();
}

void EpollEventLoop::Wake() {
    uint64_t val = 1;
    [[maybe_unused]] ssize_t n = write(wake_fd_, &val, sizeof(val));
}

void EpollEventLoop::ProcessDeferredCallbacks() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.swap(deferred_callbacks_);
    }

    for (auto& cb : callbacks) {
        if (cb) {
            cb();
        }
    }
}

// EventLoop facade

struct EventLoop::Impl : EpollEventLoop {};

EventLoop::EventLoop() : impl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::Poll(int timeout_ms) {
    impl_->Poll(timeout_ms);
}

void EventLoop::Run() {
    impl_->Run();
}

void EventLoop::Stop() {
    impl_->Stop();
}

EventLoop::operator IEventLoop&() {
    return *impl_;
}

EventLoop::operator const IEventLoop&() const {
    return *impl_;
}

}  // namespace feedpipe

#include "kernel/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace agentbus::kernel {

Reactor::Reactor() = default;

Reactor::~Reactor() {
    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    if (epoll_fd_ >= 0) {
        return true;
    }
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll: {}", strerror(errno));
        return false;
    }

    // Cross-thread wakeup for post() and timers added off the loop thread
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::error("Failed to create eventfd: {}", strerror(errno));
        close(epoll_fd_);
        epoll_fd_ = -1;
        return false;
    }
    if (!add(wake_fd_, EPOLLIN, [this](int, uint32_t) { drain_wake_fd(); })) {
        close(wake_fd_);
        close(epoll_fd_);
        wake_fd_ = -1;
        epoll_fd_ = -1;
        return false;
    }
    spdlog::debug("Reactor initialized (epoll_fd={})", epoll_fd_);
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Failed to add fd {} to epoll: {}", fd, strerror(errno));
        return false;
    }

    callbacks_[fd] = std::move(callback);
    spdlog::debug("Added fd {} to reactor (events=0x{:x})", fd, events);
    return true;
}

bool Reactor::modify(int fd, uint32_t events) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        spdlog::error("Failed to modify fd {} in epoll: {}", fd, strerror(errno));
        return false;
    }

    spdlog::trace("Modified fd {} in reactor (events=0x{:x})", fd, events);
    return true;
}

bool Reactor::remove(int fd) {
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        // ENOENT is ok - fd might already be closed
        if (errno != ENOENT && errno != EBADF) {
            spdlog::error("Failed to remove fd {} from epoll: {}", fd, strerror(errno));
            return false;
        }
    }

    callbacks_.erase(fd);
    spdlog::debug("Removed fd {} from reactor", fd);
    return true;
}

TimerId Reactor::add_timer(int delay_ms, TimerCallback callback, bool repeating) {
    auto interval = std::chrono::milliseconds(std::max(delay_ms, 0));
    auto deadline = Clock::now() + interval;

    TimerId id;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        id = next_timer_id_++;
        timers_[id] = Timer{deadline, interval, repeating, std::move(callback)};
        deadlines_.emplace(deadline, id);
    }

    // A poll blocked on another thread must recompute its timeout
    if (!in_loop_thread()) {
        wake();
    }
    return id;
}

bool Reactor::cancel_timer(TimerId id) {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }

    auto range = deadlines_.equal_range(it->second.deadline);
    for (auto d = range.first; d != range.second; ++d) {
        if (d->second == id) {
            deadlines_.erase(d);
            break;
        }
    }
    timers_.erase(it);
    return true;
}

size_t Reactor::pending_timers() const {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    return timers_.size();
}

void Reactor::post(TimerCallback task) {
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        posted_.push_back(std::move(task));
    }
    wake();
}

bool Reactor::in_loop_thread() const {
    std::thread::id loop = loop_thread_.load();
    return loop == std::thread::id{} || loop == std::this_thread::get_id();
}

void Reactor::wake() {
    if (wake_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        spdlog::warn("Reactor wakeup failed: {}", strerror(errno));
    }
}

void Reactor::drain_wake_fd() {
    uint64_t count = 0;
    while (read(wake_fd_, &count, sizeof(count)) > 0) {
    }
}

int Reactor::next_timer_timeout(int timeout_ms) const {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (deadlines_.empty()) {
        return timeout_ms;
    }

    auto until = std::chrono::ceil<std::chrono::milliseconds>(
        deadlines_.begin()->first - Clock::now()).count();
    int timer_ms = static_cast<int>(std::max<int64_t>(until, 0));
    if (timeout_ms < 0) {
        return timer_ms;
    }
    return std::min(timeout_ms, timer_ms);
}

int Reactor::run_due_timers() {
    auto now = Clock::now();
    std::vector<TimerId> due;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
            due.push_back(deadlines_.begin()->second);
            deadlines_.erase(deadlines_.begin());
        }
    }

    int fired = 0;
    for (TimerId id : due) {
        TimerCallback callback;
        {
            std::lock_guard<std::mutex> lock(timer_mutex_);
            // An earlier callback may have cancelled this one
            auto it = timers_.find(id);
            if (it == timers_.end()) {
                continue;
            }

            callback = it->second.callback;
            if (it->second.repeating) {
                it->second.deadline = std::max(it->second.deadline + it->second.interval, now);
                deadlines_.emplace(it->second.deadline, id);
            } else {
                timers_.erase(it);
            }
        }

        // Called unlocked: callbacks add and cancel timers
        callback();
        fired++;
    }
    return fired;
}

int Reactor::run_posted() {
    std::deque<TimerCallback> tasks;
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) {
        task();
    }
    return static_cast<int>(tasks.size());
}

int Reactor::poll(int timeout_ms) {
    constexpr int MAX_EVENTS = 64;
    struct epoll_event events[MAX_EVENTS];

    loop_thread_.store(std::this_thread::get_id());

    int wait_ms = next_timer_timeout(timeout_ms);
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        if (!posted_.empty()) {
            wait_ms = 0;
        }
    }
    int n = 0;
    if (epoll_fd_ >= 0) {
        n = epoll_wait(epoll_fd_, events, MAX_EVENTS, wait_ms);
        if (n < 0) {
            if (errno != EINTR) {
                spdlog::error("epoll_wait failed: {}", strerror(errno));
                return -1;
            }
            n = 0; // Interrupted, not an error
        }
    }

    // Process events
    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;
        uint32_t ev = events[i].events;

        auto it = callbacks_.find(fd);
        if (it != callbacks_.end()) {
            // The callback may remove its own registration
            EventCallback callback = it->second;
            callback(fd, ev);
        }
    }

    return n + run_posted() + run_due_timers();
}

void Reactor::run() {
    running_ = true;
    spdlog::info("Reactor starting event loop");

    while (running_) {
        int n = poll(100); // 100ms timeout for responsiveness
        if (n < 0) {
            break;
        }
    }

    spdlog::info("Reactor event loop stopped");
}

void Reactor::stop() {
    running_ = false;
}

} // namespace agentbus::kernel

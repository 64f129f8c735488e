#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace agentbus::kernel {

// Event callback: (fd, events) -> void
using EventCallback = std::function<void(int fd, uint32_t events)>;

using TimerId = uint64_t;
using TimerCallback = std::function<void()>;

// fd registration (add/modify/remove) belongs to the loop thread. Timers and
// post() may be used from any thread; they wake a blocked poll().
class Reactor {
public:
    using Clock = std::chrono::steady_clock;

    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Initialize epoll
    bool init();

    // Add fd to watch (returns true on success)
    bool add(int fd, uint32_t events, EventCallback callback);

    // Modify watched events for fd
    bool modify(int fd, uint32_t events);

    // Remove fd from watch
    bool remove(int fd);

    // Fire `callback` once after delay_ms, or every delay_ms when repeating.
    // Timer ids are never reused, so cancelling a fired timer is harmless.
    TimerId add_timer(int delay_ms, TimerCallback callback, bool repeating = false);

    // Returns false if the timer already fired (one-shot) or was cancelled
    bool cancel_timer(TimerId id);

    size_t pending_timers() const;

    // Run `task` on the loop thread during the next poll()
    void post(TimerCallback task);

    // True on the thread that polls, and before the loop has ever run
    bool in_loop_thread() const;

    // Run one iteration of event loop, then fire due timers.
    // timeout_ms: -1 = block until the next timer or event, 0 = return immediately
    int poll(int timeout_ms = -1);

    // Run event loop until stopped
    void run();

    // Stop the event loop
    void stop();

    // Check if running
    bool is_running() const { return running_; }

private:
    struct Timer {
        Clock::time_point deadline;
        std::chrono::milliseconds interval;
        bool repeating;
        TimerCallback callback;
    };

    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<std::thread::id> loop_thread_{std::thread::id{}};
    std::unordered_map<int, EventCallback> callbacks_;

    mutable std::mutex timer_mutex_;
    TimerId next_timer_id_ = 1;
    std::unordered_map<TimerId, Timer> timers_;
    std::multimap<Clock::time_point, TimerId> deadlines_;

    std::mutex post_mutex_;
    std::deque<TimerCallback> posted_;

    int next_timer_timeout(int timeout_ms) const;
    int run_due_timers();
    int run_posted();
    void wake();
    void drain_wake_fd();
};

} // namespace agentbus::kernel

#pragma once
#include <functional>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <cstdint>

namespace devsnap::broker {

// Event callback: (fd, events) -> void
using EventCallback = std::function<void(int fd, uint32_t events)>;

// Work handed to the reactor thread from other threads
using Task = std::function<void()>;

// epoll loop driven by the broker thread. Everything except post() must be
// called from that thread.
class Reactor {
public:
    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Initialize epoll and the wakeup eventfd
    bool init();

    // Add fd to watch (returns true on success)
    bool add(int fd, uint32_t events, EventCallback callback);

    // Modify watched events for fd
    bool modify(int fd, uint32_t events);

    // Remove fd from watch
    bool remove(int fd);

    // Queue a task to run on the reactor thread. Safe from any thread.
    // Returns false if the reactor is not initialized.
    bool post(Task task);

    // Run one iteration of event loop
    // timeout_ms: -1 = block forever, 0 = return immediately
    int poll(int timeout_ms = -1);

    // Number of fds currently watched, the wakeup fd included
    size_t watched() const { return callbacks_.size(); }

private:
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    // Registration generation travels in epoll_event.data so events queued
    // for a closed fd are not handed to a later registration of the same number
    struct Watch {
        uint32_t generation;
        EventCallback callback;
    };
    std::unordered_map<int, Watch> callbacks_;
    uint32_t next_generation_ = 0;

    std::mutex tasks_mutex_;
    std::vector<Task> tasks_;

    void drain_tasks();
};

} // namespace devsnap::broker

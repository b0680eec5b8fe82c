#include "broker/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace devsnap::broker {

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
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll: {}", strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::error("Failed to create wakeup eventfd: {}", strerror(errno));
        return false;
    }

    bool added = add(wake_fd_, EPOLLIN, [this](int fd, uint32_t) {
        uint64_t counter = 0;
        // Reset the counter; EAGAIN just means another drain already ran
        while (read(fd, &counter, sizeof(counter)) > 0) {
        }
        drain_tasks();
    });
    if (!added) {
        return false;
    }

    spdlog::debug("Reactor initialized (epoll_fd={}, wake_fd={})", epoll_fd_, wake_fd_);
    return true;
}

namespace {

uint64_t pack_event_data(int fd, uint32_t generation) {
    return (static_cast<uint64_t>(generation) << 32) | static_cast<uint32_t>(fd);
}

} // namespace

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    uint32_t generation = ++next_generation_;

    struct epoll_event ev;
    ev.events = events;
    ev.data.u64 = pack_event_data(fd, generation);

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Failed to add fd {} to epoll: {}", fd, strerror(errno));
        return false;
    }

    callbacks_[fd] = Watch{generation, std::move(callback)};
    spdlog::debug("Added fd {} to reactor (events=0x{:x}, generation={})", fd, events, generation);
    return true;
}

bool Reactor::modify(int fd, uint32_t events) {
    auto it = callbacks_.find(fd);
    if (it == callbacks_.end()) {
        spdlog::error("Cannot modify fd {}: not watched", fd);
        return false;
    }

    struct epoll_event ev;
    ev.events = events;
    ev.data.u64 = pack_event_data(fd, it->second.generation);

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        spdlog::error("Failed to modify fd {} in epoll: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::remove(int fd) {
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        // ENOENT is ok - fd might already be closed
        if (errno != ENOENT) {
            spdlog::error("Failed to remove fd {} from epoll: {}", fd, strerror(errno));
            return false;
        }
    }

    callbacks_.erase(fd);
    spdlog::debug("Removed fd {} from reactor", fd);
    return true;
}

bool Reactor::post(Task task) {
    if (wake_fd_ < 0) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_.push_back(std::move(task));
    }

    uint64_t one = 1;
    if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        spdlog::warn("Failed to wake reactor: {}", strerror(errno));
    }
    return true;
}

void Reactor::drain_tasks() {
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        batch.swap(tasks_);
    }

    for (auto& task : batch) {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Reactor task failed: {}", e.what());
        }
    }
}

int Reactor::poll(int timeout_ms) {
    constexpr int MAX_EVENTS = 64;
    struct epoll_event events[MAX_EVENTS];

    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0; // Interrupted, not an error
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    // Process events
    for (int i = 0; i < n; i++) {
        int fd = static_cast<int>(events[i].data.u64 & 0xFFFFFFFFu);
        uint32_t generation = static_cast<uint32_t>(events[i].data.u64 >> 32);
        uint32_t ev = events[i].events;

        auto it = callbacks_.find(fd);
        if (it == callbacks_.end() || it->second.generation != generation) {
            continue; // fd closed (and maybe reused) earlier in this batch
        }

        // Copy: the callback may remove its own fd from the map
        EventCallback callback = it->second.callback;
        callback(fd, ev);
    }

    return n;
}

} // namespace devsnap::broker

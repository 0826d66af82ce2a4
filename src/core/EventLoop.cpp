#include "nxlink/core/EventLoop.hpp"

#include "nxlink/Error.hpp"
#include "nxlink/core/CancellationToken.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <limits>
#include <system_error>

#include <sys/epoll.h>
#include <unistd.h>

namespace nxlink::core {

namespace {
constexpr int kMaxEvents = 4;

int remaining_timeout_ms(const EventLoop::Deadline& deadline) {
    if (!deadline) {
        return -1;
    }
    const auto now = EventLoop::Clock::now();
    if (*deadline <= now) {
        return 0;
    }
    // Deadlines further out than epoll_wait can express are waited for in
    // several rounds.
    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);
    return static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(),
                                                                     std::numeric_limits<int>::max()));
}

class WatchGuard {
public:
    WatchGuard(int backend_fd, int fd) : backend_fd_(backend_fd), fd_(fd) {}
    ~WatchGuard() {
        ::epoll_ctl(backend_fd_, EPOLL_CTL_DEL, fd_, nullptr);
    }

    WatchGuard(const WatchGuard&) = delete;
    WatchGuard& operator=(const WatchGuard&) = delete;

private:
    int backend_fd_;
    int fd_;
};

}  // namespace

EventLoop::EventLoop(const CancellationToken* token)
    : token_(token) {
    backend_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (backend_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "epoll_create1 failed");
    }
    if (token_) {
        epoll_event event{};
        event.events = EPOLLIN;
        event.data.fd = token_->native_handle();
        if (::epoll_ctl(backend_fd_, EPOLL_CTL_ADD, token_->native_handle(), &event) != 0) {
            const int error = errno;
            ::close(backend_fd_);
            throw std::system_error(error, std::generic_category(), "epoll_ctl ADD cancel_fd failed");
        }
    }
}

EventLoop::~EventLoop() {
    if (backend_fd_ >= 0) {
        ::close(backend_fd_);
    }
}

std::uint32_t EventLoop::wait(int fd, std::uint32_t events, Deadline deadline) {
    throw_if_cancelled();

    epoll_event event{};
    if (events & kEventReadable) {
        event.events |= EPOLLIN;
    }
    if (events & kEventWritable) {
        event.events |= EPOLLOUT;
    }
    event.data.fd = fd;
    if (::epoll_ctl(backend_fd_, EPOLL_CTL_ADD, fd, &event) != 0) {
        throw std::system_error(errno, std::generic_category(), "epoll_ctl ADD failed");
    }
    WatchGuard guard{backend_fd_, fd};

    std::array<epoll_event, kMaxEvents> ready_events{};
    while (true) {
        const int ready = ::epoll_wait(backend_fd_, ready_events.data(), kMaxEvents,
                                       remaining_timeout_ms(deadline));
        if (ready < 0) {
            if (errno == EINTR) {
                throw_if_cancelled();
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "epoll_wait failed");
        }
        if (ready == 0) {
            if (remaining_timeout_ms(deadline) == 0) {
                return kEventNone;
            }
            continue;
        }

        std::uint32_t mask = kEventNone;
        for (int i = 0; i < ready; ++i) {
            if (token_ && ready_events[i].data.fd == token_->native_handle()) {
                throw OperationCancelled();
            }
            if (ready_events[i].data.fd == fd) {
                mask |= translate_events(ready_events[i].events);
            }
        }
        if (mask != kEventNone) {
            return mask;
        }
    }
}

void EventLoop::throw_if_cancelled() const {
    if (cancelled()) {
        throw OperationCancelled();
    }
}

bool EventLoop::cancelled() const noexcept {
    return token_ != nullptr && token_->cancelled();
}

std::uint32_t EventLoop::translate_events(std::uint32_t backend_mask) const {
    std::uint32_t mask = kEventNone;
    if (backend_mask & EPOLLIN) {
        mask |= kEventReadable;
    }
    if (backend_mask & EPOLLOUT) {
        mask |= kEventWritable;
    }
    if (backend_mask & (EPOLLERR | EPOLLHUP)) {
        mask |= kEventError;
    }
    return mask;
}

}  // namespace nxlink::core

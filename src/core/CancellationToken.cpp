#include "nxlink/core/CancellationToken.hpp"

#include <cerrno>
#include <cstdint>
#include <system_error>

#include <sys/eventfd.h>
#include <unistd.h>

namespace nxlink::core {

CancellationToken::CancellationToken() {
    event_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (event_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "eventfd failed");
    }
}

CancellationToken::~CancellationToken() {
    if (event_fd_ >= 0) {
        ::close(event_fd_);
    }
}

void CancellationToken::cancel() noexcept {
    if (cancelled_.exchange(true)) {
        return;
    }
    const std::uint64_t value = 1;
    const auto written = ::write(event_fd_, &value, sizeof(value));
    (void)written;
}

bool CancellationToken::cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
}

}  // namespace nxlink::core

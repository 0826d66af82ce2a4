#pragma once

#include <atomic>

namespace nxlink::core {

// Cooperative cancellation signal shared between an operation and whoever
// may abandon it. Backed by an eventfd so event loops can wait on it next to
// their sockets. cancel() is async-signal-safe and may be called from a
// SIGINT handler.
class CancellationToken {
public:
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

    // Readable once cancel() has been called. The counter is never drained,
    // so every subsequent wait observes the cancellation.
    [[nodiscard]] int native_handle() const noexcept {
        return event_fd_;
    }

private:
    int event_fd_{-1};
    std::atomic<bool> cancelled_{false};
};

}  // namespace nxlink::core

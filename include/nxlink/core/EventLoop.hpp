#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace nxlink::core {

class CancellationToken;

// Single-threaded suspension point for non-blocking sockets. Each wait()
// races the readiness of one descriptor against the loop's cancellation
// token and an optional deadline. One loop drives one operation at a time.
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using Deadline = std::optional<Clock::time_point>;

    static constexpr std::uint32_t kEventNone = 0;
    static constexpr std::uint32_t kEventReadable = 1u << 0;
    static constexpr std::uint32_t kEventWritable = 1u << 1;
    static constexpr std::uint32_t kEventError = 1u << 2;

    explicit EventLoop(const CancellationToken* token = nullptr);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Suspends until fd reports one of the requested events. Returns the
    // observed mask, or kEventNone if the deadline elapsed first. Throws
    // OperationCancelled when the token fires.
    std::uint32_t wait(int fd, std::uint32_t events, Deadline deadline = std::nullopt);

    void throw_if_cancelled() const;
    [[nodiscard]] bool cancelled() const noexcept;

private:
    std::uint32_t translate_events(std::uint32_t backend_mask) const;

    int backend_fd_{-1};
    const CancellationToken* token_{nullptr};
};

}  // namespace nxlink::core

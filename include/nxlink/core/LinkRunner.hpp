#pragma once

#include "nxlink/Config.hpp"
#include "nxlink/core/CancellationToken.hpp"
#include "nxlink/core/LinkRequest.hpp"

#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

namespace nxlink::core {

class EventLoop;

struct LinkOutcome {
    std::string server_address;
    std::string destination;
    std::uint64_t file_length{0};
    bool stdio_served{false};
    bool stdio_interrupted{false};
};

// Drives one `nxlink` invocation: resolve the server (explicit address or
// discovery), upload the file, then optionally relay the app's console.
// All network phases share the runner's cancellation token. Failures
// propagate unchanged; phase() tells which step raised them.
class LinkRunner {
public:
    enum class Phase {
        Preparing,
        Discovery,
        Upload,
        Stdio,
        Finished
    };

    LinkRunner(const Config& config,
               const CancellationToken& token,
               std::ostream& console = std::cout,
               std::ostream& stdio_sink = std::cout);

    LinkOutcome run(const LinkRequest& request);

    Phase phase() const noexcept { return phase_; }

private:
    std::string resolve_server(EventLoop& loop, const LinkRequest& request);

    const Config& config_;
    const CancellationToken& token_;
    std::ostream& console_;
    std::ostream& stdio_sink_;
    Phase phase_{Phase::Preparing};
};

std::string_view phase_name(LinkRunner::Phase phase) noexcept;

}  // namespace nxlink::core

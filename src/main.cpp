#include "nxlink/Config.hpp"
#include "nxlink/Error.hpp"
#include "nxlink/config/ConfigLoader.hpp"
#include "nxlink/core/CancellationToken.hpp"
#include "nxlink/core/LinkRequest.hpp"
#include "nxlink/core/LinkRunner.hpp"
#include "nxlink/util/StructuredLogger.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <signal.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#ifndef NXLINK_VERSION
#define NXLINK_VERSION "v0.1.0"
#endif

using namespace nxlink;

namespace {

constexpr std::string_view kNxlinkVersion = NXLINK_VERSION;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 130;

struct GlobalOptions {
    std::optional<std::string> config_path{};
    std::optional<std::string> profile_name{};
    std::optional<std::uint32_t> timeout_ms{};
    bool verbose{false};
    core::LinkRequest request{};
    bool file_set{false};
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw Error(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const Error& ex, std::string_view context = {}) {
    if (context.empty()) {
        std::cerr << ex.what() << std::endl;
    } else {
        std::cerr << context << ": " << ex.what() << std::endl;
    }
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

// Prefix for failures that escape LinkRunner, keyed on the phase it was in.
std::string_view phase_context(core::LinkRunner::Phase phase) {
    switch (phase) {
        case core::LinkRunner::Phase::Discovery:
            return "Server discovery failed";
        case core::LinkRunner::Phase::Upload:
            return "Failed to send the file";
        case core::LinkRunner::Phase::Stdio:
            return "Stdio server failed";
        case core::LinkRunner::Phase::Preparing:
        case core::LinkRunner::Phase::Finished:
            break;
    }
    return {};
}

std::atomic<core::CancellationToken*> g_cancellation{nullptr};
static_assert(std::atomic<core::CancellationToken*>::is_always_lock_free);

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGQUIT
    case SIGQUIT:
#endif
        if (auto* token = g_cancellation.load()) {
            token->cancel();
        }
        break;
    default:
        break;
    }
}

void install_termination_handlers(core::CancellationToken& token) {
    g_cancellation.store(&token);
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#ifdef SIGQUIT
    install(SIGQUIT);
#endif
    // A peer that closes mid-write must surface as EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#ifdef SIGQUIT
    std::signal(SIGQUIT, SIG_DFL);
#endif
    g_cancellation.store(nullptr);
}

void print_usage() {
    std::cout << "nxlink: send homebrew to a netloader server" << std::endl;
    std::cout << "Usage: nxlink [options] <file.nro> [nro-args...]\n\n";
    std::cout << "Options:\n"
              << "  -a, --address <ip>       Netloader server address (skips discovery)\n"
              << "  -r, --retries <n>        Number of discovery attempts (default 10)\n"
              << "  -p, --path <path>        Upload path on the target; ends in .nro or '/'\n"
              << "      --args <args>        Extra arguments, split on spaces, quotes group\n"
              << "  -s, --server             Start the stdio server after the upload\n"
              << "      --timeout-ms <n>     Per-attempt discovery timeout (default 250)\n"
              << "      --config <file>      Load configuration from a YAML file\n"
              << "      --profile <name>     Select configuration profile (default: default)\n"
              << "  -v, --verbose            Enable debug logging on stderr\n"
              << "      --version            Print the version and exit\n"
              << "  -h, --help               Print this help message\n";
}

bool parse_uint32(std::string_view text, std::uint32_t& value) {
    std::uint64_t temp{};
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, temp);
    if (result.ec != std::errc{} || result.ptr != end || temp > std::numeric_limits<std::uint32_t>::max()) {
        return false;
    }
    value = static_cast<std::uint32_t>(temp);
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    core::LinkRunner::Phase failed_phase = core::LinkRunner::Phase::Preparing;
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        auto require_once = [](bool already_set, std::string_view option) {
            if (already_set) {
                throw_cli_error("E_DUPLICATE_OPTION",
                                "Option " + std::string(option) + " specified multiple times",
                                "Provide " + std::string(option) + " only once");
            }
        };

        while (index < args.size()) {
            const auto opt = args[index++];
            if (options.file_set) {
                options.request.arguments.emplace_back(opt);
                continue;
            }
            if (opt == "--") {
                if (index >= args.size()) {
                    break;
                }
                options.request.file = std::string(args[index++]);
                options.file_set = true;
                continue;
            }
            if (!opt.starts_with("-") || opt == "-") {
                options.request.file = std::string(opt);
                options.file_set = true;
                continue;
            }
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "nxlink " << kNxlinkVersion << std::endl;
                return 0;
            }
            if (opt == "--address" || opt == "-a") {
                require_once(options.request.address.has_value(), opt);
                options.request.address = require_value(opt);
                if (options.request.address->empty()) {
                    throw_cli_error("E_INVALID_ADDRESS", "Server address cannot be empty");
                }
                continue;
            }
            if (opt == "--retries" || opt == "-r") {
                require_once(options.request.retries.has_value(), opt);
                const auto text = require_value(opt);
                std::uint32_t retries{};
                if (!parse_uint32(text, retries)) {
                    throw_cli_error("E_INVALID_RETRIES",
                                    "Invalid value for " + std::string(opt) + ": " + text,
                                    "Use a non-negative integer");
                }
                options.request.retries = retries;
                continue;
            }
            if (opt == "--path" || opt == "-p") {
                require_once(options.request.upload_path.has_value(), opt);
                options.request.upload_path = require_value(opt);
                continue;
            }
            if (opt == "--args") {
                require_once(options.request.extra_args.has_value(), opt);
                options.request.extra_args = require_value(opt);
                continue;
            }
            if (opt == "--server" || opt == "-s") {
                options.request.start_server = true;
                continue;
            }
            if (opt == "--timeout-ms") {
                require_once(options.timeout_ms.has_value(), opt);
                const auto text = require_value(opt);
                std::uint32_t timeout{};
                if (!parse_uint32(text, timeout) || timeout == 0 ||
                    timeout > static_cast<std::uint64_t>(kMaxDiscoveryTimeout.count())) {
                    throw_cli_error("E_INVALID_TIMEOUT",
                                    "Invalid value for --timeout-ms: " + text,
                                    "Use a positive number of milliseconds up to " +
                                        std::to_string(kMaxDiscoveryTimeout.count()));
                }
                options.timeout_ms = timeout;
                continue;
            }
            if (opt == "--config") {
                require_once(options.config_path.has_value(), opt);
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--profile") {
                require_once(options.profile_name.has_value(), opt);
                options.profile_name = require_value(opt);
                continue;
            }
            if (opt == "--verbose" || opt == "-v") {
                options.verbose = true;
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'nxlink --help' to see the supported options");
        }

        if (!options.file_set) {
            throw_cli_error("E_MISSING_FILE",
                            "No .nro file specified",
                            "Usage: nxlink [options] <file.nro> [nro-args...]");
        }
        if (options.profile_name && !options.config_path) {
            throw_cli_error("E_PROFILE_WITHOUT_CONFIG",
                            "--profile requires --config",
                            "Pass the configuration file that defines the profile");
        }

        Config settings{};
        if (options.config_path) {
            settings = config::load_config(*options.config_path, options.profile_name);
        }
        if (options.timeout_ms) {
            settings.discovery_timeout = std::chrono::milliseconds(*options.timeout_ms);
        }

        auto& logger = util::StructuredLogger::instance();
        if (options.verbose) {
            logger.set_min_level(util::StructuredLogger::Level::Debug);
        } else if (const auto level = util::StructuredLogger::parse_level(settings.log_level)) {
            logger.set_min_level(*level);
        }

        core::CancellationToken token;
        install_termination_handlers(token);
        core::LinkRunner runner{settings, token};
        try {
            const auto outcome = runner.run(options.request);
            uninstall_termination_handlers();
            logger.log(util::StructuredLogger::Level::Info,
                       "link.finished",
                       {{"server", outcome.server_address},
                        {"destination", outcome.destination},
                        {"stdio", outcome.stdio_served ? "served" : "skipped"}});
        } catch (...) {
            failed_phase = runner.phase();
            uninstall_termination_handlers();
            throw;
        }
        return 0;
    } catch (const OperationCancelled&) {
        std::cerr << "Aborted by the user" << std::endl;
        return kExitCancelled;
    } catch (const Error& ex) {
        print_cli_error(ex, phase_context(failed_phase));
        return kExitFailure;
    } catch (const std::system_error& ex) {
        const auto context = phase_context(failed_phase);
        if (context.empty()) {
            std::cerr << "[E_IO] " << ex.what() << std::endl;
        } else {
            std::cerr << context << ": [E_IO] " << ex.what() << std::endl;
        }
        return kExitFailure;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return kExitFailure;
    }
}

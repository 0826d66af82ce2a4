#include "loopback_peer.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <sys/wait.h>

namespace {

struct CommandResult {
    int exit_code;
    std::string output;
};

CommandResult run_cli(const std::string& executable, const std::string& arguments) {
    const std::string command = "\"" + executable + "\" " + arguments + " 2>&1";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to open a pipe to the CLI");
    }

    std::string output;
    std::array<char, 256> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe)) {
        output.append(buffer.data());
    }

    const int status = pclose(pipe);
    int exit_code = -1;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    return CommandResult{exit_code, output};
}

bool expect_contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::filesystem::path write_temp_file(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file << contents;
    file.close();
    return path;
}

bool check(const CommandResult& result, bool expect_success, const std::string& needle, const std::string& label) {
    const bool status_ok = expect_success ? result.exit_code == 0 : result.exit_code == 1;
    if (!status_ok || !expect_contains(result.output, needle)) {
        std::cerr << "Failure on " << label << ". exit=" << result.exit_code << "\n" << result.output << std::endl;
        return false;
    }
    return true;
}

}  // namespace

int main() {
    const char* executable_env = std::getenv("NXLINK_CLI_EXECUTABLE");
    if (!executable_env) {
        std::cerr << "NXLINK_CLI_EXECUTABLE is not defined" << std::endl;
        return 1;
    }
    const std::string executable = std::filesystem::path(executable_env).string();

    try {
        const auto nro = write_temp_file("nxlink_cli_app.nro", "NRO0");
        const auto elf = write_temp_file("nxlink_cli_app.elf", "ELF");
        const auto bad_config = write_temp_file("nxlink_cli_bad.yaml",
                                                "profiles:\n  default:\n    network:\n      server_port: 0\n");

        if (!check(run_cli(executable, "--help"), true, "Usage: nxlink", "--help")) {
            return 1;
        }
        if (!check(run_cli(executable, "--version"), true, "nxlink v", "--version")) {
            return 1;
        }
        if (!check(run_cli(executable, ""), false, "[E_MISSING_FILE]", "missing file")) {
            return 1;
        }
        if (!check(run_cli(executable, "--bogus app.nro"), false, "[E_UNKNOWN_OPTION]", "unknown option")) {
            return 1;
        }
        if (!check(run_cli(executable, "-a"), false, "[E_MISSING_VALUE]", "-a without value")) {
            return 1;
        }
        if (!check(run_cli(executable, "-r many " + nro.string()), false, "[E_INVALID_RETRIES]", "bad --retries")) {
            return 1;
        }
        if (!check(run_cli(executable, "--timeout-ms 0 " + nro.string()), false, "[E_INVALID_TIMEOUT]",
                   "zero --timeout-ms")) {
            return 1;
        }
        if (!check(run_cli(executable, "--timeout-ms 3600001 " + nro.string()), false, "[E_INVALID_TIMEOUT]",
                   "oversized --timeout-ms")) {
            return 1;
        }
        if (!check(run_cli(executable, "-a 127.0.0.1 -a 127.0.0.2 " + nro.string()), false,
                   "[E_DUPLICATE_OPTION]", "duplicate --address")) {
            return 1;
        }
        if (!check(run_cli(executable, "-a 127.0.0.1 /nonexistent/dir/app.nro"), false, "[E_FILE_NOT_FOUND]",
                   "missing .nro")) {
            return 1;
        }
        if (!check(run_cli(executable, "-a 127.0.0.1 " + elf.string()), false, "[E_INVALID_EXTENSION]",
                   "non-.nro file")) {
            return 1;
        }
        if (!check(run_cli(executable, "-a 127.0.0.1 -p switch/app " + nro.string()), false, "[E_INVALID_PATH]",
                   "invalid --path")) {
            return 1;
        }
        if (!check(run_cli(executable, "-a 127.0.0.1 -p switch/app " + nro.string()), false,
                   "Hint: Use a path ending in .nro", "invalid --path hint")) {
            return 1;
        }
        if (!check(run_cli(executable, "--profile lab " + nro.string()), false, "[E_PROFILE_WITHOUT_CONFIG]",
                   "--profile without --config")) {
            return 1;
        }
        if (!check(run_cli(executable, "--config " + bad_config.string() + " " + nro.string()), false,
                   "[E_CONFIG_VALUE]", "invalid config value")) {
            return 1;
        }
        if (!check(run_cli(executable, "--config /nonexistent/nxlink.yaml " + nro.string()), false,
                   "[E_CONFIG_NOT_FOUND]", "missing config")) {
            return 1;
        }
        if (!check(run_cli(executable, "-r 0 " + nro.string()), false, "Server discovery failed",
                   "discovery without attempts")) {
            return 1;
        }

        {
            // Nothing listens on the chosen port: the upload phase reports it.
            const auto port = nxlink::test::pick_free_tcp_port();
            const auto config = write_temp_file("nxlink_cli_port.yaml",
                                                "profiles:\n  default:\n    network:\n      server_port: " +
                                                    std::to_string(port) + "\n");
            const auto refused = run_cli(executable, "--config " + config.string() + " -a 127.0.0.1 " + nro.string());
            std::filesystem::remove(config);
            if (!check(refused, false, "Failed to send the file", "refused upload")) {
                return 1;
            }
        }

        {
            nxlink::test::ScriptedServer server{0, 0};
            const auto config = write_temp_file("nxlink_cli_upload.yaml",
                                                "profiles:\n  default:\n    network:\n      server_port: " +
                                                    std::to_string(server.port()) + "\n");
            const auto uploaded = run_cli(executable, "--config " + config.string() + " -a 127.0.0.1 --args \"second third\" " +
                                                          nro.string() + " first");
            std::filesystem::remove(config);
            if (!check(uploaded, true, "File sent successfully", "successful upload")) {
                return 1;
            }
            const auto& record = server.finish();
            const std::string arguments(record.arguments.begin(), record.arguments.end());
            if (record.name != "nxlink_cli_app.nro" ||
                arguments != std::string("first\0second\0third\0", 19)) {
                std::cerr << "Unexpected upload record: name=" << record.name << std::endl;
                return 1;
            }
        }

        std::filesystem::remove(nro);
        std::filesystem::remove(elf);
        std::filesystem::remove(bad_config);
    } catch (const std::exception& ex) {
        std::cerr << "Exception during CLI tests: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}

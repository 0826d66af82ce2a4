#include "nxlink/Config.hpp"
#include "nxlink/config/ConfigLoader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace std::chrono_literals;
using namespace nxlink;

namespace {

std::filesystem::path write_temp_file(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file << contents;
    file.close();
    return path;
}

std::string error_code_of(const std::string& yaml, const std::string& profile) {
    try {
        const auto document = config::parse_yaml(yaml);
        const auto* profiles = config::find_path(document, {"profiles"});
        assert(profiles != nullptr);
        Config cfg{};
        config::apply_profile(config::resolve_profile(*profiles, profile), cfg);
    } catch (const config::ConfigError& ex) {
        return ex.code();
    }
    return {};
}

}  // namespace

int main() {
    try {
        {
            const auto document = config::parse_yaml(
                "# netloader settings\n"
                "profiles:\n"
                "  default:\n"
                "    discovery:\n"
                "      timeout_ms: 500   # slow wifi\n"
                "      retries: 3\n"
                "      broadcast_address: \"192.168.0.255\"\n"
                "    link:\n"
                "      server: true\n"
                "    log:\n"
                "      level: 'info'\n");
            assert(document.is_object());
            const auto timeout = config::get_int64(document, {"profiles", "default", "discovery", "timeout_ms"});
            assert(timeout && *timeout == 500);
            const auto address = config::get_string(document, {"profiles", "default", "discovery", "broadcast_address"});
            assert(address && *address == "192.168.0.255");
            const auto server = config::get_bool(document, {"profiles", "default", "link", "server"});
            assert(server && *server);
            assert(!config::get_int64(document, {"profiles", "default", "missing"}).has_value());
            assert(config::find_path(document, {"profiles", "nope"}) == nullptr);
        }

        {
            const auto document = config::parse_yaml("a:\n  flag: yes\n  name: \"x # y\"\n  n: 12\n");
            assert(config::get_bool(document, {"a", "flag"}).value());
            assert(config::get_string(document, {"a", "name"}).value() == "x # y");
            bool type_error = false;
            try {
                config::get_string(document, {"a", "n"});
            } catch (const config::ConfigError& ex) {
                type_error = ex.code() == "E_CONFIG_TYPE";
            }
            assert(type_error);
        }

        {
            bool parse_error = false;
            try {
                config::parse_yaml("profiles:\n   default:\n");
            } catch (const config::ConfigError& ex) {
                parse_error = ex.code() == "E_CONFIG_PARSE";
            }
            assert(parse_error);

            parse_error = false;
            try {
                config::parse_yaml("profiles:\n  - default\n");
            } catch (const config::ConfigError& ex) {
                parse_error = ex.code() == "E_CONFIG_PARSE";
            }
            assert(parse_error);
        }

        {
            const auto overlay = config::parse_yaml("network:\n  server_port: 1\n");
            const auto base = config::parse_yaml("network:\n  server_port: 2\n  client_port: 3\nlog:\n  level: error\n");
            const auto merged = config::merge_objects(base, overlay);
            assert(config::get_int64(merged, {"network", "server_port"}).value() == 1);
            assert(config::get_int64(merged, {"network", "client_port"}).value() == 3);
            assert(config::get_string(merged, {"log", "level"}).value() == "error");
        }

        {
            // `extends` layers the child over its parent.
            const auto path = write_temp_file("nxlink_config_extends.yaml",
                                              "profiles:\n"
                                              "  default:\n"
                                              "    discovery:\n"
                                              "      timeout_ms: 400\n"
                                              "      retries: 5\n"
                                              "    network:\n"
                                              "      server_port: 30000\n"
                                              "  lab:\n"
                                              "    extends: default\n"
                                              "    discovery:\n"
                                              "      retries: 1\n"
                                              "    log:\n"
                                              "      level: debug\n");
            const auto lab = config::load_config(path, std::string{"lab"});
            assert(lab.discovery_timeout == 400ms);
            assert(lab.discovery_retries == 1);
            assert(lab.server_port == 30000);
            assert(lab.client_port == 28771);
            assert(lab.log_level == "debug");

            const auto defaults = config::load_config(path, std::nullopt);
            assert(defaults.discovery_retries == 5);
            assert(defaults.log_level == "warning");
            std::filesystem::remove(path);
        }

        {
            const std::string cycle =
                "profiles:\n  a:\n    extends: b\n  b:\n    extends: a\n";
            assert(error_code_of(cycle, "a") == "E_CONFIG_PROFILE");
            assert(error_code_of("profiles:\n  default:\n    log:\n      level: info\n", "other") == "E_CONFIG_PROFILE");
            assert(error_code_of("profiles:\n  default: 3\n", "default") == "E_CONFIG_STRUCTURE");
            assert(error_code_of("profiles:\n  default:\n    network:\n      server_port: 70000\n", "default") == "E_CONFIG_VALUE");
            assert(error_code_of("profiles:\n  default:\n    network:\n      client_port: 0\n", "default") == "E_CONFIG_VALUE");
            assert(error_code_of("profiles:\n  default:\n    discovery:\n      timeout_ms: 0\n", "default") == "E_CONFIG_VALUE");
            assert(error_code_of("profiles:\n  default:\n    discovery:\n      timeout_ms: 3600001\n", "default") ==
                   "E_CONFIG_VALUE");
            assert(error_code_of("profiles:\n  default:\n    discovery:\n      retries: -1\n", "default") == "E_CONFIG_VALUE");
            assert(error_code_of("profiles:\n  default:\n    log:\n      level: loud\n", "default") == "E_CONFIG_VALUE");
            assert(error_code_of("profiles:\n  default:\n    link:\n      server: maybe\n", "default") == "E_CONFIG_TYPE");
            assert(error_code_of("profiles:\n  default:\n    discovery:\n      retries: 0\n", "default").empty());
        }

        {
            bool missing = false;
            try {
                config::load_config(std::filesystem::temp_directory_path() / "nxlink_no_such_config.yaml", std::nullopt);
            } catch (const config::ConfigError& ex) {
                missing = ex.code() == "E_CONFIG_NOT_FOUND";
            }
            assert(missing);

            const auto path = write_temp_file("nxlink_config_noprofiles.yaml", "log:\n  level: info\n");
            bool structure = false;
            try {
                config::load_config(path, std::nullopt);
            } catch (const config::ConfigError& ex) {
                structure = ex.code() == "E_CONFIG_STRUCTURE";
                assert(!ex.hint().empty());
            }
            std::filesystem::remove(path);
            assert(structure);
        }
    } catch (const std::exception& ex) {
        std::cerr << "config loader test failed: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nxlink::core {

struct LinkRequest {
    std::filesystem::path file;
    std::optional<std::string> address{};
    std::optional<std::uint32_t> retries{};
    std::optional<std::string> upload_path{};
    std::optional<std::string> extra_args{};
    std::vector<std::string> arguments;
    std::optional<bool> start_server{};
};

// The file must exist, be a regular file and carry the .nro extension.
// Throws nxlink::Error otherwise.
void validate_nro_file(const std::filesystem::path& file);

// Maps the local file and an optional --path onto the name the server saves
// the upload under. A path ending in ".nro" is used verbatim, a path ending
// in '/' receives the file name, anything else is rejected.
std::string resolve_destination_path(const std::filesystem::path& file,
                                     const std::optional<std::string>& upload_path);

// Splits on spaces; single or double quotes group a run of characters.
std::vector<std::string> parse_extra_args(std::string_view text);

// Positional arguments followed by the ones parsed from --args.
std::vector<std::string> collect_arguments(const LinkRequest& request);

}  // namespace nxlink::core

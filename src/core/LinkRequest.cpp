#include "nxlink/core/LinkRequest.hpp"

#include "nxlink/Error.hpp"

#include <cctype>
#include <iterator>
#include <system_error>

namespace nxlink::core {

namespace {

constexpr std::string_view kNroExtension{".nro"};

bool has_nro_extension(const std::filesystem::path& path) {
    return path.extension() == kNroExtension;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

void validate_nro_file(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        throw Error("E_FILE_NOT_FOUND", "The file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file, ec)) {
        throw Error("E_NOT_A_FILE", "The path is not a file: " + file.string());
    }
    if (!has_nro_extension(file)) {
        throw Error("E_INVALID_EXTENSION",
                    "The file must have a `.nro` extension: " + file.string());
    }
}

std::string resolve_destination_path(const std::filesystem::path& file,
                                     const std::optional<std::string>& upload_path) {
    const auto file_name = file.filename().string();
    if (file_name.empty()) {
        throw Error("E_INVALID_FILE_NAME", "Failed to get the file name of " + file.string());
    }
    if (!upload_path) {
        return file_name;
    }

    const std::filesystem::path path{*upload_path};
    if (has_nro_extension(path)) {
        return *upload_path;
    }
    if (!upload_path->empty() && upload_path->back() == '/') {
        return *upload_path + file_name;
    }
    throw Error("E_INVALID_PATH", "Invalid path: " + *upload_path,
                "Use a path ending in .nro or a directory ending in '/'");
}

std::vector<std::string> parse_extra_args(std::string_view text) {
    text = trim(text);
    std::vector<std::string> result;
    std::string current;

    std::size_t index = 0;
    while (index < text.size()) {
        const char ch = text[index++];
        if (ch == ' ') {
            continue;
        }

        if (ch == '"' || ch == '\'') {
            const char quote = ch;
            while (index < text.size()) {
                const char next = text[index++];
                if (next == quote) {
                    break;
                }
                current.push_back(next);
            }
        } else {
            current.push_back(ch);
            while (index < text.size()) {
                const char next = text[index++];
                if (next == ' ') {
                    break;
                }
                current.push_back(next);
            }
        }

        if (!current.empty()) {
            result.push_back(std::move(current));
            current.clear();
        }
    }
    return result;
}

std::vector<std::string> collect_arguments(const LinkRequest& request) {
    auto arguments = request.arguments;
    if (request.extra_args) {
        auto extra = parse_extra_args(*request.extra_args);
        arguments.insert(arguments.end(),
                         std::make_move_iterator(extra.begin()),
                         std::make_move_iterator(extra.end()));
    }
    return arguments;
}

}  // namespace nxlink::core

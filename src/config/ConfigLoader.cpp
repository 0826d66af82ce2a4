#include "nxlink/config/ConfigLoader.hpp"

#include "nxlink/util/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace nxlink::config {

namespace {

std::string trim_left(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }));
    return value;
}

std::string trim_right(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base(),
                value.end());
    return value;
}

std::string trim_copy(const std::string& value) {
    return trim_right(trim_left(value));
}

std::string unescape_double_quoted(const std::string& inner) {
    std::string result;
    result.reserve(inner.size());
    for (std::size_t i = 0; i < inner.size(); ++i) {
        const char ch = inner[i];
        if (ch != '\\') {
            result.push_back(ch);
            continue;
        }
        if (i + 1 >= inner.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Dangling escape in quoted YAML value");
        }
        const char escaped = inner[++i];
        switch (escaped) {
            case 'n':
                result.push_back('\n');
                break;
            case 't':
                result.push_back('\t');
                break;
            case '"':
            case '\\':
            case '/':
                result.push_back(escaped);
                break;
            default:
                throw ConfigError("E_CONFIG_PARSE", std::string{"Unsupported escape sequence \\"} + escaped);
        }
    }
    return result;
}

Value parse_yaml_scalar(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return Value();
    }
    if (trimmed.size() >= 2 &&
        ((trimmed.front() == '"' && trimmed.back() == '"') || (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        std::string inner = trimmed.substr(1, trimmed.size() - 2);
        if (trimmed.front() == '\'') {
            return Value(inner);
        }
        return Value(unescape_double_quoted(inner));
    }
    if (trimmed == "true" || trimmed == "True") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False") {
        return Value(false);
    }
    if (trimmed == "null" || trimmed == "~") {
        return Value();
    }
    std::int64_t value{};
    const auto* begin = trimmed.data() + (trimmed.front() == '+' ? 1 : 0);
    const auto result = std::from_chars(begin, trimmed.data() + trimmed.size(), value);
    if (result.ec == std::errc{} && result.ptr == trimmed.data() + trimmed.size()) {
        return Value(value);
    }
    return Value(trimmed);
}

Value remove_key(const Value& object, const std::string& key) {
    if (!object.is_object()) {
        return object;
    }
    Value filtered = Value::make_object();
    for (const auto& [k, v] : object.as_object()) {
        if (k == key) {
            continue;
        }
        filtered.ensure_object()[k] = v;
    }
    return filtered;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name, std::set<std::string>& visiting) {
    if (!profiles.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'profiles' section must be a mapping");
    }
    const auto it = profiles.as_object().find(profile_name);
    if (it == profiles.as_object().end()) {
        std::string names;
        for (const auto& [name, _] : profiles.as_object()) {
            if (!names.empty()) {
                names += ", ";
            }
            names += name;
        }
        throw ConfigError("E_CONFIG_PROFILE", "Profile not found: " + profile_name,
                          "Available profiles: " + (names.empty() ? std::string{"<none>"} : names));
    }
    if (!it->second.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile must be a mapping: " + profile_name);
    }
    if (visiting.contains(profile_name)) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + profile_name);
    }
    visiting.insert(profile_name);

    Value result = Value::make_object();
    const auto extends_it = it->second.as_object().find("extends");
    if (extends_it != it->second.as_object().end()) {
        if (!extends_it->second.is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + profile_name);
        }
        result = resolve_profile(profiles, extends_it->second.string_value, visiting);
    }

    result = merge_objects(result, remove_key(it->second, "extends"));
    visiting.erase(profile_name);
    return result;
}

std::string join_path(const std::vector<std::string>& path) {
    if (path.empty()) {
        return "<root>";
    }
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

std::uint16_t require_port(std::int64_t value, const std::string& key) {
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError("E_CONFIG_VALUE", key + " must be between 1 and 65535");
    }
    return static_cast<std::uint16_t>(value);
}

}  // namespace

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack;
    stack.push_back({0, &root});

    std::istringstream input(text);
    std::string line;
    while (std::getline(input, line)) {
        std::string trimmed_line = trim_right(line);
        std::size_t comment_pos = std::string::npos;
        bool in_single = false;
        bool in_double = false;
        for (std::size_t i = 0; i < trimmed_line.size(); ++i) {
            const char ch = trimmed_line[i];
            if (ch == '"' && !in_single) {
                in_double = !in_double;
            } else if (ch == '\'' && !in_double) {
                in_single = !in_single;
            } else if (ch == '#' && !in_single && !in_double) {
                comment_pos = i;
                break;
            }
        }
        if (comment_pos != std::string::npos) {
            trimmed_line = trimmed_line.substr(0, comment_pos);
        }
        trimmed_line = trim_right(trimmed_line);
        if (trimmed_line.empty()) {
            continue;
        }

        std::size_t indent = 0;
        while (indent < trimmed_line.size() && trimmed_line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE", "YAML indentation must be multiples of two spaces");
        }
        const std::string content = trim_left(trimmed_line.substr(indent));

        while (!stack.empty() && indent < stack.back().indent) {
            stack.pop_back();
        }
        if (stack.empty() || indent != stack.back().indent) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid indentation in YAML config");
        }
        if (content.front() == '-') {
            throw ConfigError("E_CONFIG_PARSE", "YAML sequences are not supported in nxlink configs");
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' in YAML mapping entry");
        }
        const std::string key = trim_copy(content.substr(0, colon));
        const std::string value_part = trim_copy(content.substr(colon + 1));

        auto& object = stack.back().node->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            if (child.is_null()) {
                child = Value::make_object();
            }
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }

    return root;
}

Value load_document(const std::filesystem::path& path) {
    const std::filesystem::path absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_yaml(buffer.str());
}

Value merge_objects(const Value& base, const Value& overlay) {
    if (!overlay.is_object()) {
        return overlay;
    }
    Value result = base;
    if (!result.is_object()) {
        result = Value::make_object();
    }
    auto& target = result.ensure_object();
    for (const auto& [key, value] : overlay.as_object()) {
        const auto existing = target.find(key);
        if (value.is_object() && existing != target.end() && existing->second.is_object()) {
            existing->second = merge_objects(existing->second, value);
        } else {
            target[key] = value;
        }
    }
    return result;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->as_object().find(segment);
        if (it == node->as_object().end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name) {
    std::set<std::string> visiting;
    return resolve_profile(profiles, profile_name, visiting);
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

void apply_profile(const Value& profile, Config& config) {
    if (auto timeout = get_int64(profile, {"discovery", "timeout_ms"})) {
        if (*timeout <= 0 || *timeout > kMaxDiscoveryTimeout.count()) {
            throw ConfigError("E_CONFIG_VALUE",
                              "discovery.timeout_ms must be between 1 and " +
                                  std::to_string(kMaxDiscoveryTimeout.count()));
        }
        config.discovery_timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto retries = get_int64(profile, {"discovery", "retries"})) {
        if (*retries < 0 || *retries > std::numeric_limits<std::uint32_t>::max()) {
            throw ConfigError("E_CONFIG_VALUE", "discovery.retries must be a non-negative 32-bit integer");
        }
        config.discovery_retries = static_cast<std::uint32_t>(*retries);
    }
    if (auto broadcast = get_string(profile, {"discovery", "broadcast_address"})) {
        if (broadcast->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "discovery.broadcast_address cannot be empty");
        }
        config.broadcast_address = *broadcast;
    }
    if (auto port = get_int64(profile, {"network", "server_port"})) {
        config.server_port = require_port(*port, "network.server_port");
    }
    if (auto port = get_int64(profile, {"network", "client_port"})) {
        config.client_port = require_port(*port, "network.client_port");
    }
    if (auto server = get_bool(profile, {"link", "server"})) {
        config.start_stdio_server = *server;
    }
    if (auto level = get_string(profile, {"log", "level"})) {
        if (!util::StructuredLogger::parse_level(*level)) {
            throw ConfigError("E_CONFIG_VALUE", "Unknown log.level: " + *level,
                              "Use one of debug, info, warning, error");
        }
        config.log_level = *level;
    }
}

Config load_config(const std::filesystem::path& path,
                   const std::optional<std::string>& profile_name,
                   Config base) {
    const Value document = load_document(path);
    const auto* profiles = find_path(document, {"profiles"});
    if (!profiles) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration file is missing 'profiles' section",
                          "Define at least a 'default' profile under 'profiles'");
    }
    const Value profile = resolve_profile(*profiles, profile_name.value_or("default"));
    apply_profile(profile, base);
    return base;
}

}  // namespace nxlink::config

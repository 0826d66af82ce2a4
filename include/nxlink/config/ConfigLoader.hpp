#pragma once

#include "nxlink/Config.hpp"
#include "nxlink/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nxlink::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    String,
    Object
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    std::string string_value;
    std::map<std::string, Value> object_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }

    std::map<std::string, Value>& ensure_object() {
        if (type != ValueType::Object) {
            type = ValueType::Object;
            object_value.clear();
            string_value.clear();
        }
        return object_value;
    }

    const std::map<std::string, Value>& as_object() const {
        static const std::map<std::string, Value> empty{};
        return type == ValueType::Object ? object_value : empty;
    }
};

class ConfigError : public Error {
public:
    ConfigError(std::string code, std::string message, std::string hint = {})
        : Error(std::move(code), std::move(message), std::move(hint)) {}
};

// Block-style YAML subset: nested mappings by two-space indentation, scalar
// values, '#' comments. Sequences are not supported.
Value parse_yaml(const std::string& text);

Value load_document(const std::filesystem::path& path);

Value merge_objects(const Value& base, const Value& overlay);
const Value* find_path(const Value& root, const std::vector<std::string>& path);

// Resolves `extends` chains under the `profiles` mapping.
Value resolve_profile(const Value& profiles, const std::string& profile_name);

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);
std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path);
std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path);

// Overlays the recognised keys of a resolved profile onto config.
void apply_profile(const Value& profile, Config& config);

// Loads path, resolves profile_name (default "default") and applies it.
Config load_config(const std::filesystem::path& path,
                   const std::optional<std::string>& profile_name,
                   Config base = {});

}  // namespace nxlink::config

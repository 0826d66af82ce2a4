#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nxlink::util {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void debug(std::string_view event, FieldList fields = {}) {
        log(Level::Debug, event, std::move(fields));
    }

    // Records below the minimum level are dropped.
    void set_min_level(Level level);

    static std::optional<Level> parse_level(std::string_view text);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);
    static std::string escape_json(std::string_view value);

    std::string format_timestamp();

    Level min_level_{Level::Warning};
    std::mutex mutex_;
};

}  // namespace nxlink::util

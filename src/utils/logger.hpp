#ifndef HTTP_RELAY_LOGGER_HPP
#define HTTP_RELAY_LOGGER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Thread-safe, tagged logging to stderr and an optional file.
namespace relay::log {
    enum class Level : std::uint8_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        NONE = 255,
    };

    void set_level(Level level);
    [[nodiscard]] Level get_level();
    [[nodiscard]] bool enabled(Level level);

    void set_log_file(const std::string& path);
    void close_log_file();

    [[nodiscard]] std::optional<Level> parse_level(std::string_view name);

    // Applies RELAY_LOG_LEVEL when it is set to one of debug/info/warn/error/none.
    void configure_from_env();

    void write(Level level, std::string_view tag, std::string_view message);

    inline void debug(std::string_view tag, std::string_view message) { write(Level::DEBUG, tag, message); }
    inline void info(std::string_view tag, std::string_view message) { write(Level::INFO, tag, message); }
    inline void warn(std::string_view tag, std::string_view message) { write(Level::WARN, tag, message); }
    inline void error(std::string_view tag, std::string_view message) { write(Level::ERROR, tag, message); }
}  // namespace relay::log

#endif

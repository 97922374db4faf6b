#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "string_utils.hpp"

namespace {
    std::mutex g_log_mtx;
    std::ofstream g_log_ofs;
    std::atomic<std::uint8_t> g_min_level{static_cast<std::uint8_t>(relay::log::Level::WARN)};

    const char* level_name(relay::log::Level level) {
        switch (level) {
            case relay::log::Level::DEBUG:
                return "DEBUG";
            case relay::log::Level::INFO:
                return "INFO";
            case relay::log::Level::WARN:
                return "WARN";
            case relay::log::Level::ERROR:
                return "ERROR";
            case relay::log::Level::NONE:
                break;
        }
        return "NONE";
    }

    std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

        std::tm tm_buf{};
        gmtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
        return oss.str();
    }
}  // namespace

namespace relay::log {
    void set_level(Level level) { g_min_level.store(static_cast<std::uint8_t>(level), std::memory_order_relaxed); }

    Level get_level() { return static_cast<Level>(g_min_level.load(std::memory_order_relaxed)); }

    bool enabled(Level level) {
        return level != Level::NONE && static_cast<std::uint8_t>(level) >= g_min_level.load(std::memory_order_relaxed);
    }

    void set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(g_log_mtx);
        if (g_log_ofs.is_open()) {
            g_log_ofs.close();
        }
        g_log_ofs.open(path, std::ios::out | std::ios::app);
        if (!g_log_ofs) {
            std::cerr << "[relay] failed to open log file " << path << '\n';
        }
    }

    void close_log_file() {
        std::lock_guard<std::mutex> lk(g_log_mtx);
        if (g_log_ofs.is_open()) {
            g_log_ofs.close();
        }
    }

    std::optional<Level> parse_level(std::string_view name) {
        const std::string lowered = string_utils::to_lower(std::string(name));
        if (lowered == "debug") {
            return Level::DEBUG;
        }
        if (lowered == "info") {
            return Level::INFO;
        }
        if (lowered == "warn" || lowered == "warning") {
            return Level::WARN;
        }
        if (lowered == "error") {
            return Level::ERROR;
        }
        if (lowered == "none" || lowered == "off") {
            return Level::NONE;
        }
        return std::nullopt;
    }

    void configure_from_env() {
        const char* env = std::getenv("RELAY_LOG_LEVEL");
        if (env == nullptr) {
            return;
        }
        if (auto level = parse_level(env)) {
            set_level(*level);
        } else {
            warn("log", std::string("ignoring unknown RELAY_LOG_LEVEL=") + env);
        }
    }

    void write(Level level, std::string_view tag, std::string_view message) {
        if (!enabled(level)) {
            return;
        }

        std::ostringstream line;
        line << timestamp() << ' ' << level_name(level) << " [" << tag << "] " << message;

        std::lock_guard<std::mutex> lk(g_log_mtx);
        if (g_log_ofs.is_open()) {
            g_log_ofs << line.str() << '\n';
            g_log_ofs.flush();
        }
        std::cerr << line.str() << '\n';
    }
}  // namespace relay::log

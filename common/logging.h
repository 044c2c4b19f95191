#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

#include "macros.h"

namespace Common {

/// Synchronous leveled logger writing printf-formatted lines to a file.
/// The gate is a short single-threaded run, so lines go straight to the
/// stdio buffer instead of through a writer thread.
class Logger {
public:
    enum Level : uint16_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        FATAL = 4
    };

    static constexpr size_t MAX_MSG_SIZE = 1024;

    Logger(const char* filename, Level min_level) noexcept;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    template<typename... Args>
    void log(Level level, const char* format, Args&&... args) noexcept {
        if (level < min_level_ || !file_) {
            return;
        }
        char buffer[MAX_MSG_SIZE];
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
        int len = std::snprintf(buffer, sizeof(buffer), format, std::forward<Args>(args)...);
#pragma GCC diagnostic pop
        if (UNLIKELY(len < 0)) {
            return;
        }
        size_t n = static_cast<size_t>(len);
        if (n >= sizeof(buffer)) {
            n = sizeof(buffer) - 1;
        }
        write(level, buffer, n);
    }

    [[nodiscard]] auto isOpen() const noexcept -> bool { return file_ != nullptr; }
    [[nodiscard]] auto minLevel() const noexcept -> Level { return min_level_; }

    struct Stats {
        uint64_t messages_written = 0;
        uint64_t bytes_written = 0;
    };

    [[nodiscard]] auto getStats() const noexcept -> Stats { return stats_; }

    static auto levelToString(Level level) noexcept -> const char*;

    /// Parse DEBUG/INFO/WARN/ERROR (case-insensitive). Returns false on an
    /// unknown spelling.
    [[nodiscard]] static auto parseLevel(const std::string& text, Level* level) noexcept -> bool;

private:
    void write(Level level, const char* msg, size_t len) noexcept;
    void formatTimestamp(char* buffer, size_t size) const noexcept;

    FILE* file_;
    Level min_level_;
    Stats stats_{};
};

// Global logger instance (null when logging is disabled)
extern Logger* g_logger;

/// Open the global logger. An empty path leaves logging disabled.
/// Returns false when the file cannot be opened.
[[nodiscard]] auto initLogging(const std::string& log_file, Logger::Level level = Logger::INFO) noexcept -> bool;

void shutdownLogging() noexcept;

} // namespace Common

#define LOG_DEBUG(...) do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::DEBUG, __VA_ARGS__); } while (0)
#define LOG_INFO(...)  do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::INFO, __VA_ARGS__); } while (0)
#define LOG_WARN(...)  do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::WARN, __VA_ARGS__); } while (0)
#define LOG_ERROR(...) do { if (::Common::g_logger) ::Common::g_logger->log(::Common::Logger::ERROR, __VA_ARGS__); } while (0)

#include "logging.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <new>
#include <system_error>

namespace Common {

Logger* g_logger = nullptr;

Logger::Logger(const char* filename, Level min_level) noexcept
    : file_(nullptr),
      min_level_(min_level) {
    if (!filename || filename[0] == '\0') {
        return;
    }

    // Create parent directories if needed; fopen reports the failure otherwise
    std::filesystem::path p(filename);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    file_ = std::fopen(filename, "a");
}

Logger::~Logger() {
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::write(Level level, const char* msg, size_t len) noexcept {
    char timestamp_buf[40];
    formatTimestamp(timestamp_buf, sizeof(timestamp_buf));

    int written = std::fprintf(file_, "[%s][%s] %.*s\n",
                               timestamp_buf,
                               levelToString(level),
                               static_cast<int>(len),
                               msg);
    if (written > 0) {
        stats_.messages_written++;
        stats_.bytes_written += static_cast<uint64_t>(written);
    }

    // Warnings and errors must survive an abrupt exit
    if (level >= WARN) {
        std::fflush(file_);
    }
}

void Logger::formatTimestamp(char* buffer, size_t size) const noexcept {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    char date_buf[24];
    std::strftime(date_buf, sizeof(date_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    std::snprintf(buffer, size, "%s.%06lld", date_buf, static_cast<long long>(micros));
}

auto Logger::levelToString(Level level) noexcept -> const char* {
    switch (level) {
        case DEBUG: return "DEBUG";
        case INFO:  return "INFO ";
        case WARN:  return "WARN ";
        case ERROR: return "ERROR";
        case FATAL: return "FATAL";
        default:    return "UNKN ";
    }
}

auto Logger::parseLevel(const std::string& text, Level* level) noexcept -> bool {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "DEBUG") { *level = DEBUG; return true; }
    if (upper == "INFO")  { *level = INFO;  return true; }
    if (upper == "WARN")  { *level = WARN;  return true; }
    if (upper == "ERROR") { *level = ERROR; return true; }
    return false;
}

auto initLogging(const std::string& log_file, Logger::Level level) noexcept -> bool {
    shutdownLogging();
    if (log_file.empty()) {
        return true;
    }

    // Single instance per process, reused across runs in tests
    alignas(Logger) static char logger_storage[sizeof(Logger)];
    auto* logger = new (logger_storage) Logger(log_file.c_str(), level);
    if (!logger->isOpen()) {
        logger->~Logger();
        return false;
    }
    g_logger = logger;
    return true;
}

void shutdownLogging() noexcept {
    if (g_logger) {
        // Call destructor manually since we used placement new
        g_logger->~Logger();
        g_logger = nullptr;
    }
}

} // namespace Common

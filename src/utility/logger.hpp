#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace kernelbench {

/**
 * Thread-safe logging to stderr with a runtime level threshold.
 * DEBUG messages are only compiled in when DEBUG is defined.
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3,
        OFF_LEVEL = 4
    };

    static void set_level(Level level) noexcept {
        threshold().store(level, std::memory_order_relaxed);
    }

    static Level level() noexcept {
        return threshold().load(std::memory_order_relaxed);
    }

    static bool enabled(Level level) noexcept {
        return level >= threshold().load(std::memory_order_relaxed);
    }

    /**
     * @brief Parses a level name ("debug", "info", "warn", "error", "off")
     * @return True if the name was recognized
     */
    static bool parse_level(std::string_view name, Level &out) noexcept {
        if (name == "debug") {
            out = DEBUG_LEVEL;
        } else if (name == "info") {
            out = INFO_LEVEL;
        } else if (name == "warn") {
            out = WARN_LEVEL;
        } else if (name == "error") {
            out = ERROR_LEVEL;
        } else if (name == "off") {
            out = OFF_LEVEL;
        } else {
            return false;
        }
        return true;
    }

    static const char *level_name(Level level) noexcept {
        switch (level) {
        case DEBUG_LEVEL:
            return "debug";
        case INFO_LEVEL:
            return "info";
        case WARN_LEVEL:
            return "warn";
        case ERROR_LEVEL:
            return "error";
        default:
            return "off";
        }
    }

    static void log(Level level, const std::string &file, int line,
                    const std::string &message) {
        if (!enabled(level)) {
            return;
        }

        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        // Extract filename from full path
        std::string filename = file;
        size_t last_slash = filename.find_last_of("/\\");
        if (last_slash != std::string::npos) {
            filename = filename.substr(last_slash + 1);
        }

        std::cerr << "[" << level_to_string(level) << "]["
                  << std::put_time(std::localtime(&time_t), "%H:%M:%S") << "."
                  << std::setfill('0') << std::setw(3) << ms.count() << "]["
                  << filename << ":" << line << "] " << message << std::endl;
    }

  private:
    static std::atomic<Level> &threshold() noexcept {
        static std::atomic<Level> value{INFO_LEVEL};
        return value;
    }

    static const char *level_to_string(Level level) {
        switch (level) {
        case DEBUG_LEVEL:
            return "DEBUG";
        case INFO_LEVEL:
            return "INFO ";
        case WARN_LEVEL:
            return "WARN ";
        case ERROR_LEVEL:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }
};

} // namespace kernelbench

#ifdef DEBUG
#define LOG_DEBUG(msg)                                                         \
    kernelbench::Logger::log(kernelbench::Logger::DEBUG_LEVEL, __FILE__,       \
                             __LINE__, msg)
#else
#define LOG_DEBUG(msg)                                                         \
    do {                                                                       \
    } while (0)
#endif

#define LOG_INFO(msg)                                                          \
    kernelbench::Logger::log(kernelbench::Logger::INFO_LEVEL, __FILE__,        \
                             __LINE__, msg)
#define LOG_WARN(msg)                                                          \
    kernelbench::Logger::log(kernelbench::Logger::WARN_LEVEL, __FILE__,        \
                             __LINE__, msg)
#define LOG_ERROR(msg)                                                         \
    kernelbench::Logger::log(kernelbench::Logger::ERROR_LEVEL, __FILE__,       \
                             __LINE__, msg)

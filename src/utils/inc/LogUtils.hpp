#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Initialize the log system
void init(Level level = Level::Info,
          const std::string& log_file = "log/flexsync.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);
Level parse_level(const std::string& name);

// Logger instance
extern std::shared_ptr<spdlog::logger> logger;

// Worker tag of the calling thread. Messages logged from a tagged thread
// read "[tag] message"; the tag is captured at the call, not by the sink.
void set_thread_tag(const std::string& tag);
void clear_thread_tag();
const std::string& thread_tag();

namespace detail {
// "[tag] " for a tagged thread, empty otherwise
const std::string& tag_prefix();
}

// String version
void trace(const std::string& msg);
void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);
void fatal(const std::string& msg);

// Variadic template version (fmt-style)
template <typename... Args>
inline void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger && logger->should_log(spdlog::level::trace)) {
        logger->trace("{}{}", detail::tag_prefix(), fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        if (logger->should_log(spdlog::level::debug)) {
            logger->debug("{}{}", detail::tag_prefix(), fmt::format(fmt, std::forward<Args>(args)...));
        }
    } else {
        std::cout << "[DEBUG] " << detail::tag_prefix() << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        if (logger->should_log(spdlog::level::info)) {
            logger->info("{}{}", detail::tag_prefix(), fmt::format(fmt, std::forward<Args>(args)...));
        }
    } else {
        std::cout << "[INFO] " << detail::tag_prefix() << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        if (logger->should_log(spdlog::level::warn)) {
            logger->warn("{}{}", detail::tag_prefix(), fmt::format(fmt, std::forward<Args>(args)...));
        }
    } else {
        std::cout << "[WARN] " << detail::tag_prefix() << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        if (logger->should_log(spdlog::level::err)) {
            logger->error("{}{}", detail::tag_prefix(), fmt::format(fmt, std::forward<Args>(args)...));
        }
    } else {
        std::cerr << "[ERROR] " << detail::tag_prefix() << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        if (logger->should_log(spdlog::level::critical)) {
            logger->critical("{}{}", detail::tag_prefix(), fmt::format(fmt, std::forward<Args>(args)...));
        }
    } else {
        std::cerr << "[FATAL] " << detail::tag_prefix() << fmt::format(fmt, std::forward<Args>(args)...) << std::endl;
    }
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/flexsync.log",
                size_t max_file_size = 1024 * 1024 * 5,
                size_t max_files = 3) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}

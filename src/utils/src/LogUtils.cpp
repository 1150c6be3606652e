#include "LogUtils.hpp"
#include "StringUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

namespace {
thread_local std::string current_tag;
thread_local std::string current_prefix;
}

void set_thread_tag(const std::string& tag) {
    current_tag = tag;
    current_prefix = tag.empty() ? std::string() : "[" + tag + "] ";
}

void clear_thread_tag() {
    current_tag.clear();
    current_prefix.clear();
}

const std::string& thread_tag() {
    return current_tag;
}

namespace detail {
const std::string& tag_prefix() {
    return current_prefix;
}
}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto lvl = static_cast<size_t>(msg.level);
        if (lvl < sizeof(level_names) / sizeof(level_names[0])) {
            dest.append(level_names[lvl], level_names[lvl] + std::strlen(level_names[lvl]));
        } else {
            dest.append("INFO ", "INFO " + 5);
        }
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    std::filesystem::path log_path(log_file);
    std::filesystem::path parent_dir = log_path.parent_path();

    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    spdlog::init_thread_pool(8192, 1);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger = std::make_shared<spdlog::async_logger>(
        "flexsync_logger", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    // Worker threads also carry their tag in front of the message
    auto formatter = std::make_unique<spdlog::pattern_formatter>(
        "%Y-%m-%d %H:%M:%S.%f %t %X %v"
    );
    formatter->add_flag<LevelFullNameFormatter>('X');

    logger->set_formatter(std::move(formatter));
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) logger->flush();
    logger.reset();
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

Level parse_level(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info")  return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal" || lower == "critical") return Level::Fatal;
    throw std::runtime_error("Invalid log level: " + name);
}

void trace(const std::string& msg) {
    if (logger) {
        logger->trace("{}{}", detail::tag_prefix(), msg);
    }
}

void debug(const std::string& msg) {
    if (logger) {
        logger->debug("{}{}", detail::tag_prefix(), msg);
    } else {
        std::cout << "[DEBUG] " << detail::tag_prefix() << msg << std::endl;
    }
}

void info(const std::string& msg) {
    if (logger) {
        logger->info("{}{}", detail::tag_prefix(), msg);
    } else {
        std::cout << "[INFO] " << detail::tag_prefix() << msg << std::endl;
    }
}

void warn(const std::string& msg) {
    if (logger) {
        logger->warn("{}{}", detail::tag_prefix(), msg);
    } else {
        std::cout << "[WARN] " << detail::tag_prefix() << msg << std::endl;
    }
}

void error(const std::string& msg) {
    if (logger) {
        logger->error("{}{}", detail::tag_prefix(), msg);
    } else {
        std::cerr << "[ERROR] " << detail::tag_prefix() << msg << std::endl;
    }
}

void fatal(const std::string& msg) {
    if (logger) {
        logger->critical("{}{}", detail::tag_prefix(), msg);
    } else {
        std::cerr << "[FATAL] " << detail::tag_prefix() << msg << std::endl;
    }
}

}

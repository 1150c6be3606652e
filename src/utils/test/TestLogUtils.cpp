#include "LogUtils.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>

bool log_file_contains(const std::string& log_file, const std::string& keyword) {
    std::ifstream fin(log_file);
    if (!fin.is_open()) return false;
    std::string line;
    while (std::getline(fin, line)) {
        if (line.find(keyword) != std::string::npos) return true;
    }
    return false;
}

void test_init_and_info_log() {
    std::string log_file = "testlog/test_info.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::info("Hello Info Log");
    LogUtils::shutdown();
    assert(std::filesystem::exists(log_file));
    assert(log_file_contains(log_file, "Hello Info Log"));
    assert(log_file_contains(log_file, "INFO "));
    std::filesystem::remove_all("testlog");
    std::cout << "test_init_and_info_log passed" << std::endl;
}

void test_trace_level_filtering() {
    std::string log_file = "testlog/test_trace.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Debug, log_file, 1024 * 1024, 1);
    LogUtils::trace("registered {} at trace", "worker-0");
    LogUtils::debug("free {} as order {}", "worker-0", 0);

    LogUtils::set_level(LogUtils::Level::Trace);
    LogUtils::trace("registered {} again", "worker-1");
    LogUtils::shutdown();

    assert(!log_file_contains(log_file, "registered worker-0 at trace"));
    assert(log_file_contains(log_file, "free worker-0 as order 0"));
    assert(log_file_contains(log_file, "registered worker-1 again"));
    assert(log_file_contains(log_file, "TRACE"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_trace_level_filtering passed" << std::endl;
}

void test_warn_error_fatal_log() {
    std::string log_file = "testlog/test_warn_error_fatal.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);
    LogUtils::init(LogUtils::Level::Warn, log_file, 1024 * 1024, 1);
    LogUtils::info("Info should not appear");
    LogUtils::warn("Worker {} missed the barrier", "worker-3");
    LogUtils::error("Error log");
    LogUtils::fatal("Fatal {} log {}", "fmt", 2);
    LogUtils::shutdown();
    assert(!log_file_contains(log_file, "Info should not appear"));
    assert(log_file_contains(log_file, "Worker worker-3 missed the barrier"));
    assert(log_file_contains(log_file, "Error log"));
    assert(log_file_contains(log_file, "Fatal fmt log 2"));
    assert(log_file_contains(log_file, "FATAL"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_warn_error_fatal_log passed" << std::endl;
}

void test_log_file_directory_created() {
    std::string log_file = "testlog/subdir/test_create_dir.log";
    std::filesystem::path dir = std::filesystem::path(log_file).parent_path();
    if (std::filesystem::exists(dir)) std::filesystem::remove_all(dir);
    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::info("Check directory creation");
    LogUtils::shutdown();
    assert(std::filesystem::exists(dir));
    assert(log_file_contains(log_file, "Check directory creation"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_log_file_directory_created passed" << std::endl;
}

void test_logger_guard_releases_logger() {
    std::string log_file = "testlog/test_logger_guard.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    {
        LogUtils::LoggerGuard guard(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
        assert(LogUtils::logger != nullptr);
        LogUtils::info("LoggerGuard info message");
    }

    // Falls back to the console once the guard is gone
    assert(LogUtils::logger == nullptr);
    LogUtils::info("Console fallback message");

    assert(log_file_contains(log_file, "LoggerGuard info message"));
    assert(!log_file_contains(log_file, "Console fallback message"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_logger_guard_releases_logger passed" << std::endl;
}

bool log_line_contains_both(const std::string& log_file, const std::string& first, const std::string& second) {
    std::ifstream fin(log_file);
    std::string line;
    while (std::getline(fin, line)) {
        if (line.find(first) != std::string::npos && line.find(second) != std::string::npos) return true;
    }
    return false;
}

void test_worker_thread_tag() {
    std::string log_file = "testlog/test_thread_tag.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    std::thread worker([]() {
        LogUtils::set_thread_tag("worker-7");
        LogUtils::info("free {} as order {}", "worker-7", 2);
        LogUtils::warn(std::string("string message from worker"));
        LogUtils::clear_thread_tag();
        LogUtils::info("after clearing the tag");
    });
    worker.join();
    LogUtils::info("message from main");
    LogUtils::shutdown();

    // The tag belongs to the thread that logged, not to the sink thread
    assert(LogUtils::thread_tag().empty());
    assert(log_file_contains(log_file, "[worker-7] free worker-7 as order 2"));
    assert(log_file_contains(log_file, "[worker-7] string message from worker"));
    assert(log_file_contains(log_file, "after clearing the tag"));
    assert(!log_line_contains_both(log_file, "[worker-7]", "after clearing the tag"));
    assert(!log_line_contains_both(log_file, "[worker-7]", "message from main"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_worker_thread_tag passed" << std::endl;
}

void test_parse_level() {
    assert(LogUtils::parse_level("trace") == LogUtils::Level::Trace);
    assert(LogUtils::parse_level("DEBUG") == LogUtils::Level::Debug);
    assert(LogUtils::parse_level("Info") == LogUtils::Level::Info);
    assert(LogUtils::parse_level("warning") == LogUtils::Level::Warn);
    assert(LogUtils::parse_level("error") == LogUtils::Level::Error);
    assert(LogUtils::parse_level("critical") == LogUtils::Level::Fatal);

    bool threw = false;
    try {
        LogUtils::parse_level("loud");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    (void)threw;
    assert(threw);
    std::cout << "test_parse_level passed" << std::endl;
}

int main() {
    test_init_and_info_log();
    test_trace_level_filtering();
    test_warn_error_fatal_log();
    test_log_file_directory_created();
    test_logger_guard_releases_logger();
    test_worker_thread_tag();
    test_parse_level();

    std::cout << "All LogUtils tests passed!" << std::endl;
    return 0;
}

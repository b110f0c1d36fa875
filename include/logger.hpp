#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace TankLevelLogger {

// 日志级别
enum LogLevel {
    TRACE = spdlog::level::trace,
    DEBUG = spdlog::level::debug,
    INFO = spdlog::level::info,
    WARN = spdlog::level::warn,
    ERROR = spdlog::level::err,
    CRITICAL = spdlog::level::critical,
    OFF = spdlog::level::off
};

// 将日志级别转换为字符串
inline std::string levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF: return "off";
        default: return "unknown";
    }
}

// 从字符串解析日志级别，无法识别时返回false
inline bool levelFromString(const std::string& name, LogLevel& level) {
    if (name == "trace") { level = LogLevel::TRACE; return true; }
    if (name == "debug") { level = LogLevel::DEBUG; return true; }
    if (name == "info") { level = LogLevel::INFO; return true; }
    if (name == "warn") { level = LogLevel::WARN; return true; }
    if (name == "error") { level = LogLevel::ERROR; return true; }
    if (name == "critical") { level = LogLevel::CRITICAL; return true; }
    if (name == "off") { level = LogLevel::OFF; return true; }
    return false;
}

// 初始化日志系统
inline void init(const std::string& log_file = "tank_level.log",
                LogLevel level = LogLevel::INFO,
                size_t max_file_size = 1048576 * 5,
                size_t max_files = 3,
                bool console_only = true,
                bool file_only = false) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (!file_only) {
            // 控制台输出到stderr，stdout留给测量结果
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
            sinks.push_back(console_sink);
        }

        if (!console_only && !log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_file_size, max_files);
            file_sink->set_level(static_cast<spdlog::level::level_enum>(level));
            sinks.push_back(file_sink);
        }

        if (sinks.empty()) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
            sinks.push_back(console_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("tank_level", sinks.begin(), sinks.end());
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::info);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "日志初始化失败: " << ex.what() << std::endl;
    }
}

// 支持格式化日志
template<typename... Args>
inline void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::trace(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::debug(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::info(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::warn(fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    spdlog::error(fmt, std::forward<Args>(args)...);
}

// 刷新日志
inline void flush() {
    spdlog::default_logger()->flush();
}

} // namespace TankLevelLogger

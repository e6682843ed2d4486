#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <mutex>
#include <vector>
#include <filesystem>

namespace wndtap {
namespace utils {

// Where and how verbosely WndTap logs. The console shows message
// names and focus activity at info; the file keeps the per-message
// trace lines written by observers and the host window.
struct LoggerConfig {
    std::string               appName        = "WndTap";
    std::string               logDir         = "logs";
    spdlog::level::level_enum consoleLevel   = spdlog::level::info;
    spdlog::level::level_enum fileLevel      = spdlog::level::trace;
    bool                      truncateFile   = true;
    std::chrono::seconds      flushInterval  = std::chrono::seconds(3);
};

class Logger {
public:
    // Creates a console + file logger and makes it the spdlog default.
    // Safe to call more than once; only the first call has effect.
    static bool Initialize(const std::string& appName = "WndTap",
                           const std::string& logDir  = "logs") {
        LoggerConfig config;
        config.appName = appName;
        config.logDir  = logDir;
        return Initialize(config);
    }

    static bool Initialize(const LoggerConfig& config) {
        std::lock_guard<std::mutex> lock(s_initMutex);
        if (s_initialized) {
            return true;
        }

        try {
            std::filesystem::create_directories(config.logDir);

            std::string logPath = config.logDir + "/" + config.appName + ".log";

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(config.consoleLevel);
            consoleSink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

            auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                logPath, config.truncateFile);
            fileSink->set_level(config.fileLevel);
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [tid %t] [%s:%#] %v");

            std::vector<spdlog::sink_ptr> sinks{consoleSink, fileSink};
            s_logger = std::make_shared<spdlog::logger>(config.appName, sinks.begin(), sinks.end());
            s_logger->set_level(std::min(config.consoleLevel, config.fileLevel));
            s_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(s_logger);
            if (config.flushInterval.count() > 0) {
                spdlog::flush_every(config.flushInterval);
            }

            s_initialized = true;
            s_logger->info("Logger initialized: {}", logPath);
            return true;

        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "Logger init failed: %s\n", ex.what());
            return false;
        } catch (const std::filesystem::filesystem_error& ex) {
            std::fprintf(stderr, "Logger init failed: %s\n", ex.what());
            return false;
        }
    }

    // Changes the logger threshold at runtime, e.g. to silence the
    // per-message trace lines. No-op before Initialize.
    static void SetLevel(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(s_initMutex);
        if (s_logger) {
            s_logger->set_level(level);
        }
    }

    static void Shutdown() {
        std::lock_guard<std::mutex> lock(s_initMutex);
        if (s_initialized) {
            s_logger->info("Logger shutting down");
            s_logger->flush();
            spdlog::shutdown();
            s_logger.reset();
            s_initialized = false;
        }
    }

    static bool IsInitialized() {
        std::lock_guard<std::mutex> lock(s_initMutex);
        return s_initialized;
    }

    static std::shared_ptr<spdlog::logger>& Get() {
        return s_logger;
    }

private:
    static inline std::shared_ptr<spdlog::logger> s_logger = nullptr;
    static inline bool s_initialized = false;
    static inline std::mutex s_initMutex;
};

} // namespace utils
} // namespace wndtap

// Logging macros with source location. No-ops until Logger::Initialize succeeds.
#define WNDTAP_LOG_TRACE(...)    if(::wndtap::utils::Logger::Get()) SPDLOG_LOGGER_TRACE(::wndtap::utils::Logger::Get(), __VA_ARGS__)
#define WNDTAP_LOG_DEBUG(...)    if(::wndtap::utils::Logger::Get()) SPDLOG_LOGGER_DEBUG(::wndtap::utils::Logger::Get(), __VA_ARGS__)
#define WNDTAP_LOG_INFO(...)     if(::wndtap::utils::Logger::Get()) SPDLOG_LOGGER_INFO(::wndtap::utils::Logger::Get(), __VA_ARGS__)
#define WNDTAP_LOG_WARN(...)     if(::wndtap::utils::Logger::Get()) SPDLOG_LOGGER_WARN(::wndtap::utils::Logger::Get(), __VA_ARGS__)
#define WNDTAP_LOG_ERROR(...)    if(::wndtap::utils::Logger::Get()) SPDLOG_LOGGER_ERROR(::wndtap::utils::Logger::Get(), __VA_ARGS__)
#define WNDTAP_LOG_CRITICAL(...) if(::wndtap::utils::Logger::Get()) SPDLOG_LOGGER_CRITICAL(::wndtap::utils::Logger::Get(), __VA_ARGS__)

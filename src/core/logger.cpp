#include "peersend/core/logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace peersend::core {

namespace {
constexpr std::size_t MAX_LOG_FILE_SIZE = 5 * 1024 * 1024;
constexpr std::size_t MAX_LOG_FILES = 3;
constexpr const char* LOGGER_NAME = "peersend";
}

std::shared_ptr<spdlog::logger> Logger::logger_;
bool Logger::file_sink_active_ = false;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    const auto threshold = static_cast<spdlog::level::level_enum>(level);
    std::vector<spdlog::sink_ptr> sinks;
    
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(threshold);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);
    
    // An empty path means console only
    std::string file_error;
    if (!log_file.empty()) {
        auto parent = std::filesystem::path(log_file).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, MAX_LOG_FILE_SIZE, MAX_LOG_FILES);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }
    file_sink_active_ = sinks.size() > 1;
    
    if (logger_) {
        logger_->flush();
    }
    logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_level(threshold);
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    spdlog::set_level(threshold);
    
    if (!file_error.empty()) {
        LOG_WARN("Cannot open log file {} ({}), logging to console only", log_file, file_error);
    }
    LOG_DEBUG("Logging at level {}{}", spdlog::level::to_string_view(threshold),
              file_sink_active_ ? " to " + log_file : std::string());
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::shutdown();
    logger_.reset();
    file_sink_active_ = false;
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    
    auto default_logger = spdlog::default_logger();
    if (default_logger) {
        return default_logger;
    }
    
    // spdlog::shutdown() drops the default logger
    static auto fallback = std::make_shared<spdlog::logger>(
        "peersend", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return fallback;
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

}

#include "isocal/common_utils/utilities/logging_utils.h"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace isocal::common_utils {

std::shared_ptr<LoggingManager> LoggingManager::globalInstance_;
std::mutex LoggingManager::globalMutex_;

LoggingManager::LoggingManager(const LoggingConfig& config) : config_(config) {
}

LoggingManager::~LoggingManager() {
    shutdown();
}

void LoggingManager::earlyInitialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (defaultLogger_) {
        return;
    }
    try {
        defaultLogger_ = createLogger("isocal", config_);
    } catch (const spdlog::spdlog_ex& e) {
        // 控制台 sink 创建失败时退回到空日志器，保证宏始终可用
        std::cerr << "Failed to create early logger: " << e.what() << std::endl;
        auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
        defaultLogger_ = std::make_shared<spdlog::logger>("isocal_null", nullSink);
    }
}

LoggingManager& LoggingManager::getGlobalInstance() {
    std::lock_guard<std::mutex> lock(globalMutex_);
    if (!globalInstance_) {
        globalInstance_ = std::make_shared<LoggingManager>();
        globalInstance_->earlyInitialize();
    }
    return *globalInstance_;
}

void LoggingManager::configureGlobal(const LoggingConfig& config) {
    getGlobalInstance().initialize(config);
}

void LoggingManager::setGlobalInstance(std::shared_ptr<LoggingManager> instance) {
    std::lock_guard<std::mutex> lock(globalMutex_);
    globalInstance_ = std::move(instance);
    if (globalInstance_) {
        globalInstance_->earlyInitialize();
    }
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    moduleLoggers_.clear();
    try {
        defaultLogger_ = createLogger("isocal", config_);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to create default logger: " << e.what() << std::endl;
        defaultLogger_ = std::make_shared<spdlog::logger>(
            "isocal_fallback", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        defaultLogger_->set_level(spdlog::level::warn);
        defaultLogger_->error("Default logger creation failed, using fallback stderr logger.");
    }
}

std::shared_ptr<spdlog::logger> LoggingManager::getModuleLogger(const std::string& moduleName) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = moduleLoggers_.find(moduleName);
    if (it != moduleLoggers_.end()) {
        return it->second;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = createLogger(moduleName, config_);
    } catch (const spdlog::spdlog_ex& e) {
        if (defaultLogger_) {
            defaultLogger_->error("Failed to create module logger '{}': {}. Returning default logger.",
                                  moduleName, e.what());
        }
        logger = defaultLogger_;
    }
    moduleLoggers_[moduleName] = logger;
    return logger;
}

void LoggingManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (defaultLogger_) {
        defaultLogger_->flush();
    }
    for (const auto& [name, logger] : moduleLoggers_) {
        if (logger) {
            logger->flush();
        }
    }
    moduleLoggers_.clear();
}

spdlog::level::level_enum LoggingManager::stringToLevel(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> LoggingManager::createLogger(const std::string& name,
                                                             const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        // 日志写到 stderr，stdout 留给命令行工具的结果输出
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_level(stringToLevel(config.console_level));
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        sinks.push_back(consoleSink);
    }

    if (config.enable_file) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_filename, config.max_file_size, config.max_files);
            fileSink->set_level(stringToLevel(config.file_level));
            fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Failed to create rotating file sink for '" << name << "' at '"
                      << config.log_filename << "': " << e.what() << std::endl;
        }
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    // 不注册到 spdlog 全局表，避免重复初始化时的名称冲突
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::err);
    return logger;
}

} // namespace isocal::common_utils

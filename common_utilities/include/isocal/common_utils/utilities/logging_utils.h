/**
 * @file logging_utils.h
 * @brief 日志管理 - 基于 spdlog 的全局与模块日志器
 *
 * 日历核心本身不记录日志；日志只在配置加载和命令行前端中使用。
 */

#pragma once

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace isocal::common_utils {

/**
 * @brief 日志配置
 */
struct LoggingConfig {
    bool enable_console = true;              ///< 是否启用控制台日志
    bool enable_file = false;                ///< 是否启用文件日志
    std::string console_level = "info";      ///< 控制台日志级别
    std::string file_level = "trace";        ///< 文件日志级别
    std::string log_filename = "isocal.log"; ///< 日志文件名称
    size_t max_file_size = 1048576 * 5;      ///< 单个日志文件最大大小 (5MB)
    size_t max_files = 3;                    ///< 轮转保留的文件数
};

/**
 * @brief 日志管理器
 *
 * 提供全局访问点 getGlobalInstance()，同时允许通过 setGlobalInstance() 注入
 * 另行配置的实例。模块日志器按名称懒创建并缓存。
 */
class LoggingManager {
public:
    explicit LoggingManager(const LoggingConfig& config = LoggingConfig{});
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief 按配置重建默认日志器；重复调用会替换之前的配置
     */
    void initialize(const LoggingConfig& config);

    std::shared_ptr<spdlog::logger> getModuleLogger(const std::string& moduleName);

    void shutdown();

    static LoggingManager& getGlobalInstance();
    static void configureGlobal(const LoggingConfig& config);
    static void setGlobalInstance(std::shared_ptr<LoggingManager> instance);

    /**
     * @brief 字符串日志级别转换，无法识别时返回 info
     */
    static spdlog::level::level_enum stringToLevel(const std::string& level);

private:
    void earlyInitialize();
    std::shared_ptr<spdlog::logger> createLogger(const std::string& name, const LoggingConfig& config);

    LoggingConfig config_;
    std::shared_ptr<spdlog::logger> defaultLogger_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> moduleLoggers_;
    mutable std::mutex mutex_;

    static std::shared_ptr<LoggingManager> globalInstance_;
    static std::mutex globalMutex_;
};

inline std::shared_ptr<spdlog::logger> getModuleLogger(const std::string& moduleName) {
    return LoggingManager::getGlobalInstance().getModuleLogger(moduleName);
}

} // namespace isocal::common_utils

#define ISOCAL_MODULE_LOG_IMPL_(method, module, ...) \
    do { \
        if (auto isocal_logger_ = isocal::common_utils::getModuleLogger(module)) { \
            isocal_logger_->method(__VA_ARGS__); \
        } \
    } while (0)

// 模块专用日志宏
#define ISOCAL_LOG_TRACE(module, ...) ISOCAL_MODULE_LOG_IMPL_(trace, module, __VA_ARGS__)
#define ISOCAL_LOG_DEBUG(module, ...) ISOCAL_MODULE_LOG_IMPL_(debug, module, __VA_ARGS__)
#define ISOCAL_LOG_INFO(module, ...)  ISOCAL_MODULE_LOG_IMPL_(info, module, __VA_ARGS__)
#define ISOCAL_LOG_WARN(module, ...)  ISOCAL_MODULE_LOG_IMPL_(warn, module, __VA_ARGS__)
#define ISOCAL_LOG_ERROR(module, ...) ISOCAL_MODULE_LOG_IMPL_(error, module, __VA_ARGS__)

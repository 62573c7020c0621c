/**
 * @file app_config_loader.h
 * @brief 应用配置加载器
 *
 * 优先级从低到高：默认值 < YAML 文件 < 环境变量 < 命令行参数。
 * 键统一为小写，连字符转为下划线，YAML 嵌套键以 '.' 连接。
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace YAML {
    class Node;
}

namespace isocal::common_utils {

/**
 * @enum ConfigSource
 * @brief 配置来源类型，数值越大优先级越高
 */
enum class ConfigSource {
    DEFAULT_VALUES = 0,
    FILE_YAML = 1,
    ENVIRONMENT = 2,
    COMMAND_LINE = 3
};

/**
 * @struct ConfigValue
 * @brief 配置值容器
 */
struct ConfigValue {
    std::string value;
    ConfigSource source = ConfigSource::DEFAULT_VALUES;
    std::string description;

    bool asBool() const;

    /**
     * @throws ConfigurationException 值不是合法整数或超出范围
     */
    int asInt() const;
    int64_t asInt64() const;

    std::string asString() const;
};

/**
 * @class AppConfigLoader
 * @brief 轻量级配置加载器
 */
class AppConfigLoader {
public:
    explicit AppConfigLoader(const std::string& appName = "isocal");
    ~AppConfigLoader() = default;

    AppConfigLoader(const AppConfigLoader&) = delete;
    AppConfigLoader& operator=(const AppConfigLoader&) = delete;

    /**
     * @brief 从 YAML 文件加载配置
     * @return 文件不存在或解析失败时返回 false
     */
    bool loadFromFile(const std::filesystem::path& configPath);

    /**
     * @brief 为每个已登记的键 (setDefault 或 declareKey) 读取环境变量 PREFIX + 大写键名 ('.' 转为 '_')
     * @return 读取到的环境变量数量
     */
    int loadFromEnvironment(const std::string& prefix = "ISOCAL_");

    /**
     * @brief 解析 --key=value 与 --key value 形式的参数
     * @return 解析到的参数数量
     */
    int loadFromCommandLine(int argc, const char* const argv[]);

    void setDefault(const std::string& key, const std::string& value,
                    const std::string& description = "");

    /**
     * @brief 登记一个没有默认值的键，使其可以从环境变量读取
     */
    void declareKey(const std::string& key);

    std::optional<ConfigValue> get(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    int64_t getInt64(const std::string& key, int64_t defaultValue = 0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    /**
     * @brief 返回缺失的必需键
     */
    std::vector<std::string> validateRequired(const std::vector<std::string>& requiredKeys) const;

    const std::string& getAppName() const { return m_appName; }

private:
    void store(const std::string& key, const std::string& value, ConfigSource source,
               const std::string& description);
    void parseYamlNode(const YAML::Node& node, const std::string& prefix);
    static std::string normalizeKey(const std::string& key);

    std::string m_appName;
    std::map<std::string, ConfigValue> m_config;
    std::map<std::string, ConfigValue> m_defaults;
    std::set<std::string> m_declaredKeys;
};

} // namespace isocal::common_utils

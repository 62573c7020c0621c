/**
 * @file app_config_loader.cpp
 * @brief 应用配置加载器实现
 */

#include "isocal/common_utils/utilities/app_config_loader.h"
#include "isocal/common_utils/utilities/exceptions.h"
#include "isocal/common_utils/utilities/logging_utils.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace isocal::common_utils {

namespace {

const char* const kModule = "config";

std::string toLowerCopy(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimCopy(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

// ConfigValue 类型转换

bool ConfigValue::asBool() const {
    std::string lowerValue = toLowerCopy(trimCopy(value));
    return lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on";
}

int64_t ConfigValue::asInt64() const {
    std::string text = trimCopy(value);
    if (text.empty()) {
        throw ConfigurationException("Configuration value is empty, expected an integer");
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') {
        throw ConfigurationException("Configuration value '" + value + "' is not an integer");
    }
    if (errno == ERANGE) {
        throw ConfigurationException("Configuration value '" + value + "' is out of range");
    }
    return static_cast<int64_t>(parsed);
}

int ConfigValue::asInt() const {
    int64_t parsed = asInt64();
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        throw ConfigurationException("Configuration value '" + value + "' does not fit in an int");
    }
    return static_cast<int>(parsed);
}

std::string ConfigValue::asString() const {
    return value;
}

// AppConfigLoader

AppConfigLoader::AppConfigLoader(const std::string& appName) : m_appName(appName) {
    setDefault("log_level", "info", "Console logging level");
    setDefault("log_file", "", "Rotating log file path, empty disables file logging");
}

bool AppConfigLoader::loadFromFile(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        ISOCAL_LOG_WARN(kModule, "Config file does not exist: {}", configPath.string());
        return false;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        ISOCAL_LOG_ERROR(kModule, "Failed to open config file: {}", configPath.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        YAML::Node root = YAML::Load(buffer.str());
        parseYamlNode(root, "");
    } catch (const YAML::Exception& e) {
        ISOCAL_LOG_ERROR(kModule, "Failed to parse config file {}: {}", configPath.string(), e.what());
        return false;
    }

    ISOCAL_LOG_INFO(kModule, "Loaded YAML configuration from: {}", configPath.string());
    return true;
}

int AppConfigLoader::loadFromEnvironment(const std::string& prefix) {
    std::set<std::string> keys = m_declaredKeys;
    for (const auto& [key, defaultValue] : m_defaults) {
        keys.insert(key);
    }

    int count = 0;
    for (const std::string& key : keys) {
        std::string envVar = key;
        std::replace(envVar.begin(), envVar.end(), '.', '_');
        std::transform(envVar.begin(), envVar.end(), envVar.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        envVar = prefix + envVar;

        const char* envValue = std::getenv(envVar.c_str());
        if (envValue != nullptr) {
            store(key, envValue, ConfigSource::ENVIRONMENT, "Environment variable: " + envVar);
            ISOCAL_LOG_DEBUG(kModule, "Loaded env var: {} = {}", envVar, envValue);
            ++count;
        }
    }

    if (count > 0) {
        ISOCAL_LOG_INFO(kModule, "Loaded {} configuration values from environment variables", count);
    }
    return count;
}

int AppConfigLoader::loadFromCommandLine(int argc, const char* const argv[]) {
    int count = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() <= 2 || arg.compare(0, 2, "--") != 0) {
            ISOCAL_LOG_WARN(kModule, "Ignoring unrecognised argument: {}", arg);
            continue;
        }

        auto equalPos = arg.find('=');
        if (equalPos != std::string::npos) {
            store(arg.substr(2, equalPos - 2), arg.substr(equalPos + 1),
                  ConfigSource::COMMAND_LINE, "Command line argument");
            ++count;
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            store(arg.substr(2), argv[i + 1], ConfigSource::COMMAND_LINE, "Command line argument");
            ++count;
            ++i;
        } else {
            // 无值的开关视为 true
            store(arg.substr(2), "true", ConfigSource::COMMAND_LINE, "Command line flag");
            ++count;
        }
    }

    if (count > 0) {
        ISOCAL_LOG_DEBUG(kModule, "Loaded {} configuration values from command line", count);
    }
    return count;
}

void AppConfigLoader::setDefault(const std::string& key, const std::string& value,
                                 const std::string& description) {
    ConfigValue defaultValue;
    defaultValue.value = value;
    defaultValue.source = ConfigSource::DEFAULT_VALUES;
    defaultValue.description = description;
    m_defaults[normalizeKey(key)] = defaultValue;
}

void AppConfigLoader::declareKey(const std::string& key) {
    m_declaredKeys.insert(normalizeKey(key));
}

std::optional<ConfigValue> AppConfigLoader::get(const std::string& key) const {
    std::string normalizedKey = normalizeKey(key);

    auto it = m_config.find(normalizedKey);
    if (it != m_config.end()) {
        return it->second;
    }
    auto defaultIt = m_defaults.find(normalizedKey);
    if (defaultIt != m_defaults.end()) {
        return defaultIt->second;
    }
    return std::nullopt;
}

std::string AppConfigLoader::getString(const std::string& key, const std::string& defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asString() : defaultValue;
}

int AppConfigLoader::getInt(const std::string& key, int defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asInt() : defaultValue;
}

int64_t AppConfigLoader::getInt64(const std::string& key, int64_t defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asInt64() : defaultValue;
}

bool AppConfigLoader::getBool(const std::string& key, bool defaultValue) const {
    auto configValue = get(key);
    return configValue ? configValue->asBool() : defaultValue;
}

bool AppConfigLoader::has(const std::string& key) const {
    return get(key).has_value();
}

std::vector<std::string> AppConfigLoader::validateRequired(const std::vector<std::string>& requiredKeys) const {
    std::vector<std::string> missing;
    for (const std::string& key : requiredKeys) {
        if (!has(key)) {
            missing.push_back(key);
        }
    }
    return missing;
}

void AppConfigLoader::store(const std::string& key, const std::string& value, ConfigSource source,
                            const std::string& description) {
    std::string normalizedKey = normalizeKey(key);

    // 低优先级来源不覆盖高优先级来源，与加载顺序无关
    auto it = m_config.find(normalizedKey);
    if (it != m_config.end() && it->second.source > source) {
        return;
    }

    ConfigValue configValue;
    configValue.value = value;
    configValue.source = source;
    configValue.description = description;
    m_config[normalizedKey] = configValue;
}

void AppConfigLoader::parseYamlNode(const YAML::Node& node, const std::string& prefix) {
    if (node.IsMap()) {
        for (const auto& item : node) {
            std::string key = item.first.as<std::string>();
            std::string fullKey = prefix.empty() ? key : prefix + "." + key;

            if (item.second.IsScalar()) {
                store(fullKey, item.second.as<std::string>(), ConfigSource::FILE_YAML, "Loaded from YAML");
                ISOCAL_LOG_DEBUG(kModule, "Loaded config: {} = {}", fullKey, item.second.as<std::string>());
            } else {
                parseYamlNode(item.second, fullKey);
            }
        }
    } else if (node.IsSequence() && !prefix.empty()) {
        // 数组转换为逗号分隔的字符串
        std::stringstream ss;
        for (std::size_t i = 0; i < node.size(); ++i) {
            if (i > 0) {
                ss << ",";
            }
            ss << node[i].as<std::string>();
        }
        store(prefix, ss.str(), ConfigSource::FILE_YAML, "Loaded from YAML (array)");
    }
}

std::string AppConfigLoader::normalizeKey(const std::string& key) {
    std::string normalized = toLowerCopy(key);
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    return normalized;
}

} // namespace isocal::common_utils

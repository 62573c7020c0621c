/**
 * @file date_calc_app.h
 * @brief 命令行日期计算前端
 *
 * 从配置 (默认值 / YAML / ISOCAL_ 环境变量 / 命令行) 读取年月日与运算，
 * 调用日历核心计算，并把结果写成一行：
 *   <规范日期> <星期> day-of-year=<n>
 */

#pragma once

#include "isocal/calendar/date_resolver.h"
#include "isocal/calendar/local_date.h"
#include "isocal/common_utils/utilities/app_config_loader.h"
#include "isocal/common_utils/utilities/exceptions.h"

#include <iostream>
#include <string>

namespace isocal::application {

/**
 * @brief 进程退出码
 */
enum class ExitStatus : int {
    SUCCESS = 0,
    UNEXPECTED_ERROR = 1,
    CONFIGURATION_ERROR = 2,
    FIELD_ERROR = 3,
    ARITHMETIC_ERROR = 4
};

/**
 * @brief 支持的日期运算
 */
enum class DateOperation {
    INFO,
    PLUS_DAYS,
    MINUS_DAYS,
    PLUS_WEEKS,
    MINUS_WEEKS,
    PLUS_MONTHS,
    MINUS_MONTHS,
    PLUS_YEARS,
    MINUS_YEARS,
    WITH_DAY_OF_YEAR,
    WITH_DAY_OF_WEEK
};

class DateCalcApp {
public:
    explicit DateCalcApp(std::ostream& out = std::cout);

    DateCalcApp(const DateCalcApp&) = delete;
    DateCalcApp& operator=(const DateCalcApp&) = delete;

    /**
     * @brief 完整执行：加载配置、配置日志、计算并输出
     * @return ExitStatus 对应的整数
     */
    int run(int argc, const char* const argv[]);

    /**
     * @brief 加载全部配置来源
     * @throws ConfigurationException 指定的配置文件无法加载或缺少必需键
     */
    void loadConfiguration(int argc, const char* const argv[]);

    /**
     * @brief 按当前配置构造日期并执行运算
     */
    calendar::LocalDate compute() const;

    /**
     * @throws ConfigurationException 未知运算名
     */
    static DateOperation parseOperation(const std::string& name);

    /**
     * @throws ConfigurationException 未知解析策略名
     */
    static calendar::DateResolver parseResolver(const std::string& name);

    static std::string formatResult(const calendar::LocalDate& date);

    static ExitStatus exitStatusFor(const common_utils::IsocalBaseException& e);

private:
    void configureLogging() const;

    std::ostream& out_;
    common_utils::AppConfigLoader config_;
};

} // namespace isocal::application

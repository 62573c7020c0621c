/**
 * @file exceptions.h
 * @brief 项目统一异常体系 - 日历值类型的错误分类
 *
 * 异常层次结构：
 * - IsocalBaseException (根异常，带错误码)
 *   ├─ RangeException             字段原始值超出静态范围 (月份13、日期32、年份越界)
 *   ├─ InvalidFieldException      字段值本身合法但与上下文组合非法 (2月30日)
 *   ├─ ArithmeticOverflowException 年份/纪元日计算超出可表示范围
 *   ├─ NullInputException         必需的协作对象缺失 (空的解析函数)
 *   └─ ConfigurationException     配置项错误
 */

#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

namespace isocal::common_utils {

/**
 * @brief 错误码
 */
enum class ErrorCode : int {
    NONE = 0,
    RANGE = 1001,
    INVALID_FIELD = 1002,
    ARITHMETIC_OVERFLOW = 1003,
    NULL_INPUT = 1004,
    CONFIGURATION = 2001
};

/**
 * @brief 日历字段标识，用于异常中指明出错字段
 */
enum class DateField {
    YEAR,
    MONTH_OF_YEAR,
    DAY_OF_MONTH,
    DAY_OF_WEEK,
    DAY_OF_YEAR,
    YEAR_OF_ERA
};

/**
 * @brief 字段的显示名称
 */
inline const char* dateFieldName(DateField field) {
    switch (field) {
        case DateField::YEAR:          return "Year";
        case DateField::MONTH_OF_YEAR: return "MonthOfYear";
        case DateField::DAY_OF_MONTH:  return "DayOfMonth";
        case DateField::DAY_OF_WEEK:   return "DayOfWeek";
        case DateField::DAY_OF_YEAR:   return "DayOfYear";
        case DateField::YEAR_OF_ERA:   return "YearOfEra";
    }
    return "Unknown";
}

/**
 * @brief 项目根异常类 - 所有自定义异常的基类
 */
class IsocalBaseException : public std::runtime_error {
public:
    explicit IsocalBaseException(const std::string& message)
        : std::runtime_error(message) {}

    IsocalBaseException(const std::string& message, ErrorCode code)
        : std::runtime_error(message), code_(code) {}

    /**
     * @brief 获取错误码
     */
    ErrorCode getCode() const noexcept { return code_; }

protected:
    ErrorCode code_ = ErrorCode::NONE;
};

/**
 * @brief 范围异常 - 原始整数超出字段的静态合法范围
 *
 * 在构造值对象之前抛出，携带字段、实际值以及合法区间。
 */
class RangeException : public IsocalBaseException {
public:
    RangeException(DateField field, int64_t value, int64_t minimum, int64_t maximum)
        : IsocalBaseException(buildMessage(field, value, minimum, maximum), ErrorCode::RANGE),
          field_(field), value_(value), minimum_(minimum), maximum_(maximum) {}

    RangeException(DateField field, int64_t value, int64_t minimum, int64_t maximum,
                   const std::string& message)
        : IsocalBaseException(message, ErrorCode::RANGE),
          field_(field), value_(value), minimum_(minimum), maximum_(maximum) {}

    DateField getField() const noexcept { return field_; }
    int64_t getValue() const noexcept { return value_; }
    int64_t getMinimum() const noexcept { return minimum_; }
    int64_t getMaximum() const noexcept { return maximum_; }

private:
    static std::string buildMessage(DateField field, int64_t value, int64_t minimum, int64_t maximum) {
        std::ostringstream oss;
        oss << "Illegal value for " << dateFieldName(field) << " field, value " << value
            << " is not in the range " << minimum << " to " << maximum;
        return oss.str();
    }

    DateField field_;
    int64_t value_;
    int64_t minimum_;
    int64_t maximum_;
};

/**
 * @brief 非法字段异常 - 字段值在自身范围内，但与上下文组合后无效
 */
class InvalidFieldException : public IsocalBaseException {
public:
    InvalidFieldException(DateField field, const std::string& message)
        : IsocalBaseException(message, ErrorCode::INVALID_FIELD), field_(field) {}

    DateField getField() const noexcept { return field_; }

private:
    DateField field_;
};

/**
 * @brief 算术溢出异常 - 结果超出可表示范围，从不回绕或饱和
 */
class ArithmeticOverflowException : public IsocalBaseException {
public:
    explicit ArithmeticOverflowException(const std::string& message)
        : IsocalBaseException(message, ErrorCode::ARITHMETIC_OVERFLOW) {}
};

/**
 * @brief 空输入异常 - 必需的协作对象缺失
 */
class NullInputException : public IsocalBaseException {
public:
    explicit NullInputException(const std::string& message)
        : IsocalBaseException(message, ErrorCode::NULL_INPUT) {}
};

/**
 * @brief 配置异常 - 用于配置文件或参数错误
 */
class ConfigurationException : public IsocalBaseException {
public:
    explicit ConfigurationException(const std::string& message)
        : IsocalBaseException(message, ErrorCode::CONFIGURATION) {}
};

} // namespace isocal::common_utils

/**
 * @brief 生成带文件、行号、函数名的异常消息辅助宏
 */
#define ISOCAL_MAKE_ERROR_MSG(msg) \
    (std::ostringstream() << msg << " (at " << __FILE__ << ":" << __LINE__ << ", in " << __FUNCTION__ << ")").str()

/**
 * @brief 抛出带位置信息的异常辅助宏
 */
#define ISOCAL_THROW(ExceptionType, msg) \
    throw ExceptionType(ISOCAL_MAKE_ERROR_MSG(msg))

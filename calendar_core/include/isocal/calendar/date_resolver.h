/**
 * @file date_resolver.h
 * @brief 无效日期的解析策略
 *
 * 解析策略只有一个能力：resolve(year, month, day) -> 有效日期或失败。
 * 对有效三元组，任何策略都必须原样返回（恒等律）。
 */

#pragma once

#include "isocal/calendar/local_date.h"

#include <functional>
#include <optional>
#include <string>

namespace isocal::calendar {

/**
 * @brief 具名的解析函数值
 *
 * 内置策略见 DateResolvers，调用方也可以传入自己的函数。
 */
class DateResolver {
public:
    using ResolveFunction = std::function<LocalDate(const Year&, const MonthOfYear&, const DayOfMonth&)>;

    /**
     * @throws NullInputException resolveFunction 为空
     */
    DateResolver(std::string name, ResolveFunction resolveFunction);

    LocalDate resolveDate(const Year& year, const MonthOfYear& month, const DayOfMonth& day) const;

    const std::string& getName() const { return name_; }

private:
    std::string name_;
    ResolveFunction resolveFunction_;
};

/**
 * @brief 内置解析策略
 */
class DateResolvers {
public:
    /**
     * @brief 日期超出月长时取该月最后一天
     */
    static const DateResolver& previousValid();

    /**
     * @brief 日期超出月长时取下个月第一天，十二月滚入下一年一月
     */
    static const DateResolver& nextValid();

    /**
     * @brief 日期超出月长时抛出 InvalidFieldException (DAY_OF_MONTH)，从不修改输入
     */
    static const DateResolver& strict();

    /**
     * @brief 按名称查找：previous_valid / next_valid / strict
     */
    static std::optional<DateResolver> forName(const std::string& name);
};

/**
 * @brief 绑定了解析策略的日期，由 LocalDate::withResolver() 返回
 */
class ResolvingDate {
public:
    ResolvingDate(const LocalDate& date, const DateResolver& resolver)
        : date_(date), resolver_(resolver) {}

    const LocalDate& getDate() const { return date_; }
    const DateResolver& getResolver() const { return resolver_; }

    LocalDate plusYears(int years) const { return date_.plusYearsImpl(years, resolver_); }
    LocalDate minusYears(int years) const { return date_.plusYearsImpl(-static_cast<int64_t>(years), resolver_); }
    LocalDate plusMonths(int months) const { return date_.plusMonthsImpl(months, resolver_); }
    LocalDate minusMonths(int months) const { return date_.plusMonthsImpl(-static_cast<int64_t>(months), resolver_); }
    LocalDate withYear(int64_t year) const { return date_.withYear(year, resolver_); }
    LocalDate withMonthOfYear(int monthOfYear) const { return date_.withMonthOfYear(monthOfYear, resolver_); }

private:
    LocalDate date_;
    DateResolver resolver_;
};

} // namespace isocal::calendar

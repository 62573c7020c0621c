/**
 * @file local_date.h
 * @brief 不带时区的 ISO 日期 {Year, MonthOfYear, DayOfMonth}
 */

#pragma once

#include "isocal/calendar/day_of_month.h"
#include "isocal/calendar/day_of_week.h"
#include "isocal/calendar/day_of_year.h"
#include "isocal/calendar/month_of_year.h"
#include "isocal/calendar/year.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace isocal::calendar {

class DateResolver;
class ResolvingDate;

/**
 * @brief 不可变日期值
 *
 * 三元组始终表示真实存在的日期。星期与年内日序按需计算，不作为状态保存。
 * 所有"修改"操作返回新值。
 *
 * 月/年运算可能落到不存在的日期（1 月 31 日加一个月），此时交给 DateResolver
 * 决定结果；未指定时使用 DateResolvers::previousValid()。
 *
 * 错误约定：
 * - RangeException：原始整数超出字段范围
 * - InvalidFieldException：字段组合无效，或 strict 解析拒绝
 * - ArithmeticOverflowException：年份或纪元日超出可表示范围
 */
class LocalDate {
public:
    /**
     * @throws InvalidFieldException 日期超过该月天数
     */
    static LocalDate date(const Year& year, const MonthOfYear& monthOfYear, const DayOfMonth& dayOfMonth);
    static LocalDate date(int64_t year, const MonthOfYear& monthOfYear, int dayOfMonth);
    static LocalDate date(int64_t year, int monthOfYear, int dayOfMonth);

    static LocalDate ofEpochDay(int64_t epochDay);

    const Year& getYear() const { return year_; }
    const MonthOfYear& getMonthOfYear() const { return month_; }
    const DayOfMonth& getDayOfMonth() const { return day_; }
    DayOfYear getDayOfYear() const;
    DayOfWeek getDayOfWeek() const;

    int64_t toEpochDay() const;
    bool isLeapYear() const { return year_.isLeap(); }
    int lengthOfMonth() const;
    int lengthOfYear() const { return year_.lengthInDays(); }

    // ---- 字段调整 ----

    /**
     * @brief 替换年份，日期无效时按解析策略处理（默认 previousValid）
     */
    LocalDate withYear(int64_t year) const;
    LocalDate withYear(int64_t year, const DateResolver& resolver) const;
    LocalDate withMonthOfYear(int monthOfYear) const;
    LocalDate withMonthOfYear(int monthOfYear, const DateResolver& resolver) const;

    /**
     * @throws InvalidFieldException 该月没有这一天
     */
    LocalDate withDayOfMonth(int dayOfMonth) const;
    LocalDate withLastDayOfMonth() const;
    LocalDate withLastDayOfYear() const;

    /**
     * @brief 以与当前年内日序的差值调用 plusDays
     */
    LocalDate withDayOfYear(int dayOfYear) const;

    /**
     * @brief 同一 ISO 周（周一开始）内的指定星期
     */
    LocalDate withDayOfWeek(int dayOfWeek) const;

    /**
     * @brief 绑定解析策略，之后的月/年运算使用该策略
     */
    ResolvingDate withResolver(const DateResolver& resolver) const;

    // ---- 日历运算 ----

    LocalDate plusYears(int years) const;
    LocalDate plusYears(int years, const DateResolver& resolver) const;
    LocalDate plusMonths(int months) const;
    LocalDate plusMonths(int months, const DateResolver& resolver) const;
    LocalDate plusWeeks(int weeks) const;

    /**
     * @brief 当月内直接构造；落在下个月时滚动一个月；更大跨度经由纪元日换算
     */
    LocalDate plusDays(int64_t days) const;

    LocalDate minusYears(int years) const;
    LocalDate minusYears(int years, const DateResolver& resolver) const;
    LocalDate minusMonths(int months) const;
    LocalDate minusMonths(int months, const DateResolver& resolver) const;
    LocalDate minusWeeks(int weeks) const;
    LocalDate minusDays(int64_t days) const;

    // ---- 比较 ----

    int compareTo(const LocalDate& other) const;
    bool isAfter(const LocalDate& other) const { return compareTo(other) > 0; }
    bool isBefore(const LocalDate& other) const { return compareTo(other) < 0; }

    /**
     * @brief 可按字典序排序的规范形式 YYYY-MM-DD
     */
    std::string toString() const;

    friend bool operator==(const LocalDate& lhs, const LocalDate& rhs) { return lhs.compareTo(rhs) == 0; }
    friend bool operator!=(const LocalDate& lhs, const LocalDate& rhs) { return lhs.compareTo(rhs) != 0; }
    friend bool operator<(const LocalDate& lhs, const LocalDate& rhs) { return lhs.compareTo(rhs) < 0; }
    friend bool operator<=(const LocalDate& lhs, const LocalDate& rhs) { return lhs.compareTo(rhs) <= 0; }
    friend bool operator>(const LocalDate& lhs, const LocalDate& rhs) { return lhs.compareTo(rhs) > 0; }
    friend bool operator>=(const LocalDate& lhs, const LocalDate& rhs) { return lhs.compareTo(rhs) >= 0; }

private:
    friend class ResolvingDate;

    LocalDate(const Year& year, const MonthOfYear& monthOfYear, const DayOfMonth& dayOfMonth)
        : year_(year), month_(monthOfYear), day_(dayOfMonth) {}

    LocalDate plusYearsImpl(int64_t years, const DateResolver& resolver) const;
    LocalDate plusMonthsImpl(int64_t months, const DateResolver& resolver) const;

    Year year_;
    MonthOfYear month_;
    DayOfMonth day_;
};

std::ostream& operator<<(std::ostream& os, const LocalDate& date);

} // namespace isocal::calendar

namespace std {

template <>
struct hash<isocal::calendar::LocalDate> {
    std::size_t operator()(const isocal::calendar::LocalDate& date) const noexcept {
        uint32_t yearValue = static_cast<uint32_t>(date.getYear().getValue());
        uint32_t monthValue = static_cast<uint32_t>(date.getMonthOfYear().getValue());
        uint32_t dayValue = static_cast<uint32_t>(date.getDayOfMonth().getValue());
        return static_cast<std::size_t>(
            (yearValue & 0xFFFFF800u) ^ ((yearValue << 11) + (monthValue << 6) + dayValue));
    }
};

} // namespace std

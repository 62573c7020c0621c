/**
 * @file iso_chronology.h
 * @brief ISO 预推格里高利历规则：闰年、月长、年内日序与纪元日换算
 */

#pragma once

#include <cstdint>

namespace isocal::calendar {

class DayOfMonth;
class LocalDate;
class MonthOfYear;
class Year;

/**
 * @brief ISO 日历系统
 *
 * 纪元日 0 对应 1970-01-01。纪元日与年月日的换算覆盖整个 Year 范围。
 */
class IsoChronology {
public:
    /// 0000-01-01 到 1970-01-01 的天数
    static constexpr int64_t DAYS_0000_TO_1970 = 719528;
    /// 400 年周期的天数
    static constexpr int64_t DAYS_PER_CYCLE = 146097;

    static bool isLeapYear(int64_t year);

    static int lengthInDays(const Year& year, const MonthOfYear& month);

    /**
     * @brief 前面各月天数之和加上月内日期
     */
    static int getDayOfYear(const Year& year, const MonthOfYear& month, const DayOfMonth& day);

    /**
     * @throws InvalidFieldException 日期超过该月天数，字段为 DAY_OF_MONTH
     */
    static void checkValidDate(const Year& year, const MonthOfYear& month, const DayOfMonth& day);

    static int64_t toEpochDay(const Year& year, const MonthOfYear& month, const DayOfMonth& day);

    /**
     * @throws ArithmeticOverflowException 结果年份超出 Year 范围
     */
    static LocalDate dateFromEpochDay(int64_t epochDay);

    /**
     * @throws InvalidFieldException dayOfYear 超过当年天数，字段为 DAY_OF_YEAR
     */
    static LocalDate dateFromDayOfYear(const Year& year, int dayOfYear);

private:
    static int64_t daysBeforeYear(int64_t year);
};

} // namespace isocal::calendar

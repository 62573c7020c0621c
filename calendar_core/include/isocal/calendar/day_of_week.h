/**
 * @file day_of_week.h
 * @brief 星期：7 个循环取值，周一为 1
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace isocal::calendar {

class LocalDate;

enum class Weekday : int {
    MONDAY = 1,
    TUESDAY = 2,
    WEDNESDAY = 3,
    THURSDAY = 4,
    FRIDAY = 5,
    SATURDAY = 6,
    SUNDAY = 7
};

/**
 * @brief 星期值对象
 *
 * 加减运算对 7 取模，与具体日期无关；dayOfWeek(date) 由纪元日推导，
 * 不作为 LocalDate 的存储字段。
 */
class DayOfWeek {
public:
    constexpr DayOfWeek(Weekday weekday) : weekday_(weekday) {}

    /**
     * @throws RangeException value 不在 1..7
     */
    static DayOfWeek dayOfWeek(int value);

    /**
     * @brief 由日期计算星期，1970-01-01 为星期四
     */
    static DayOfWeek dayOfWeek(const LocalDate& date);

    static const std::array<DayOfWeek, 7>& values();

    constexpr int getValue() const { return static_cast<int>(weekday_); }
    constexpr Weekday getWeekday() const { return weekday_; }

    const char* getName() const;
    const char* getShortName() const;

    DayOfWeek next() const { return plusDays(1); }
    DayOfWeek previous() const { return plusDays(-1); }
    DayOfWeek plusDays(int64_t days) const;
    DayOfWeek minusDays(int64_t days) const;

    bool matchesDate(const LocalDate& date) const;

    int compareTo(const DayOfWeek& other) const { return getValue() - other.getValue(); }

    std::string toString() const;

    friend constexpr bool operator==(const DayOfWeek& lhs, const DayOfWeek& rhs) { return lhs.weekday_ == rhs.weekday_; }
    friend constexpr bool operator!=(const DayOfWeek& lhs, const DayOfWeek& rhs) { return lhs.weekday_ != rhs.weekday_; }
    friend constexpr bool operator<(const DayOfWeek& lhs, const DayOfWeek& rhs) { return lhs.weekday_ < rhs.weekday_; }
    friend constexpr bool operator>(const DayOfWeek& lhs, const DayOfWeek& rhs) { return lhs.weekday_ > rhs.weekday_; }

private:
    Weekday weekday_;
};

} // namespace isocal::calendar

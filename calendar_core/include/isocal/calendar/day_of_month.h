#pragma once

#include <string>

namespace isocal::calendar {

class LocalDate;
class MonthOfYear;
class Year;

/**
 * @brief 月内日期 1..31
 *
 * 构造时只校验 1..31；与具体年月的组合校验在组装 LocalDate 时进行。
 */
class DayOfMonth {
public:
    static constexpr int MIN_VALUE = 1;
    static constexpr int MAX_VALUE = 31;

    /**
     * @throws RangeException value 不在 1..31
     */
    static DayOfMonth dayOfMonth(int value);
    static DayOfMonth dayOfMonth(const LocalDate& date);

    int getValue() const { return day_; }

    bool isValid(const Year& year, const MonthOfYear& month) const;

    int compareTo(const DayOfMonth& other) const { return day_ - other.day_; }

    std::string toString() const;

    friend bool operator==(const DayOfMonth& lhs, const DayOfMonth& rhs) { return lhs.day_ == rhs.day_; }
    friend bool operator!=(const DayOfMonth& lhs, const DayOfMonth& rhs) { return lhs.day_ != rhs.day_; }
    friend bool operator<(const DayOfMonth& lhs, const DayOfMonth& rhs) { return lhs.day_ < rhs.day_; }
    friend bool operator<=(const DayOfMonth& lhs, const DayOfMonth& rhs) { return lhs.day_ <= rhs.day_; }
    friend bool operator>(const DayOfMonth& lhs, const DayOfMonth& rhs) { return lhs.day_ > rhs.day_; }
    friend bool operator>=(const DayOfMonth& lhs, const DayOfMonth& rhs) { return lhs.day_ >= rhs.day_; }

private:
    explicit constexpr DayOfMonth(int day) : day_(day) {}

    int day_;
};

} // namespace isocal::calendar

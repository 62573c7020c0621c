#pragma once

#include <string>

namespace isocal::calendar {

class LocalDate;
class Year;

/**
 * @brief 年内第几天 1..366，闰年上限 366，平年 365
 */
class DayOfYear {
public:
    static constexpr int MIN_VALUE = 1;
    static constexpr int MAX_VALUE = 366;

    /**
     * @throws RangeException value 不在 1..366
     */
    static DayOfYear dayOfYear(int value);
    static DayOfYear dayOfYear(const LocalDate& date);

    int getValue() const { return day_; }

    bool isValid(const Year& year) const;

    /**
     * @brief 在给定年份中定位该天，按月长依次扣减得到月与日
     * @throws InvalidFieldException 平年请求第 366 天
     */
    LocalDate atYear(const Year& year) const;

    int compareTo(const DayOfYear& other) const { return day_ - other.day_; }

    std::string toString() const;

    friend bool operator==(const DayOfYear& lhs, const DayOfYear& rhs) { return lhs.day_ == rhs.day_; }
    friend bool operator!=(const DayOfYear& lhs, const DayOfYear& rhs) { return lhs.day_ != rhs.day_; }
    friend bool operator<(const DayOfYear& lhs, const DayOfYear& rhs) { return lhs.day_ < rhs.day_; }
    friend bool operator>(const DayOfYear& lhs, const DayOfYear& rhs) { return lhs.day_ > rhs.day_; }

private:
    explicit constexpr DayOfYear(int day) : day_(day) {}

    int day_;
};

} // namespace isocal::calendar

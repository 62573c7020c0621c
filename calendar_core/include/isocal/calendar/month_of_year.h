/**
 * @file month_of_year.h
 * @brief 月份：12 个固定取值的带行为枚举
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace isocal::calendar {

class LocalDate;
class Year;

enum class Month : int {
    JANUARY = 1,
    FEBRUARY = 2,
    MARCH = 3,
    APRIL = 4,
    MAY = 5,
    JUNE = 6,
    JULY = 7,
    AUGUST = 8,
    SEPTEMBER = 9,
    OCTOBER = 10,
    NOVEMBER = 11,
    DECEMBER = 12
};

/**
 * @brief 月份值对象
 *
 * 可由 Month 枚举隐式构造，所有行为都是基于枚举标签与查找表的纯函数。
 * 名义天数按平年给出，二月的实际天数由 lengthInDays(year) 决定。
 */
class MonthOfYear {
public:
    constexpr MonthOfYear(Month month) : month_(month) {}

    /**
     * @throws RangeException value 不在 1..12
     */
    static MonthOfYear monthOfYear(int value);
    static MonthOfYear monthOfYear(const LocalDate& date);

    /**
     * @brief 按一月到十二月顺序的全部取值
     */
    static const std::array<MonthOfYear, 12>& values();

    constexpr int getValue() const { return static_cast<int>(month_); }
    constexpr Month getMonth() const { return month_; }

    const char* getName() const;
    const char* getShortName() const;

    /**
     * @brief 该月在给定年份的天数；二月在闰年为 29，否则 28
     */
    int lengthInDays(const Year& year) const;
    int minLengthInDays() const;
    int maxLengthInDays() const;

    int getQuarterOfYear() const { return (getValue() - 1) / 3 + 1; }

    // 循环运算：DECEMBER.next() == JANUARY
    MonthOfYear next() const { return plusMonths(1); }
    MonthOfYear previous() const { return plusMonths(-1); }
    MonthOfYear plusMonths(int64_t months) const;
    MonthOfYear minusMonths(int64_t months) const;

    int compareTo(const MonthOfYear& other) const { return getValue() - other.getValue(); }

    std::string toString() const;

    friend constexpr bool operator==(const MonthOfYear& lhs, const MonthOfYear& rhs) { return lhs.month_ == rhs.month_; }
    friend constexpr bool operator!=(const MonthOfYear& lhs, const MonthOfYear& rhs) { return lhs.month_ != rhs.month_; }
    friend constexpr bool operator<(const MonthOfYear& lhs, const MonthOfYear& rhs) { return lhs.month_ < rhs.month_; }
    friend constexpr bool operator<=(const MonthOfYear& lhs, const MonthOfYear& rhs) { return lhs.month_ <= rhs.month_; }
    friend constexpr bool operator>(const MonthOfYear& lhs, const MonthOfYear& rhs) { return lhs.month_ > rhs.month_; }
    friend constexpr bool operator>=(const MonthOfYear& lhs, const MonthOfYear& rhs) { return lhs.month_ >= rhs.month_; }

private:
    Month month_;
};

} // namespace isocal::calendar

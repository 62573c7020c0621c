/**
 * @file year.h
 * @brief ISO 预推格里高利历年份
 */

#pragma once

#include "isocal/calendar/era.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace isocal::calendar {

class LocalDate;
class MonthOfYear;

/**
 * @brief 不可变的年份值
 *
 * 取值范围 [MIN_YEAR, MAX_YEAR]。最小值比 int32 最小值大 2，保留两个哨兵值，
 * 使年份运算在 int32 内永不回绕。年份运算越界时抛出 ArithmeticOverflowException。
 *
 * 闰年规则对所有年份（含 0 与负年份）统一适用：年份 0 即公元前 1 年，为闰年。
 */
class Year {
public:
    static constexpr int32_t MIN_YEAR = std::numeric_limits<int32_t>::min() + 2;
    static constexpr int32_t MAX_YEAR = std::numeric_limits<int32_t>::max();

    /**
     * @brief 按 ISO 年份数值构造
     * @throws RangeException 数值不在 [MIN_YEAR, MAX_YEAR] 内
     */
    static Year isoYear(int64_t isoYear);

    /**
     * @brief 按纪元与纪元内年份构造，BC n 对应 ISO 年份 1 - n
     * @throws RangeException yearOfEra 小于 1 或结果越界
     */
    static Year of(Era era, int64_t yearOfEra);

    static Year year(const LocalDate& date);

    int32_t getValue() const { return year_; }

    /**
     * @brief 格里高利闰年规则：能被 4 整除且 (不能被 100 整除或能被 400 整除)
     */
    bool isLeap() const;

    /**
     * @brief 当年天数，365 或 366
     */
    int lengthInDays() const;

    /**
     * @throws ArithmeticOverflowException 结果超出年份范围
     */
    Year plusYears(int64_t years) const;
    Year minusYears(int64_t years) const;

    /**
     * @throws ArithmeticOverflowException 已处于 MAX_YEAR
     */
    Year next() const;

    /**
     * @throws ArithmeticOverflowException 已处于 MIN_YEAR
     */
    Year previous() const;

    /**
     * @brief 之后的第一个闰年；逐年前进，到达边界时传播溢出异常
     */
    Year nextLeap() const;
    Year previousLeap() const;

    Era getEra() const;
    int64_t getYearOfEra() const;
    int64_t getCenturyOfEra() const;
    int64_t getMillenniumOfEra() const;
    int getDecadeOfCentury() const;

    bool isValidMonthDay(const MonthOfYear& month, int dayOfMonth) const;

    /**
     * @throws RangeException dayOfYear 不在 1..366
     * @throws InvalidFieldException 非闰年请求第 366 天
     */
    LocalDate atDay(int dayOfYear) const;

    /**
     * @throws InvalidFieldException 日期在该年该月不存在
     */
    LocalDate atMonthDay(const MonthOfYear& month, int dayOfMonth) const;

    int compareTo(const Year& other) const;
    bool isAfter(const Year& other) const { return year_ > other.year_; }
    bool isBefore(const Year& other) const { return year_ < other.year_; }

    std::string toString() const;

    friend bool operator==(const Year& lhs, const Year& rhs) { return lhs.year_ == rhs.year_; }
    friend bool operator!=(const Year& lhs, const Year& rhs) { return lhs.year_ != rhs.year_; }
    friend bool operator<(const Year& lhs, const Year& rhs) { return lhs.year_ < rhs.year_; }
    friend bool operator<=(const Year& lhs, const Year& rhs) { return lhs.year_ <= rhs.year_; }
    friend bool operator>(const Year& lhs, const Year& rhs) { return lhs.year_ > rhs.year_; }
    friend bool operator>=(const Year& lhs, const Year& rhs) { return lhs.year_ >= rhs.year_; }

private:
    explicit constexpr Year(int32_t year) : year_(year) {}

    static Year checkedYear(int64_t value, const char* operation);

    int32_t year_;
};

} // namespace isocal::calendar

namespace std {

template <>
struct hash<isocal::calendar::Year> {
    std::size_t operator()(const isocal::calendar::Year& year) const noexcept {
        return std::hash<int32_t>()(year.getValue());
    }
};

} // namespace std

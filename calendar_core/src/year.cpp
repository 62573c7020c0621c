/**
 * @file year.cpp
 * @brief 年份值类型实现
 */

#include "isocal/calendar/year.h"

#include "isocal/calendar/iso_chronology.h"
#include "isocal/calendar/local_date.h"
#include "isocal/common_utils/utilities/exceptions.h"
#include "isocal/common_utils/utilities/math_utils.h"

namespace isocal::calendar {

using common_utils::ArithmeticOverflowException;
using common_utils::DateField;
using common_utils::MathUtils;
using common_utils::RangeException;

// =============================================================================
// 构造
// =============================================================================

Year Year::isoYear(int64_t isoYear) {
    if (isoYear < MIN_YEAR || isoYear > MAX_YEAR) {
        throw RangeException(DateField::YEAR, isoYear, MIN_YEAR, MAX_YEAR);
    }
    return Year(static_cast<int32_t>(isoYear));
}

Year Year::of(Era era, int64_t yearOfEra) {
    // BC 方向的上限 1 - MIN_YEAR 恰好等于 MAX_YEAR
    if (yearOfEra < 1 || yearOfEra > MAX_YEAR) {
        throw RangeException(DateField::YEAR_OF_ERA, yearOfEra, 1, MAX_YEAR);
    }
    return isoYear(era == Era::AD ? yearOfEra : 1 - yearOfEra);
}

Year Year::year(const LocalDate& date) {
    return date.getYear();
}

Year Year::checkedYear(int64_t value, const char* operation) {
    if (value < MIN_YEAR || value > MAX_YEAR) {
        ISOCAL_THROW(ArithmeticOverflowException,
                     "Year " << operation << " overflows the supported range: " << value);
    }
    return Year(static_cast<int32_t>(value));
}

// =============================================================================
// 闰年与长度
// =============================================================================

bool Year::isLeap() const {
    return IsoChronology::isLeapYear(year_);
}

int Year::lengthInDays() const {
    return isLeap() ? 366 : 365;
}

// =============================================================================
// 年份运算
// =============================================================================

Year Year::plusYears(int64_t years) const {
    if (years == 0) {
        return *this;
    }
    return checkedYear(MathUtils::safeAdd(year_, years), "addition");
}

Year Year::minusYears(int64_t years) const {
    if (years == 0) {
        return *this;
    }
    return checkedYear(MathUtils::safeSubtract(year_, years), "subtraction");
}

Year Year::next() const {
    return checkedYear(static_cast<int64_t>(year_) + 1, "next");
}

Year Year::previous() const {
    return checkedYear(static_cast<int64_t>(year_) - 1, "previous");
}

Year Year::nextLeap() const {
    Year candidate = next();
    while (!candidate.isLeap()) {
        candidate = candidate.next();
    }
    return candidate;
}

Year Year::previousLeap() const {
    Year candidate = previous();
    while (!candidate.isLeap()) {
        candidate = candidate.previous();
    }
    return candidate;
}

// =============================================================================
// 纪元
// =============================================================================

Era Year::getEra() const {
    return year_ > 0 ? Era::AD : Era::BC;
}

int64_t Year::getYearOfEra() const {
    return year_ > 0 ? static_cast<int64_t>(year_) : 1 - static_cast<int64_t>(year_);
}

int64_t Year::getCenturyOfEra() const {
    return getYearOfEra() / 100;
}

int64_t Year::getMillenniumOfEra() const {
    return getYearOfEra() / 1000;
}

int Year::getDecadeOfCentury() const {
    return static_cast<int>((getYearOfEra() % 100) / 10);
}

// =============================================================================
// 组合为日期
// =============================================================================

bool Year::isValidMonthDay(const MonthOfYear& month, int dayOfMonth) const {
    return dayOfMonth >= 1 && dayOfMonth <= month.lengthInDays(*this);
}

LocalDate Year::atDay(int dayOfYear) const {
    return DayOfYear::dayOfYear(dayOfYear).atYear(*this);
}

LocalDate Year::atMonthDay(const MonthOfYear& month, int dayOfMonth) const {
    return LocalDate::date(*this, month, DayOfMonth::dayOfMonth(dayOfMonth));
}

// =============================================================================
// 比较与输出
// =============================================================================

int Year::compareTo(const Year& other) const {
    return year_ < other.year_ ? -1 : (year_ > other.year_ ? 1 : 0);
}

std::string Year::toString() const {
    return std::to_string(year_);
}

} // namespace isocal::calendar

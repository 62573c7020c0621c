/**
 * @file local_date.cpp
 * @brief 日期构造、字段调整与日历运算
 */

#include "isocal/calendar/local_date.h"

#include "isocal/calendar/date_resolver.h"
#include "isocal/calendar/iso_chronology.h"
#include "isocal/common_utils/utilities/exceptions.h"
#include "isocal/common_utils/utilities/math_utils.h"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace isocal::calendar {

using common_utils::DateField;
using common_utils::InvalidFieldException;
using common_utils::MathUtils;

// =============================================================================
// 构造
// =============================================================================

LocalDate LocalDate::date(const Year& year, const MonthOfYear& monthOfYear, const DayOfMonth& dayOfMonth) {
    IsoChronology::checkValidDate(year, monthOfYear, dayOfMonth);
    return LocalDate(year, monthOfYear, dayOfMonth);
}

LocalDate LocalDate::date(int64_t year, const MonthOfYear& monthOfYear, int dayOfMonth) {
    return date(Year::isoYear(year), monthOfYear, DayOfMonth::dayOfMonth(dayOfMonth));
}

LocalDate LocalDate::date(int64_t year, int monthOfYear, int dayOfMonth) {
    return date(Year::isoYear(year), MonthOfYear::monthOfYear(monthOfYear), DayOfMonth::dayOfMonth(dayOfMonth));
}

LocalDate LocalDate::ofEpochDay(int64_t epochDay) {
    return IsoChronology::dateFromEpochDay(epochDay);
}

// =============================================================================
// 派生字段
// =============================================================================

DayOfYear LocalDate::getDayOfYear() const {
    return DayOfYear::dayOfYear(IsoChronology::getDayOfYear(year_, month_, day_));
}

DayOfWeek LocalDate::getDayOfWeek() const {
    return DayOfWeek::dayOfWeek(*this);
}

int64_t LocalDate::toEpochDay() const {
    return IsoChronology::toEpochDay(year_, month_, day_);
}

int LocalDate::lengthOfMonth() const {
    return month_.lengthInDays(year_);
}

// =============================================================================
// 字段调整
// =============================================================================

LocalDate LocalDate::withYear(int64_t year) const {
    return withYear(year, DateResolvers::previousValid());
}

LocalDate LocalDate::withYear(int64_t year, const DateResolver& resolver) const {
    if (year == year_.getValue()) {
        return *this;
    }
    return resolver.resolveDate(Year::isoYear(year), month_, day_);
}

LocalDate LocalDate::withMonthOfYear(int monthOfYear) const {
    return withMonthOfYear(monthOfYear, DateResolvers::previousValid());
}

LocalDate LocalDate::withMonthOfYear(int monthOfYear, const DateResolver& resolver) const {
    if (monthOfYear == month_.getValue()) {
        return *this;
    }
    return resolver.resolveDate(year_, MonthOfYear::monthOfYear(monthOfYear), day_);
}

LocalDate LocalDate::withDayOfMonth(int dayOfMonth) const {
    if (dayOfMonth == day_.getValue()) {
        return *this;
    }
    return date(year_, month_, DayOfMonth::dayOfMonth(dayOfMonth));
}

LocalDate LocalDate::withLastDayOfMonth() const {
    return withDayOfMonth(lengthOfMonth());
}

LocalDate LocalDate::withLastDayOfYear() const {
    return LocalDate(year_, Month::DECEMBER, DayOfMonth::dayOfMonth(31));
}

LocalDate LocalDate::withDayOfYear(int dayOfYear) const {
    DayOfYear target = DayOfYear::dayOfYear(dayOfYear);
    if (!target.isValid(year_)) {
        throw InvalidFieldException(DateField::DAY_OF_YEAR,
            ISOCAL_MAKE_ERROR_MSG("Illegal value for DayOfYear field, value " << dayOfYear
                << " is not valid for year " << year_.getValue()));
    }
    return plusDays(static_cast<int64_t>(target.getValue()) - getDayOfYear().getValue());
}

LocalDate LocalDate::withDayOfWeek(int dayOfWeek) const {
    DayOfWeek target = DayOfWeek::dayOfWeek(dayOfWeek);
    return plusDays(static_cast<int64_t>(target.getValue()) - getDayOfWeek().getValue());
}

ResolvingDate LocalDate::withResolver(const DateResolver& resolver) const {
    return ResolvingDate(*this, resolver);
}

// =============================================================================
// 日历运算
// =============================================================================

LocalDate LocalDate::plusYears(int years) const {
    return plusYearsImpl(years, DateResolvers::previousValid());
}

LocalDate LocalDate::plusYears(int years, const DateResolver& resolver) const {
    return plusYearsImpl(years, resolver);
}

LocalDate LocalDate::plusMonths(int months) const {
    return plusMonthsImpl(months, DateResolvers::previousValid());
}

LocalDate LocalDate::plusMonths(int months, const DateResolver& resolver) const {
    return plusMonthsImpl(months, resolver);
}

LocalDate LocalDate::plusWeeks(int weeks) const {
    return plusDays(7LL * weeks);
}

LocalDate LocalDate::plusDays(int64_t days) const {
    if (days == 0) {
        return *this;
    }

    int dayValue = day_.getValue();
    if (days >= 1 - dayValue && days <= 62) {
        int possibleDay = dayValue + static_cast<int>(days);
        int monthLength = lengthOfMonth();
        if (possibleDay <= monthLength) {
            return LocalDate(year_, month_, DayOfMonth::dayOfMonth(possibleDay));
        }
        // 一月的天数与年份无关，十二月的下个月长度可直接按当前年计算
        MonthOfYear nextMonth = month_.next();
        if (possibleDay <= monthLength + nextMonth.lengthInDays(year_)) {
            Year nextYear = month_ == Month::DECEMBER ? year_.next() : year_;
            return LocalDate(nextYear, nextMonth, DayOfMonth::dayOfMonth(possibleDay - monthLength));
        }
    }

    return IsoChronology::dateFromEpochDay(MathUtils::safeAdd(toEpochDay(), days));
}

LocalDate LocalDate::minusYears(int years) const {
    return plusYearsImpl(-static_cast<int64_t>(years), DateResolvers::previousValid());
}

LocalDate LocalDate::minusYears(int years, const DateResolver& resolver) const {
    return plusYearsImpl(-static_cast<int64_t>(years), resolver);
}

LocalDate LocalDate::minusMonths(int months) const {
    return plusMonthsImpl(-static_cast<int64_t>(months), DateResolvers::previousValid());
}

LocalDate LocalDate::minusMonths(int months, const DateResolver& resolver) const {
    return plusMonthsImpl(-static_cast<int64_t>(months), resolver);
}

LocalDate LocalDate::minusWeeks(int weeks) const {
    return plusDays(-7LL * weeks);
}

LocalDate LocalDate::minusDays(int64_t days) const {
    return plusDays(MathUtils::safeNegate(days));
}

LocalDate LocalDate::plusYearsImpl(int64_t years, const DateResolver& resolver) const {
    if (years == 0) {
        return *this;
    }
    return resolver.resolveDate(year_.plusYears(years), month_, day_);
}

LocalDate LocalDate::plusMonthsImpl(int64_t months, const DateResolver& resolver) const {
    if (months == 0) {
        return *this;
    }
    int64_t monthCount = MathUtils::safeMultiply(year_.getValue(), 12) + (month_.getValue() - 1);
    int64_t targetCount = MathUtils::safeAdd(monthCount, months);
    int64_t yearDelta = MathUtils::floorDiv(targetCount, 12) - year_.getValue();
    Year newYear = year_.plusYears(yearDelta);
    MonthOfYear newMonth = MonthOfYear::monthOfYear(static_cast<int>(MathUtils::floorMod(targetCount, 12)) + 1);
    return resolver.resolveDate(newYear, newMonth, day_);
}

// =============================================================================
// 比较与输出
// =============================================================================

int LocalDate::compareTo(const LocalDate& other) const {
    int cmp = year_.compareTo(other.year_);
    if (cmp == 0) {
        cmp = month_.compareTo(other.month_);
        if (cmp == 0) {
            cmp = day_.compareTo(other.day_);
        }
    }
    return cmp;
}

std::string LocalDate::toString() const {
    int64_t yearValue = year_.getValue();
    int64_t absYear = yearValue < 0 ? -yearValue : yearValue;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (absYear < 1000) {
        if (yearValue < 0) {
            oss << '-';
        }
        oss << std::setw(4) << absYear;
    } else {
        if (yearValue > 9999) {
            oss << '+';
        }
        oss << yearValue;
    }
    oss << '-' << std::setw(2) << month_.getValue()
        << '-' << std::setw(2) << day_.getValue();
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const LocalDate& date) {
    return os << date.toString();
}

} // namespace isocal::calendar

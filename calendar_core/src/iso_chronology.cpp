/**
 * @file iso_chronology.cpp
 * @brief ISO 日历规则实现
 *
 * 纪元日换算以 0000-01-01 为内部原点，按 400 年周期 (146097 天) 拆分，
 * 周期内先估算年份再逐年校正，最后按月长扣减得到月与日。
 */

#include "isocal/calendar/iso_chronology.h"

#include "isocal/calendar/local_date.h"
#include "isocal/common_utils/utilities/exceptions.h"
#include "isocal/common_utils/utilities/math_utils.h"

namespace isocal::calendar {

using common_utils::ArithmeticOverflowException;
using common_utils::DateField;
using common_utils::InvalidFieldException;
using common_utils::MathUtils;
using common_utils::RangeException;

namespace {

/**
 * @brief 400 年周期内前 k 年 (0 <= k <= 400) 的总天数，周期首年为闰年
 */
int64_t daysBeforeYearOfCycle(int64_t k) {
    return 365 * k + (k + 3) / 4 - (k + 99) / 100 + (k + 399) / 400;
}

/**
 * @brief 按月长扣减，将年内日序拆分为月与日；调用方保证 dayOfYear 有效
 */
LocalDate splitDayOfYear(const Year& year, int dayOfYear) {
    int remaining = dayOfYear;
    for (const MonthOfYear& month : MonthOfYear::values()) {
        int length = month.lengthInDays(year);
        if (remaining <= length) {
            return LocalDate::date(year, month, DayOfMonth::dayOfMonth(remaining));
        }
        remaining -= length;
    }
    throw InvalidFieldException(DateField::DAY_OF_YEAR,
        ISOCAL_MAKE_ERROR_MSG("Day of year " << dayOfYear << " exceeds year " << year.getValue()));
}

} // anonymous namespace

bool IsoChronology::isLeapYear(int64_t year) {
    return (year % 4 == 0) && (year % 100 != 0 || year % 400 == 0);
}

int IsoChronology::lengthInDays(const Year& year, const MonthOfYear& month) {
    return month.lengthInDays(year);
}

int IsoChronology::getDayOfYear(const Year& year, const MonthOfYear& month, const DayOfMonth& day) {
    int total = 0;
    for (const MonthOfYear& preceding : MonthOfYear::values()) {
        if (preceding == month) {
            break;
        }
        total += preceding.lengthInDays(year);
    }
    return total + day.getValue();
}

void IsoChronology::checkValidDate(const Year& year, const MonthOfYear& month, const DayOfMonth& day) {
    if (!day.isValid(year, month)) {
        throw InvalidFieldException(DateField::DAY_OF_MONTH,
            ISOCAL_MAKE_ERROR_MSG("Illegal value for DayOfMonth field, value " << day.getValue()
                << " is not valid for " << month.getName() << " " << year.getValue()));
    }
}

int64_t IsoChronology::daysBeforeYear(int64_t year) {
    return 365 * year
        + MathUtils::floorDiv(year + 3, 4)
        - MathUtils::floorDiv(year + 99, 100)
        + MathUtils::floorDiv(year + 399, 400);
}

int64_t IsoChronology::toEpochDay(const Year& year, const MonthOfYear& month, const DayOfMonth& day) {
    return daysBeforeYear(year.getValue())
        + (getDayOfYear(year, month, day) - 1)
        - DAYS_0000_TO_1970;
}

LocalDate IsoChronology::dateFromEpochDay(int64_t epochDay) {
    int64_t zeroDay = MathUtils::safeAdd(epochDay, DAYS_0000_TO_1970);
    int64_t cycle = MathUtils::floorDiv(zeroDay, DAYS_PER_CYCLE);
    int64_t dayOfCycle = MathUtils::floorMod(zeroDay, DAYS_PER_CYCLE);

    int64_t yearOfCycle = dayOfCycle / 366;
    while (daysBeforeYearOfCycle(yearOfCycle + 1) <= dayOfCycle) {
        ++yearOfCycle;
    }

    int64_t yearValue = cycle * 400 + yearOfCycle;
    if (yearValue < Year::MIN_YEAR || yearValue > Year::MAX_YEAR) {
        ISOCAL_THROW(ArithmeticOverflowException,
                     "Epoch day " << epochDay << " is outside the supported year range");
    }

    int dayOfYear = static_cast<int>(dayOfCycle - daysBeforeYearOfCycle(yearOfCycle)) + 1;
    return splitDayOfYear(Year::isoYear(yearValue), dayOfYear);
}

LocalDate IsoChronology::dateFromDayOfYear(const Year& year, int dayOfYear) {
    if (dayOfYear < 1 || dayOfYear > 366) {
        throw RangeException(DateField::DAY_OF_YEAR, dayOfYear, 1, 366);
    }
    if (dayOfYear > year.lengthInDays()) {
        throw InvalidFieldException(DateField::DAY_OF_YEAR,
            ISOCAL_MAKE_ERROR_MSG("Illegal value for DayOfYear field, value " << dayOfYear
                << " is not valid for non-leap year " << year.getValue()));
    }
    return splitDayOfYear(year, dayOfYear);
}

} // namespace isocal::calendar

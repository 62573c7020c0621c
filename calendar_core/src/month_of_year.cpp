/**
 * @file month_of_year.cpp
 * @brief 月份值类型实现 - 基于查找表
 */

#include "isocal/calendar/month_of_year.h"

#include "isocal/calendar/local_date.h"
#include "isocal/calendar/year.h"
#include "isocal/common_utils/utilities/exceptions.h"

namespace isocal::calendar {

using common_utils::DateField;
using common_utils::RangeException;

namespace {

struct MonthInfo {
    int nominalLength;  // 平年天数
    const char* name;
    const char* shortName;
};

const std::array<MonthInfo, 12> MONTH_TABLE = {{
    {31, "JANUARY", "Jan"},
    {28, "FEBRUARY", "Feb"},
    {31, "MARCH", "Mar"},
    {30, "APRIL", "Apr"},
    {31, "MAY", "May"},
    {30, "JUNE", "Jun"},
    {31, "JULY", "Jul"},
    {31, "AUGUST", "Aug"},
    {30, "SEPTEMBER", "Sep"},
    {31, "OCTOBER", "Oct"},
    {30, "NOVEMBER", "Nov"},
    {31, "DECEMBER", "Dec"}
}};

const MonthInfo& infoOf(const MonthOfYear& month) {
    return MONTH_TABLE[static_cast<std::size_t>(month.getValue() - 1)];
}

} // anonymous namespace

MonthOfYear MonthOfYear::monthOfYear(int value) {
    if (value < 1 || value > 12) {
        throw RangeException(DateField::MONTH_OF_YEAR, value, 1, 12);
    }
    return values()[static_cast<std::size_t>(value - 1)];
}

MonthOfYear MonthOfYear::monthOfYear(const LocalDate& date) {
    return date.getMonthOfYear();
}

const std::array<MonthOfYear, 12>& MonthOfYear::values() {
    static const std::array<MonthOfYear, 12> ALL = {{
        Month::JANUARY, Month::FEBRUARY, Month::MARCH, Month::APRIL,
        Month::MAY, Month::JUNE, Month::JULY, Month::AUGUST,
        Month::SEPTEMBER, Month::OCTOBER, Month::NOVEMBER, Month::DECEMBER
    }};
    return ALL;
}

const char* MonthOfYear::getName() const {
    return infoOf(*this).name;
}

const char* MonthOfYear::getShortName() const {
    return infoOf(*this).shortName;
}

int MonthOfYear::lengthInDays(const Year& year) const {
    if (month_ == Month::FEBRUARY) {
        return year.isLeap() ? 29 : 28;
    }
    return infoOf(*this).nominalLength;
}

int MonthOfYear::minLengthInDays() const {
    return infoOf(*this).nominalLength;
}

int MonthOfYear::maxLengthInDays() const {
    return month_ == Month::FEBRUARY ? 29 : infoOf(*this).nominalLength;
}

MonthOfYear MonthOfYear::plusMonths(int64_t months) const {
    int64_t amount = months % 12;
    int64_t index = ((getValue() - 1 + amount) % 12 + 12) % 12;
    return values()[static_cast<std::size_t>(index)];
}

MonthOfYear MonthOfYear::minusMonths(int64_t months) const {
    return plusMonths(-(months % 12));
}

std::string MonthOfYear::toString() const {
    return std::string("MonthOfYear=") + getName();
}

} // namespace isocal::calendar

#include "isocal/calendar/day_of_month.h"

#include "isocal/calendar/local_date.h"
#include "isocal/common_utils/utilities/exceptions.h"

namespace isocal::calendar {

using common_utils::DateField;
using common_utils::RangeException;

DayOfMonth DayOfMonth::dayOfMonth(int value) {
    if (value < MIN_VALUE || value > MAX_VALUE) {
        throw RangeException(DateField::DAY_OF_MONTH, value, MIN_VALUE, MAX_VALUE);
    }
    return DayOfMonth(value);
}

DayOfMonth DayOfMonth::dayOfMonth(const LocalDate& date) {
    return date.getDayOfMonth();
}

bool DayOfMonth::isValid(const Year& year, const MonthOfYear& month) const {
    return day_ <= month.lengthInDays(year);
}

std::string DayOfMonth::toString() const {
    return "DayOfMonth=" + std::to_string(day_);
}

} // namespace isocal::calendar

#include "isocal/calendar/day_of_year.h"

#include "isocal/calendar/iso_chronology.h"
#include "isocal/calendar/local_date.h"
#include "isocal/common_utils/utilities/exceptions.h"

namespace isocal::calendar {

using common_utils::DateField;
using common_utils::RangeException;

DayOfYear DayOfYear::dayOfYear(int value) {
    if (value < MIN_VALUE || value > MAX_VALUE) {
        throw RangeException(DateField::DAY_OF_YEAR, value, MIN_VALUE, MAX_VALUE);
    }
    return DayOfYear(value);
}

DayOfYear DayOfYear::dayOfYear(const LocalDate& date) {
    return date.getDayOfYear();
}

bool DayOfYear::isValid(const Year& year) const {
    return day_ <= year.lengthInDays();
}

LocalDate DayOfYear::atYear(const Year& year) const {
    return IsoChronology::dateFromDayOfYear(year, day_);
}

std::string DayOfYear::toString() const {
    return "DayOfYear=" + std::to_string(day_);
}

} // namespace isocal::calendar

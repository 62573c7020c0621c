/**
 * @file day_of_week.cpp
 * @brief 星期值类型实现
 */

#include "isocal/calendar/day_of_week.h"

#include "isocal/calendar/local_date.h"
#include "isocal/common_utils/utilities/exceptions.h"
#include "isocal/common_utils/utilities/math_utils.h"

namespace isocal::calendar {

using common_utils::DateField;
using common_utils::MathUtils;
using common_utils::RangeException;

namespace {

const char* const DAY_NAMES[7] = {
    "MONDAY", "TUESDAY", "WEDNESDAY", "THURSDAY", "FRIDAY", "SATURDAY", "SUNDAY"
};

const char* const DAY_SHORT_NAMES[7] = {
    "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"
};

} // anonymous namespace

DayOfWeek DayOfWeek::dayOfWeek(int value) {
    if (value < 1 || value > 7) {
        throw RangeException(DateField::DAY_OF_WEEK, value, 1, 7);
    }
    return values()[static_cast<std::size_t>(value - 1)];
}

DayOfWeek DayOfWeek::dayOfWeek(const LocalDate& date) {
    // 纪元日 0 (1970-01-01) 为星期四，偏移 3 使周一落在余数 0
    int64_t index = MathUtils::floorMod(date.toEpochDay() + 3, 7);
    return values()[static_cast<std::size_t>(index)];
}

const std::array<DayOfWeek, 7>& DayOfWeek::values() {
    static const std::array<DayOfWeek, 7> ALL = {{
        Weekday::MONDAY, Weekday::TUESDAY, Weekday::WEDNESDAY, Weekday::THURSDAY,
        Weekday::FRIDAY, Weekday::SATURDAY, Weekday::SUNDAY
    }};
    return ALL;
}

const char* DayOfWeek::getName() const {
    return DAY_NAMES[getValue() - 1];
}

const char* DayOfWeek::getShortName() const {
    return DAY_SHORT_NAMES[getValue() - 1];
}

DayOfWeek DayOfWeek::plusDays(int64_t days) const {
    int64_t amount = days % 7;
    int64_t index = ((getValue() - 1 + amount) % 7 + 7) % 7;
    return values()[static_cast<std::size_t>(index)];
}

DayOfWeek DayOfWeek::minusDays(int64_t days) const {
    return plusDays(-(days % 7));
}

bool DayOfWeek::matchesDate(const LocalDate& date) const {
    return dayOfWeek(date) == *this;
}

std::string DayOfWeek::toString() const {
    return std::string("DayOfWeek=") + getName();
}

} // namespace isocal::calendar

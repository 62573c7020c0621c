/**
 * @file date_resolver.cpp
 * @brief 内置日期解析策略
 */

#include "isocal/calendar/date_resolver.h"

#include "isocal/common_utils/utilities/exceptions.h"

#include <utility>

namespace isocal::calendar {

using common_utils::NullInputException;

DateResolver::DateResolver(std::string name, ResolveFunction resolveFunction)
    : name_(std::move(name)), resolveFunction_(std::move(resolveFunction)) {
    if (!resolveFunction_) {
        ISOCAL_THROW(NullInputException, "DateResolver '" << name_ << "' has no resolve function");
    }
}

LocalDate DateResolver::resolveDate(const Year& year, const MonthOfYear& month, const DayOfMonth& day) const {
    return resolveFunction_(year, month, day);
}

// =============================================================================
// 内置策略
// =============================================================================

const DateResolver& DateResolvers::previousValid() {
    static const DateResolver RESOLVER("previous_valid",
        [](const Year& year, const MonthOfYear& month, const DayOfMonth& day) {
            int lastDay = month.lengthInDays(year);
            if (day.getValue() > lastDay) {
                return LocalDate::date(year, month, DayOfMonth::dayOfMonth(lastDay));
            }
            return LocalDate::date(year, month, day);
        });
    return RESOLVER;
}

const DateResolver& DateResolvers::nextValid() {
    static const DateResolver RESOLVER("next_valid",
        [](const Year& year, const MonthOfYear& month, const DayOfMonth& day) {
            if (day.getValue() > month.lengthInDays(year)) {
                Year nextYear = month == Month::DECEMBER ? year.next() : year;
                return LocalDate::date(nextYear, month.next(), DayOfMonth::dayOfMonth(1));
            }
            return LocalDate::date(year, month, day);
        });
    return RESOLVER;
}

const DateResolver& DateResolvers::strict() {
    // LocalDate::date 对无效组合抛出 InvalidFieldException (DAY_OF_MONTH)
    static const DateResolver RESOLVER("strict",
        [](const Year& year, const MonthOfYear& month, const DayOfMonth& day) {
            return LocalDate::date(year, month, day);
        });
    return RESOLVER;
}

std::optional<DateResolver> DateResolvers::forName(const std::string& name) {
    if (name == previousValid().getName()) {
        return previousValid();
    }
    if (name == nextValid().getName()) {
        return nextValid();
    }
    if (name == strict().getName()) {
        return strict();
    }
    return std::nullopt;
}

} // namespace isocal::calendar

/**
 * @file calendar.h
 * @brief 日历模块统一入口
 */

#pragma once

#include "isocal/calendar/era.h"
#include "isocal/calendar/year.h"
#include "isocal/calendar/month_of_year.h"
#include "isocal/calendar/day_of_month.h"
#include "isocal/calendar/day_of_week.h"
#include "isocal/calendar/day_of_year.h"
#include "isocal/calendar/iso_chronology.h"
#include "isocal/calendar/local_date.h"
#include "isocal/calendar/date_resolver.h"

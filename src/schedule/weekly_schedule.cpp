/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schedule/weekly_schedule.hpp"

#include <qtils/error_throw.hpp>

#include "schedule/schedule_error.hpp"

namespace kairos {

  namespace {
    constexpr int kDaysPerWeek = 7;
    constexpr int kMaxWeeksAhead = 3;
  }  // namespace

  WeeklySchedule::WeeklySchedule(int weekday, int hour, int minute)
      : weekday_(weekday) {
    if (weekday < 0 or weekday >= kDaysPerWeek) {
      qtils::raise(ScheduleError::InvalidWeekday);
    }
    if (hour < 0 or hour > 23 or minute < 0 or minute > 59) {
      qtils::raise(ScheduleError::InvalidTimeOfDay);
    }
    time_of_day_ =
        boost::posix_time::hours(hour) + boost::posix_time::minutes(minute);
  }

  Time WeeklySchedule::next(const Time &time) const {
    auto day = time.local_time().date();
    int today = day.day_of_week().as_number();
    day += boost::gregorian::days((weekday_ - today + kDaysPerWeek)
                                  % kDaysPerWeek);

    for (int i = 0; i < kMaxWeeksAhead; ++i) {
      auto candidate = atLocalTime(day, time_of_day_, time.zone());
      if (not isAbsent(candidate) and time < candidate) {
        return candidate;
      }
      day += boost::gregorian::days(kDaysPerWeek);
    }
    return absentTime(time.zone());
  }

}  // namespace kairos

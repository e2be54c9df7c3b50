/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "schedule/daily_schedule.hpp"

#include <qtils/error_throw.hpp>

#include "schedule/schedule_error.hpp"

namespace kairos {

  namespace {
    // Covers a skipped wall-clock time on any single day.
    constexpr int kMaxDaysAhead = 3;
  }  // namespace

  DailySchedule::DailySchedule(int hour, int minute) {
    if (hour < 0 or hour > 23 or minute < 0 or minute > 59) {
      qtils::raise(ScheduleError::InvalidTimeOfDay);
    }
    time_of_day_ =
        boost::posix_time::hours(hour) + boost::posix_time::minutes(minute);
  }

  Time DailySchedule::next(const Time &time) const {
    auto day = time.local_time().date();
    for (int i = 0; i < kMaxDaysAhead; ++i) {
      auto candidate = atLocalTime(day, time_of_day_, time.zone());
      if (not isAbsent(candidate) and time < candidate) {
        return candidate;
      }
      day += boost::gregorian::days(1);
    }
    return absentTime(time.zone());
  }

}  // namespace kairos

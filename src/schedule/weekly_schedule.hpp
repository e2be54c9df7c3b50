/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "schedule/schedule.hpp"

namespace kairos {

  /**
   * Runs a job once a week, on `weekday` (0 is Sunday) at hour:minute local
   * time of the zone carried by the time passed to `next`.
   */
  class WeeklySchedule final : public Schedule {
   public:
    /**
     * @throws ScheduleError::InvalidWeekday, ScheduleError::InvalidTimeOfDay
     */
    WeeklySchedule(int weekday, int hour, int minute);

    Time next(const Time &time) const override;

   private:
    int weekday_;
    boost::posix_time::time_duration time_of_day_;
  };

}  // namespace kairos

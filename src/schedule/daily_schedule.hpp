/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "schedule/schedule.hpp"

namespace kairos {

  /**
   * Runs a job once a day at a fixed wall-clock time of the zone carried by
   * the time passed to `next`.
   */
  class DailySchedule final : public Schedule {
   public:
    /**
     * @throws ScheduleError::InvalidTimeOfDay if hour is not in [0, 23] or
     * minute is not in [0, 59]
     */
    DailySchedule(int hour, int minute);

    /**
     * @return the first instant strictly after `time` whose local time is
     * hour:minute:00; days on which that wall-clock time does not exist are
     * skipped
     */
    Time next(const Time &time) const override;

   private:
    boost::posix_time::time_duration time_of_day_;
  };

}  // namespace kairos

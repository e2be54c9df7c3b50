/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/options.hpp"

#include "scheduler/scheduler_error.hpp"

namespace kairos {

  Option withTimeZone(TimeZone zone) {
    return [zone = std::move(zone)](
               SchedulerOptions &options) -> outcome::result<void> {
      if (not zone) {
        return SchedulerError::NullTimeZone;
      }
      options.time_zone = zone;
      return outcome::success();
    };
  }

  Option withLogger(std::shared_ptr<EventLogger> logger) {
    return [logger = std::move(logger)](
               SchedulerOptions &options) -> outcome::result<void> {
      if (not logger) {
        return SchedulerError::NullLogger;
      }
      options.logger = logger;
      return outcome::success();
    };
  }

}  // namespace kairos

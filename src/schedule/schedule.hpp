/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "time/time.hpp"

namespace kairos {

  /**
   * Policy which tells when a job should run next.
   *
   * Implementations must be pure: the result depends only on the argument
   * and on parameters fixed at construction. The scheduler calls `next`
   * from its control loop only.
   */
  class Schedule {
   public:
    virtual ~Schedule() = default;

    /**
     * @param time current instant, in the scheduler's time zone
     * @return next instant to run at, or an absent time for "never"
     */
    [[nodiscard]] virtual Time next(const Time &time) const = 0;
  };

}  // namespace kairos

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "scheduler/job.hpp"
#include "schedule/schedule.hpp"
#include "time/time.hpp"

namespace kairos {

  /// Identity of an entry, unique within one scheduler, never reused
  using EntryId = uint64_t;

  /**
   * Job bound to its schedule, together with the bookkeeping done by the
   * scheduler control loop.
   */
  struct Entry {
    EntryId id = 0;
    std::shared_ptr<Schedule> schedule;
    std::shared_ptr<Job> job;

    /// Next time to run; absent until the control loop schedules the entry
    Time next = absentTime();

    /// Time of the last run; absent until the first run
    Time prev = absentTime();
  };

  /**
   * Strict weak ordering by `next`, where entries with an absent `next` go
   * after every entry with a concrete one.
   */
  bool firesBefore(const Entry &lhs, const Entry &rhs);

  void sortByNextTime(std::vector<Entry> &entries);

}  // namespace kairos

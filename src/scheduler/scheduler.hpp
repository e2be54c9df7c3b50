/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <vector>

#include "scheduler/entry.hpp"
#include "scheduler/job.hpp"
#include "schedule/schedule.hpp"
#include "time/time.hpp"

namespace kairos {

  /**
   * Runs jobs at the times computed by their schedules until stopped.
   *
   * Registration and removal can be done before start and at any time while
   * running, from any thread including jobs themselves.
   */
  class Scheduler {
   public:
    virtual ~Scheduler() = default;

    /**
     * Registers job to run by schedule
     * @return id of the new entry
     * @throws SchedulerError::NullSchedule, SchedulerError::NullJob
     */
    virtual EntryId addJob(std::shared_ptr<Schedule> schedule,
                           std::shared_ptr<Job> job) = 0;

    /// Same as addJob with the function wrapped into FuncJob
    virtual EntryId addFunc(std::shared_ptr<Schedule> schedule,
                            std::function<void()> func) = 0;

    /// Removes entry by id. Unknown id is silently ignored.
    virtual void remove(EntryId id) = 0;

    /// Snapshot of entries ordered by next run time
    [[nodiscard]] virtual std::vector<Entry> entries() = 0;

    /// Starts the control loop in a background thread. No-op if running.
    virtual void start() = 0;

    /// Runs the control loop in the calling thread until stopped.
    virtual void run() = 0;

    /**
     * Stops the control loop if it is running. Jobs already running are not
     * interrupted.
     * @return future which becomes ready when all launched jobs finish
     */
    virtual std::shared_future<void> stop() = 0;

    [[nodiscard]] virtual bool isRunning() const = 0;

    [[nodiscard]] virtual const TimeZone &timeZone() const = 0;
  };

}  // namespace kairos

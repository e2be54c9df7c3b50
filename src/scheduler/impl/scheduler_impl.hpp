/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>

#include "scheduler/options.hpp"
#include "scheduler/scheduler.hpp"
#include "utils/wait_group.hpp"

namespace kairos {

  /**
   * Scheduler driven by a single control loop.
   *
   * The loop is the only owner of the entry collection once started. Other
   * threads never touch the collection: they hand requests over to the loop
   * and wait until the loop takes them. Before start, and after stop, the
   * collection is accessed directly under `running_mutex_`.
   */
  class SchedulerImpl final : public Scheduler {
   public:
    /**
     * @throws the error of the first option which can't be applied
     */
    explicit SchedulerImpl(const std::vector<Option> &options = {});

    SchedulerImpl(const SchedulerImpl &) = delete;
    SchedulerImpl &operator=(const SchedulerImpl &) = delete;

    ~SchedulerImpl() override;

    EntryId addJob(std::shared_ptr<Schedule> schedule,
                   std::shared_ptr<Job> job) override;

    EntryId addFunc(std::shared_ptr<Schedule> schedule,
                    std::function<void()> func) override;

    void remove(EntryId id) override;

    std::vector<Entry> entries() override;

    void start() override;

    void run() override;

    std::shared_future<void> stop() override;

    bool isRunning() const override;

    const TimeZone &timeZone() const override {
      return options_.time_zone;
    }

   private:
    struct AddRequest {
      Entry entry;
    };
    struct RemoveRequest {
      EntryId id;
    };
    struct SnapshotRequest {
      std::shared_ptr<std::promise<std::vector<Entry>>> result;
    };
    struct StopRequest {};

    using Request =
        std::variant<AddRequest, RemoveRequest, SnapshotRequest, StopRequest>;

    /// Marks scheduler as running; false if it must not run (again)
    bool markRunning();

    /// Hands request over to the loop; returns when the loop has taken it
    void send(Request request);

    /**
     * Waits for the next request
     * @param timeout how long to wait; nullopt for no deadline
     * @return request, or nullopt if timeout expired first
     */
    std::optional<Request> receive(
        std::optional<std::chrono::microseconds> timeout);

    void loop();

    void fireDueEntries(const Time &now);

    /// Next run time of entry; absent if its schedule fails
    Time nextTime(const Entry &entry, const Time &now) const;

    void startJob(EntryId id, std::shared_ptr<Job> job);

    void removeEntry(EntryId id);

    std::vector<Entry> snapshot() const;

    Time currentTime() const;

    SchedulerOptions options_;
    std::shared_ptr<utils::WaitGroup> job_waiter_;

    std::vector<Entry> entries_;
    EntryId last_id_ = 0;

    mutable std::mutex running_mutex_;
    bool running_ = false;
    bool stopped_ = false;
    std::thread loop_thread_;

    std::mutex requests_mutex_;
    std::condition_variable requests_cv_;
    std::deque<Request> requests_;
    uint64_t sent_ = 0;
    uint64_t taken_ = 0;
  };

}  // namespace kairos

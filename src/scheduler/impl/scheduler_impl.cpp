/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/scheduler_impl.hpp"

#include <system_error>

#include <fmt/format.h>
#include <qtils/error_throw.hpp>
#include <qtils/final_action.hpp>
#include <soralog/util.hpp>

#include "scheduler/scheduler_error.hpp"

namespace kairos {

  SchedulerImpl::SchedulerImpl(const std::vector<Option> &options)
      : job_waiter_(std::make_shared<utils::WaitGroup>()) {
    for (auto &option : options) {
      if (auto res = option(options_); res.has_error()) {
        qtils::raise(res.error());
      }
    }
  }

  SchedulerImpl::~SchedulerImpl() {
    stop();
    if (loop_thread_.joinable()) {
      loop_thread_.join();
    }
  }

  EntryId SchedulerImpl::addJob(std::shared_ptr<Schedule> schedule,
                                std::shared_ptr<Job> job) {
    if (not schedule) {
      qtils::raise(SchedulerError::NullSchedule);
    }
    if (not job) {
      qtils::raise(SchedulerError::NullJob);
    }

    std::lock_guard lock(running_mutex_);
    Entry entry{
        .id = ++last_id_,
        .schedule = std::move(schedule),
        .job = std::move(job),
    };
    auto id = entry.id;
    if (running_) {
      send(AddRequest{std::move(entry)});
    } else {
      entries_.emplace_back(std::move(entry));
    }
    return id;
  }

  EntryId SchedulerImpl::addFunc(std::shared_ptr<Schedule> schedule,
                                 std::function<void()> func) {
    if (not func) {
      qtils::raise(SchedulerError::NullJob);
    }
    return addJob(std::move(schedule),
                  std::make_shared<FuncJob>(std::move(func)));
  }

  void SchedulerImpl::remove(EntryId id) {
    std::lock_guard lock(running_mutex_);
    if (running_) {
      send(RemoveRequest{id});
    } else {
      removeEntry(id);
    }
  }

  std::vector<Entry> SchedulerImpl::entries() {
    std::unique_lock lock(running_mutex_);
    if (not running_) {
      return snapshot();
    }
    auto result = std::make_shared<std::promise<std::vector<Entry>>>();
    auto future = result->get_future();
    send(SnapshotRequest{std::move(result)});
    lock.unlock();
    return future.get();
  }

  bool SchedulerImpl::markRunning() {
    if (running_) {
      return false;
    }
    if (stopped_) {
      options_.logger->error("restart after stop is not supported", {});
      return false;
    }
    running_ = true;
    return true;
  }

  void SchedulerImpl::start() {
    std::lock_guard lock(running_mutex_);
    if (not markRunning()) {
      return;
    }
    loop_thread_ = std::thread([this] {
      soralog::util::setThreadName("scheduler");
      loop();
    });
  }

  void SchedulerImpl::run() {
    {
      std::lock_guard lock(running_mutex_);
      if (not markRunning()) {
        return;
      }
    }
    loop();
  }

  std::shared_future<void> SchedulerImpl::stop() {
    std::lock_guard lock(running_mutex_);
    if (running_) {
      send(StopRequest{});
      running_ = false;
      stopped_ = true;
    }
    return job_waiter_->whenIdle();
  }

  bool SchedulerImpl::isRunning() const {
    std::lock_guard lock(running_mutex_);
    return running_;
  }

  void SchedulerImpl::send(Request request) {
    std::unique_lock lock(requests_mutex_);
    requests_.emplace_back(std::move(request));
    auto ticket = ++sent_;
    requests_cv_.notify_all();
    requests_cv_.wait(lock, [&] { return taken_ >= ticket; });
  }

  std::optional<SchedulerImpl::Request> SchedulerImpl::receive(
      std::optional<std::chrono::microseconds> timeout) {
    std::unique_lock lock(requests_mutex_);
    auto has_request = [&] { return not requests_.empty(); };
    if (timeout.has_value()) {
      if (not requests_cv_.wait_for(lock, *timeout, has_request)) {
        return std::nullopt;
      }
    } else {
      requests_cv_.wait(lock, has_request);
    }
    auto request = std::move(requests_.front());
    requests_.pop_front();
    ++taken_;
    requests_cv_.notify_all();
    return request;
  }

  void SchedulerImpl::loop() {
    auto &logger = *options_.logger;

    auto now = currentTime();
    for (auto &entry : entries_) {
      entry.next = nextTime(entry, now);
      logger.info("schedule",
                  {field("now", now),
                   field("entry", entry.id),
                   field("next", entry.next)});
    }

    while (true) {
      sortByNextTime(entries_);

      // no deadline at all if nothing is scheduled
      std::optional<std::chrono::microseconds> timeout;
      if (not entries_.empty() and not isAbsent(entries_.front().next)) {
        timeout = toDuration(currentTime(), entries_.front().next);
      }

      auto request = receive(timeout);

      if (not request.has_value()) {
        fireDueEntries(currentTime());
        continue;
      }

      if (auto *add = std::get_if<AddRequest>(&request.value())) {
        now = currentTime();
        auto &entry = entries_.emplace_back(std::move(add->entry));
        entry.next = nextTime(entry, now);
        logger.info("added",
                    {field("now", now),
                     field("entry", entry.id),
                     field("next", entry.next)});
        continue;
      }

      if (auto *remove = std::get_if<RemoveRequest>(&request.value())) {
        removeEntry(remove->id);
        logger.info("removed", {field("entry", remove->id)});
        continue;
      }

      if (auto *query = std::get_if<SnapshotRequest>(&request.value())) {
        query->result->set_value(snapshot());
        continue;
      }

      logger.info("stop", {});
      return;
    }
  }

  void SchedulerImpl::fireDueEntries(const Time &now) {
    auto &logger = *options_.logger;
    logger.info("wake", {field("now", now)});

    // entries are sorted, so the first one not due ends the walk
    for (auto &entry : entries_) {
      if (isAbsent(entry.next) or now < entry.next) {
        break;
      }
      startJob(entry.id, entry.job);
      entry.prev = entry.next;
      entry.next = nextTime(entry, now);
      logger.info("run",
                  {field("now", now),
                   field("entry", entry.id),
                   field("next", entry.next)});
    }
  }

  Time SchedulerImpl::nextTime(const Entry &entry, const Time &now) const {
    try {
      return entry.schedule->next(now);
    } catch (const std::exception &e) {
      options_.logger->error(
          "schedule failed",
          {field("entry", entry.id), field("error", e.what())});
    }
    return absentTime(options_.time_zone);
  }

  void SchedulerImpl::startJob(EntryId id, std::shared_ptr<Job> job) {
    job_waiter_->add();
    try {
      std::thread([id,
                   job = std::move(job),
                   waiter = job_waiter_,
                   logger = options_.logger] {
        qtils::FinalAction release([&] { waiter->done(); });
        soralog::util::setThreadName(fmt::format("job.{}", id));
        try {
          job->run();
        } catch (const std::exception &e) {
          logger->error("job panic recovered",
                        {field("entry", id), field("error", e.what())});
        } catch (...) {
          logger->error(
              "job panic recovered",
              {field("entry", id), field("error", "unknown exception")});
        }
      }).detach();
    } catch (const std::system_error &e) {
      job_waiter_->done();
      options_.logger->error("job launch failed",
                             {field("entry", id), field("error", e.what())});
    }
  }

  void SchedulerImpl::removeEntry(EntryId id) {
    std::erase_if(entries_,
                  [id](const Entry &entry) { return entry.id == id; });
  }

  std::vector<Entry> SchedulerImpl::snapshot() const {
    auto copy = entries_;
    sortByNextTime(copy);
    return copy;
  }

  Time SchedulerImpl::currentTime() const {
    return kairos::now(options_.time_zone);
  }

}  // namespace kairos

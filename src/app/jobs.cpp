/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/jobs.hpp"

#include "schedule/daily_schedule.hpp"
#include "schedule/delay_schedule.hpp"
#include "schedule/weekly_schedule.hpp"

namespace kairos::app {

  MessageJob::MessageJob(log::Logger logger,
                         std::string name,
                         std::string message)
      : logger_(std::move(logger)),
        name_(std::move(name)),
        message_(std::move(message)) {}

  void MessageJob::run() {
    if (message_.empty()) {
      SL_INFO(logger_, "Job '{}' fired", name_);
      return;
    }
    SL_INFO(logger_, "Job '{}': {}", name_, message_);
  }

  std::shared_ptr<Schedule> makeSchedule(const Configuration::When &when) {
    if (auto periodic = std::get_if<Configuration::Every>(&when)) {
      return every(periodic->delay);
    }
    if (auto daily = std::get_if<Configuration::Daily>(&when)) {
      return std::make_shared<DailySchedule>(daily->hour, daily->minute);
    }
    auto &weekly = std::get<Configuration::Weekly>(when);
    return std::make_shared<WeeklySchedule>(
        weekly.weekday, weekly.hour, weekly.minute);
  }

}  // namespace kairos::app

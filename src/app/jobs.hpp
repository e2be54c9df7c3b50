/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include "app/configuration.hpp"
#include "log/logger.hpp"
#include "schedule/schedule.hpp"
#include "scheduler/job.hpp"

namespace kairos::app {

  /// Writes the configured message to the "jobs" log group when run
  class MessageJob final : public Job {
   public:
    MessageJob(log::Logger logger, std::string name, std::string message);

    void run() override;

    const std::string &name() const {
      return name_;
    }

   private:
    log::Logger logger_;
    std::string name_;
    std::string message_;
  };

  std::shared_ptr<Schedule> makeSchedule(const Configuration::When &when);

}  // namespace kairos::app

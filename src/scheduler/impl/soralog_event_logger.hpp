/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "scheduler/event_logger.hpp"

namespace kairos {

  /**
   * Writes scheduler events to the soralog logger "Scheduler" of group
   * "scheduler" as `<message> key=value ...`.
   */
  class SoralogEventLogger final : public EventLogger {
   public:
    explicit SoralogEventLogger(qtils::SharedRef<log::LoggingSystem> logsys);

    void info(std::string_view message, const EventFields &fields) override;

    void error(std::string_view message, const EventFields &fields) override;

    static std::string render(std::string_view message,
                              const EventFields &fields);

   private:
    log::Logger logger_;
  };

}  // namespace kairos

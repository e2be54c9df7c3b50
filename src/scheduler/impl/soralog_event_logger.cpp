/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scheduler/impl/soralog_event_logger.hpp"

#include <iterator>

namespace kairos {

  SoralogEventLogger::SoralogEventLogger(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_(logsys->getLogger("Scheduler", "scheduler")) {}

  void SoralogEventLogger::info(std::string_view message,
                                const EventFields &fields) {
    SL_INFO(logger_, "{}", render(message, fields));
  }

  void SoralogEventLogger::error(std::string_view message,
                                 const EventFields &fields) {
    SL_ERROR(logger_, "{}", render(message, fields));
  }

  std::string SoralogEventLogger::render(std::string_view message,
                                         const EventFields &fields) {
    std::string line(message);
    for (auto &[key, value] : fields) {
      fmt::format_to(std::back_inserter(line), " {}={}", key, value);
    }
    return line;
  }

}  // namespace kairos

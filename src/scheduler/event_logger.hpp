/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "log/formatters/time.hpp"

namespace kairos {

  struct EventField {
    std::string key;
    std::string value;

    bool operator==(const EventField &) const = default;
  };

  using EventFields = std::vector<EventField>;

  template <typename T>
  EventField field(std::string key, const T &value) {
    return {std::move(key), fmt::format("{}", value)};
  }

  /**
   * Sink for scheduler events. Calls come from the control loop and from
   * job threads concurrently; implementations must be thread-safe and must
   * not block for long.
   */
  class EventLogger {
   public:
    virtual ~EventLogger() = default;

    virtual void info(std::string_view message, const EventFields &fields) = 0;

    virtual void error(std::string_view message,
                       const EventFields &fields) = 0;
  };

  /// Drops every event. Used when no logger is configured.
  class DiscardEventLogger final : public EventLogger {
   public:
    void info(std::string_view, const EventFields &) override {}
    void error(std::string_view, const EventFields &) override {}
  };

}  // namespace kairos

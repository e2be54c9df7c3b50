/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>
#include <variant>
#include <vector>

#include "time/time.hpp"

namespace kairos::app {

  class Configuration {
   public:
    /// Fires every `delay`
    struct Every {
      std::chrono::milliseconds delay;
    };

    /// Fires daily at hour:minute local time
    struct Daily {
      int hour;
      int minute;
    };

    /// Fires on weekday (0 is Sunday) at hour:minute local time
    struct Weekly {
      int weekday;
      int hour;
      int minute;
    };

    using When = std::variant<Every, Daily, Weekly>;

    struct JobConfig {
      std::string name;
      std::string message;
      When when;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const TimeZone &timeZone() const;
    [[nodiscard]] virtual const std::vector<JobConfig> &jobs() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    TimeZone time_zone_;
    std::vector<JobConfig> jobs_;
  };

}  // namespace kairos::app

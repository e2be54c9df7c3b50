/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <yaml-cpp/yaml.h>

#include "log/logger.hpp"

namespace kairos::app {
  class Configuration;
}  // namespace kairos::app

namespace kairos::app {

  /**
   * Builds daemon configuration from command line and optional YAML file.
   *
   * Usage order is fixed: step1 (help, version, config file), step2 (all
   * the rest of CLI), getLoggingConfig, calculateConfig.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed = 1,
      ConfigFileParseFailed,
      InvalidValue,
    };

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv);

    /// Parse CLI args for help, version and config
    /// @return true if the program has nothing more to do
    outcome::result<bool> step1();

    /// Parse remaining CLI args
    outcome::result<bool> step2();

    outcome::result<YAML::Node> getLoggingConfig();

    std::vector<std::string> getLoggingCliArgs() {
      return logger_cli_args_;
    }

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        log::Logger logger);

   private:
    void initGeneralConfig();
    void initJobsConfig();
    outcome::result<void> reportFileErrors();
    outcome::result<void> applyCliArgs();

    int argc_;
    const char **argv_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace kairos::app

OUTCOME_HPP_DECLARE_ERROR(kairos::app, Configurator::Error);

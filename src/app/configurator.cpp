/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <set>
#include <string_view>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options/value_semantic.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(kairos::app, Configurator::Error, e) {
  using E = kairos::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown app::Configurator::Error";
}

namespace {
  // A century, within both std::chrono::microseconds and Boost.DateTime range
  constexpr int64_t kMaxEveryMillis = int64_t{100} * 365 * 24 * 3600 * 1000;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  kairos::outcome::result<kairos::TimeZone> zoneByName(
      const std::string &name) {
    if (name == "local") {
      return kairos::localZone();
    }
    if (name == "utc" or name == "UTC") {
      return kairos::utcZone();
    }
    return kairos::parseTimeZone(name);
  }

  /// Parses "HH:MM" into hour and minute
  std::optional<std::pair<int, int>> parseTimeOfDay(std::string_view str) {
    auto colon = str.find(':');
    if (colon == std::string_view::npos) {
      return std::nullopt;
    }
    auto parse = [](std::string_view part) -> std::optional<int> {
      int value = 0;
      auto [ptr, ec] =
          std::from_chars(part.data(), part.data() + part.size(), value);
      if (ec != std::errc{} or ptr != part.data() + part.size()
          or part.empty()) {
        return std::nullopt;
      }
      return value;
    };
    auto hour = parse(str.substr(0, colon));
    auto minute = parse(str.substr(colon + 1));
    if (not hour or not minute) {
      return std::nullopt;
    }
    if (*hour < 0 or *hour > 23 or *minute < 0 or *minute > 59) {
      return std::nullopt;
    }
    return std::make_pair(*hour, *minute);
  }

  /// Accepts 0..6 (0 is Sunday), full english names and 3-letter prefixes
  std::optional<int> parseWeekday(std::string str) {
    static const std::array<std::string_view, 7> names{
        "sunday",
        "monday",
        "tuesday",
        "wednesday",
        "thursday",
        "friday",
        "saturday",
    };
    boost::trim(str);
    boost::to_lower(str);
    if (str.size() == 1 and str[0] >= '0' and str[0] <= '6') {
      return str[0] - '0';
    }
    for (size_t i = 0; i < names.size(); ++i) {
      if (str == names[i] or (str.size() == 3 and names[i].starts_with(str))) {
        return static_cast<int>(i);
      }
    }
    return std::nullopt;
  }

}  // namespace

namespace kairos::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(), "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("timezone", po::value<std::string>(), "Time zone of schedules: `local`, `utc` or POSIX zone string, e.g. \"CET+01CEST,M3.5.0/02:00,M10.5.0/03:00\".")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <group>=<level>, e.g., -lscheduler=off.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all groups log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    // clang-format on

    cli_options_.add(general_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Kairos version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Kairos version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: kairos
        children:
          - name: application
          - name: scheduler
          - name: jobs
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        std::cerr << "Error: Failed to load default logging config: "
                  << e.what() << '\n';
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      log::Logger logger) {
    logger_ = std::move(logger);

    initGeneralConfig();
    initJobsConfig();
    OUTCOME_TRY(reportFileErrors());
    OUTCOME_TRY(applyCliArgs());

    if (config_->jobs_.empty()) {
      SL_WARN(logger_, "No jobs are configured; scheduler will idle");
    }

    return config_;
  }

  void Configurator::initGeneralConfig() {
    if (not config_file_.has_value()) {
      return;
    }
    auto section = (*config_file_)["general"];
    if (not section.IsDefined()) {
      return;
    }
    if (not section.IsMap()) {
      file_errors_ << "E: Section 'general' defined, but is not map\n";
      file_has_error_ = true;
      return;
    }

    auto timezone = section["timezone"];
    if (timezone.IsDefined()) {
      if (timezone.IsScalar()) {
        auto value = timezone.as<std::string>();
        boost::trim(value);
        if (auto zone = zoneByName(value); zone.has_value()) {
          config_->time_zone_ = zone.value();
        } else {
          file_errors_ << "E: Value 'general.timezone' is not a time zone: "
                       << value << "\n";
          file_has_error_ = true;
        }
      } else {
        file_errors_ << "E: Value 'general.timezone' must be scalar\n";
        file_has_error_ = true;
      }
    }
  }

  void Configurator::initJobsConfig() {
    if (not config_file_.has_value()) {
      return;
    }
    auto section = (*config_file_)["jobs"];
    if (not section.IsDefined()) {
      return;
    }
    if (not section.IsSequence()) {
      file_errors_ << "E: Section 'jobs' defined, but is not sequence\n";
      file_has_error_ = true;
      return;
    }

    std::set<std::string> names;
    size_t index = 0;
    for (const auto &node : section) {
      auto path = "jobs[" + std::to_string(index++) + "]";

      if (not node.IsMap()) {
        file_errors_ << "E: Value '" << path << "' must be map\n";
        file_has_error_ = true;
        continue;
      }

      Configuration::JobConfig job;

      auto name = node["name"];
      if (name.IsDefined() and name.IsScalar()) {
        job.name = name.as<std::string>();
      } else {
        file_errors_ << "E: Value '" << path << ".name' must be scalar\n";
        file_has_error_ = true;
        continue;
      }
      path = "jobs." + job.name;

      if (not names.emplace(job.name).second) {
        file_errors_ << "E: Job name '" << job.name << "' is duplicated\n";
        file_has_error_ = true;
        continue;
      }

      auto message = node["message"];
      if (message.IsDefined()) {
        if (message.IsScalar()) {
          job.message = message.as<std::string>();
        } else {
          file_errors_ << "E: Value '" << path << ".message' must be scalar\n";
          file_has_error_ = true;
          continue;
        }
      }

      auto every = node["every"];
      auto daily = node["daily"];
      auto weekly = node["weekly"];

      if (every.IsDefined() + daily.IsDefined() + weekly.IsDefined() != 1) {
        file_errors_ << "E: Value '" << path
                     << "' must have exactly one of 'every', 'daily', "
                        "'weekly'\n";
        file_has_error_ = true;
        continue;
      }

      if (every.IsDefined()) {
        int64_t millis = 0;
        try {
          millis = every.as<int64_t>();
        } catch (const YAML::Exception &) {
          millis = 0;
        }
        if (millis <= 0 or millis > kMaxEveryMillis) {
          file_errors_ << "E: Value '" << path
                       << ".every' must be positive number of milliseconds\n";
          file_has_error_ = true;
          continue;
        }
        job.when = Configuration::Every{std::chrono::milliseconds(millis)};
      }

      else if (daily.IsDefined()) {
        auto at = daily.IsScalar() ? parseTimeOfDay(daily.as<std::string>())
                                   : std::nullopt;
        if (not at) {
          file_errors_ << "E: Value '" << path
                       << ".daily' must be time as \"HH:MM\"\n";
          file_has_error_ = true;
          continue;
        }
        job.when = Configuration::Daily{at->first, at->second};
      }

      else {
        if (not weekly.IsMap()) {
          file_errors_ << "E: Value '" << path << ".weekly' must be map\n";
          file_has_error_ = true;
          continue;
        }
        auto weekday_node = weekly["weekday"];
        auto weekday = weekday_node.IsDefined() and weekday_node.IsScalar()
                         ? parseWeekday(weekday_node.as<std::string>())
                         : std::nullopt;
        if (not weekday) {
          file_errors_ << "E: Value '" << path
                       << ".weekly.weekday' must be 0..6 or name of day\n";
          file_has_error_ = true;
          continue;
        }
        auto at_node = weekly["at"];
        auto at = at_node.IsDefined() and at_node.IsScalar()
                    ? parseTimeOfDay(at_node.as<std::string>())
                    : std::nullopt;
        if (not at) {
          file_errors_ << "E: Value '" << path
                       << ".weekly.at' must be time as \"HH:MM\"\n";
          file_has_error_ = true;
          continue;
        }
        job.when = Configuration::Weekly{*weekday, at->first, at->second};
      }

      config_->jobs_.emplace_back(std::move(job));
    }
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::applyCliArgs() {
    bool fail = false;
    find_argument<std::string>(
        cli_values_map_, "timezone", [&](const std::string &value) {
          if (auto zone = zoneByName(value); zone.has_value()) {
            config_->time_zone_ = zone.value();
          } else {
            SL_ERROR(logger_,
                     "Invalid value of CLI argument 'timezone': {}",
                     value);
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }
    return outcome::success();
  }

}  // namespace kairos::app

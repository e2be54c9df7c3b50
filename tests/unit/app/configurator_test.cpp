/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "testutil/prepare_loggers.hpp"

using kairos::app::Configuration;
using kairos::app::Configurator;

namespace {
  /// YAML file which lives as long as the object
  class TempConfigFile {
   public:
    explicit TempConfigFile(const std::string &content) {
      auto *info = testing::UnitTest::GetInstance()->current_test_info();
      path_ = std::filesystem::temp_directory_path()
            / (std::string("kairos_") + info->name() + ".yaml");
      std::ofstream(path_) << content;
    }

    ~TempConfigFile() {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }

    std::string path() const {
      return path_.string();
    }

   private:
    std::filesystem::path path_;
  };
}  // namespace

class ConfiguratorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  /// Runs all configurator steps as the daemon does
  kairos::outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args) {
    args.insert(args.begin(), "kairos");
    argv_.clear();
    for (auto &arg : args) {
      argv_.push_back(arg.c_str());
    }
    args_ = std::move(args);

    configurator_ = std::make_unique<Configurator>(
        static_cast<int>(argv_.size()), argv_.data());

    OUTCOME_TRY(done1, configurator_->step1());
    EXPECT_FALSE(done1);
    OUTCOME_TRY(done2, configurator_->step2());
    EXPECT_FALSE(done2);

    auto logger =
        testutil::prepareLoggers()->getLogger("Configurator", "testing");
    return configurator_->calculateConfig(logger);
  }

  std::vector<std::string> args_;
  std::vector<const char *> argv_;
  std::unique_ptr<Configurator> configurator_;
};

/**
 * @given arguments asking for help or version
 * @when run the first step
 * @then configurator reports there is nothing more to do
 */
TEST_F(ConfiguratorTest, HelpAndVersion) {
  for (const char *flag : {"--help", "-h", "--version", "-v"}) {
    const char *argv[] = {"kairos", flag};
    Configurator configurator(2, argv);
    ASSERT_OUTCOME_SUCCESS(done, configurator.step1());
    EXPECT_TRUE(done) << flag;
  }
}

TEST_F(ConfiguratorTest, UnknownOption) {
  const char *argv[] = {"kairos", "--no-such-option"};
  Configurator configurator(2, argv);
  ASSERT_OUTCOME_SUCCESS(done, configurator.step1());
  EXPECT_FALSE(done);

  auto res = configurator.step2();
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            make_error_code(Configurator::Error::CliArgsParseFailed));
}

TEST_F(ConfiguratorTest, MissingConfigFile) {
  const char *argv[] = {"kairos", "-c", "/nonexistent/kairos.yaml"};
  Configurator configurator(3, argv);
  auto res = configurator.step1();
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            make_error_code(Configurator::Error::ConfigFileParseFailed));
}

TEST_F(ConfiguratorTest, NoConfigFile) {
  ASSERT_OUTCOME_SUCCESS(config, configure({}));
  EXPECT_TRUE(config->jobs().empty());
  ASSERT_TRUE(config->timeZone());
  EXPECT_FALSE(config->version().empty());
}

/**
 * @given config file with every kind of job
 * @when calculate config
 * @then jobs and time zone are taken from the file
 */
TEST_F(ConfiguratorTest, JobsFromFile) {
  TempConfigFile file(R"(
general:
  timezone: utc
jobs:
  - name: heartbeat
    message: still alive
    every: 1500
  - name: report
    daily: "07:30"
  - name: backup
    message: weekly backup
    weekly:
      weekday: sat
      at: "23:05"
  - name: cleanup
    weekly:
      weekday: 1
      at: "00:00"
)");

  ASSERT_OUTCOME_SUCCESS(config, configure({"-c", file.path()}));
  EXPECT_EQ(config->timeZone(), kairos::utcZone());

  auto &jobs = config->jobs();
  ASSERT_EQ(jobs.size(), 4);

  EXPECT_EQ(jobs[0].name, "heartbeat");
  EXPECT_EQ(jobs[0].message, "still alive");
  auto *every = std::get_if<Configuration::Every>(&jobs[0].when);
  ASSERT_NE(every, nullptr);
  EXPECT_EQ(every->delay, std::chrono::milliseconds(1500));

  EXPECT_EQ(jobs[1].name, "report");
  EXPECT_TRUE(jobs[1].message.empty());
  auto *daily = std::get_if<Configuration::Daily>(&jobs[1].when);
  ASSERT_NE(daily, nullptr);
  EXPECT_EQ(daily->hour, 7);
  EXPECT_EQ(daily->minute, 30);

  auto *weekly = std::get_if<Configuration::Weekly>(&jobs[2].when);
  ASSERT_NE(weekly, nullptr);
  EXPECT_EQ(weekly->weekday, 6);
  EXPECT_EQ(weekly->hour, 23);
  EXPECT_EQ(weekly->minute, 5);

  weekly = std::get_if<Configuration::Weekly>(&jobs[3].when);
  ASSERT_NE(weekly, nullptr);
  EXPECT_EQ(weekly->weekday, 1);
}

TEST_F(ConfiguratorTest, PosixTimeZoneFromFile) {
  TempConfigFile file(R"(
general:
  timezone: "CET-01CEST,M3.5.0/02:00,M10.5.0/03:00"
)");

  ASSERT_OUTCOME_SUCCESS(config, configure({"-c", file.path()}));
  EXPECT_EQ(config->timeZone()->std_zone_abbrev(), "CET");
  EXPECT_TRUE(config->timeZone()->has_dst());
}

/**
 * @given config file with several broken jobs
 * @when calculate config
 * @then all problems are collected and config is rejected
 */
TEST_F(ConfiguratorTest, InvalidJobs) {
  TempConfigFile file(R"(
jobs:
  - name: no-schedule
  - name: two-schedules
    every: 10
    daily: "10:00"
  - name: negative
    every: -5
  - name: bad-time
    daily: "25:00"
  - name: bad-weekday
    weekly:
      weekday: someday
      at: "10:00"
  - name: negative
    every: 10
  - just a string
)");

  auto res = configure({"-c", file.path()});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            make_error_code(Configurator::Error::ConfigFileParseFailed));
}

/**
 * @given job with period too long to be represented in microseconds
 * @when calculate config
 * @then config is rejected
 */
TEST_F(ConfiguratorTest, HugeEveryIsRejected) {
  TempConfigFile file(R"(
jobs:
  - name: forever
    every: 9223372036854776
)");

  auto res = configure({"-c", file.path()});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            make_error_code(Configurator::Error::ConfigFileParseFailed));
}

TEST_F(ConfiguratorTest, LongEveryIsAccepted) {
  TempConfigFile file(R"(
jobs:
  - name: yearly
    every: 31536000000
)");

  ASSERT_OUTCOME_SUCCESS(config, configure({"-c", file.path()}));
  ASSERT_EQ(config->jobs().size(), 1);
  auto *every = std::get_if<Configuration::Every>(&config->jobs()[0].when);
  ASSERT_NE(every, nullptr);
  EXPECT_EQ(every->delay, std::chrono::hours(24 * 365));
}

TEST_F(ConfiguratorTest, InvalidTimeZoneInFile) {
  TempConfigFile file(R"(
general:
  timezone: nowhere
)");

  auto res = configure({"-c", file.path()});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            make_error_code(Configurator::Error::ConfigFileParseFailed));
}

TEST_F(ConfiguratorTest, CliTimeZoneOverridesFile) {
  TempConfigFile file(R"(
general:
  timezone: local
)");

  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"-c", file.path(), "--timezone", "utc"}));
  EXPECT_EQ(config->timeZone(), kairos::utcZone());
}

TEST_F(ConfiguratorTest, InvalidCliTimeZone) {
  auto res = configure({"--timezone", "nowhere"});
  ASSERT_TRUE(res.has_error());
  EXPECT_EQ(res.error(),
            make_error_code(Configurator::Error::CliArgsParseFailed));
}

/**
 * @given config file with and without logging section
 * @when get logging config
 * @then the section is used when present and the default one otherwise
 */
TEST_F(ConfiguratorTest, LoggingConfig) {
  {
    const char *argv[] = {"kairos"};
    Configurator configurator(1, argv);
    ASSERT_TRUE(configurator.step1().has_value());
    ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
    EXPECT_TRUE(logging["sinks"].IsSequence());
    EXPECT_TRUE(logging["groups"].IsSequence());
  }
  {
    TempConfigFile file(R"(
logging:
  sinks:
    - name: custom
      type: console
  groups:
    - name: main
      sink: custom
)");
    auto path = file.path();
    const char *argv[] = {"kairos", "-c", path.c_str()};
    Configurator configurator(3, argv);
    ASSERT_TRUE(configurator.step1().has_value());
    ASSERT_OUTCOME_SUCCESS(logging, configurator.getLoggingConfig());
    EXPECT_EQ(logging["sinks"][0]["name"].as<std::string>(), "custom");
  }
}

TEST_F(ConfiguratorTest, LoggingCliArgs) {
  const char *argv[] = {"kairos", "-l", "scheduler=debug", "--log", "warn"};
  Configurator configurator(5, argv);
  ASSERT_TRUE(configurator.step1().has_value());
  ASSERT_TRUE(configurator.step2().has_value());
  EXPECT_EQ(configurator.getLoggingCliArgs(),
            (std::vector<std::string>{"scheduler=debug", "warn"}));
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>
#include <qtils/final_action.hpp>
#include <soralog/util.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "app/jobs.hpp"
#include "log/logger.hpp"
#include "scheduler/impl/scheduler_impl.hpp"
#include "scheduler/impl/soralog_event_logger.hpp"

namespace {
  using kairos::app::Configuration;
  using kairos::log::LoggingSystem;

  int run_daemon(qtils::SharedRef<LoggingSystem> logsys,
                 std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("Application", "application");

    std::unique_ptr<kairos::SchedulerImpl> scheduler;
    try {
      scheduler = std::make_unique<kairos::SchedulerImpl>(
          std::vector<kairos::Option>{
              kairos::withTimeZone(appcfg->timeZone()),
              kairos::withLogger(
                  std::make_shared<kairos::SoralogEventLogger>(logsys)),
          });

      auto jobs_logger = logsys->getLogger("Jobs", "jobs");
      for (auto &job : appcfg->jobs()) {
        auto id = scheduler->addJob(
            kairos::app::makeSchedule(job.when),
            std::make_shared<kairos::app::MessageJob>(
                jobs_logger, job.name, job.message));
        SL_INFO(logger, "Job '{}' registered as entry {}", job.name, id);
      }
    } catch (const std::exception &e) {
      SL_CRITICAL(logger, "Failed to set up scheduler: {}", e.what());
      return EXIT_FAILURE;
    }

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int signal) {
      if (not ec) {
        SL_INFO(logger, "Shutdown signal {} received", signal);
      }
    });

    scheduler->start();
    SL_INFO(logger,
            "Kairos started. Version: {}, time zone: {}",
            appcfg->version(),
            appcfg->timeZone()->to_posix_string());

    io_context.run();

    SL_INFO(logger, "Stopping scheduler");
    scheduler->stop().wait();
    scheduler.reset();

    SL_INFO(logger, "Kairos stopped");
    logger->flush();

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("kairos");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc == 0) {
    // Abnormal run
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<kairos::app::Configurator>(argc, argv);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto logsys_res = kairos::log::createLoggingSystem(log_config.value());
    if (logsys_res.has_error()) {
      fmt::print(stderr,
                 "Failed to set up logging: {}\n",
                 logsys_res.error().message());
      return EXIT_FAILURE;
    }

    logsys_res.value();
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "application");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error().message();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::print(stderr, "Failed to calculate config: {}\n", error);
      fmt::print(stderr, "See more details in the log\n");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  return run_daemon(logging_system, app_configuration);
}

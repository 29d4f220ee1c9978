/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <filesystem>
#include <iostream>

#include <soralog/util.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/conductor_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using conductor::application::AppConfigurationImpl;

namespace {
  int run_node(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        conductor::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    conductor::log::tuneLoggingSystem(configuration->logTuning());

    auto app =
        std::make_shared<conductor::application::ConductorApplicationImpl>(
            configuration);

    auto logger =
        conductor::log::createLogger("Main", conductor::log::defaultGroupName);
    SL_INFO(logger, "Conductor started");

    auto exit_code = app->run();

    SL_INFO(logger, "Conductor stopped");
    logger->flush();

    return exit_code;
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  soralog::util::setThreadName("conductor");

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        conductor::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<conductor::log::Configurator>(
                  nullptr, custom_log_config_path.value())
            : std::make_shared<conductor::log::Configurator>(nullptr);

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  conductor::log::setLoggingSystem(logging_system);

  auto exit_code = run_node(argc, argv);

  auto logger =
      conductor::log::createLogger("Main", conductor::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  std::cout.flush();
  std::cerr.flush();
  return exit_code;
}

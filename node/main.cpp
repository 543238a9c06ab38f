/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/slotwatch_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using slotwatch::application::AppConfigurationImpl;
using slotwatch::application::SlotwatchApplicationImpl;

namespace {
  int run_monitor(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        slotwatch::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    auto logger =
        slotwatch::log::createLogger("Main", slotwatch::log::defaultGroupName);

    if (auto res = slotwatch::log::tuneLoggingSystem(configuration->log());
        res.has_error()) {
      SL_CRITICAL(logger, "Can't apply logging filter: {}", res.error());
      return EXIT_FAILURE;
    }

    auto app = std::make_shared<SlotwatchApplicationImpl>(configuration);
    SL_INFO(logger, "Slotwatch started");

    auto exit_code = app->run();

    SL_INFO(logger, "Slotwatch stopped");
    logger->flush();

    return exit_code;
  }
}  // namespace

int main(int argc, const char **argv) {
  setvbuf(stdout, nullptr, _IOLBF, 0);
  setvbuf(stderr, nullptr, _IOLBF, 0);

  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        slotwatch::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto slotwatch_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<slotwatch::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<slotwatch::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(slotwatch_log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  slotwatch::log::setLoggingSystem(logging_system);

  return run_monitor(argc, argv);
}

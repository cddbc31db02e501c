/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <systemc>
#include <utility>
#include <vector>
#include "bench/RegisterFileBench.hpp"
#include "csr/RegisterFileConfig.hpp"
#include "utilities/Config.hpp"
#include "utilities/Stimulus.hpp"
#include "utilities/Utilities.hpp"

using namespace sc_core;

int sc_main(int argc, char *argv[]) {
  // Parse CLI arguments & config file
  auto &config = Config::get();
  config.parseCli(argc, argv);
  config.parseFile();

  RegisterFileConfig regConfig;
  std::vector<StimulusCommand> commands;
  sc_time period;
  try {
    if (config.contains("LogLevel")) {
      spdlog::set_level(Utility::parseLogLevel(config.getString("LogLevel")));
    }
    regConfig = RegisterFileConfig::fromConfig();
    period = RegisterFileBench::clockPeriodFromConfig();
    if (config.contains("StimulusFile")) {
      commands = Stimulus::parseFile(config.getString("StimulusFile"));
    } else {
      spdlog::warn("No stimulus file given, running an idle bench");
    }
  } catch (const std::invalid_argument &e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  }

  RegisterFileBench bench("bench", regConfig, period, std::move(commands));

  spdlog::info("Starting simulation: {} bytes, {}-byte lanes, {} chunks",
               regConfig.numBytes, regConfig.dataWidthBytes,
               regConfig.numChunks());
  sc_start();

  if (!sc_end_of_simulation_invoked()) {
    spdlog::warn("Simulation stopped without explicit sc_stop() at {:s}",
                 sc_time_stamp().to_string());
    sc_stop();
  }

  if (!bench.player.finished()) {
    spdlog::error("Stimulus script did not run to completion");
    return 1;
  }
  const auto failures = bench.player.failures();
  if (failures > 0) {
    spdlog::error("{} expectation(s) failed", failures);
    return 1;
  }
  spdlog::info("Simulation finished at {:s}", sc_time_stamp().to_string());
  return 0;
}

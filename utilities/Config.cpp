/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <stdlib.h>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include "include/regbank.h"
#include "utilities/Config.hpp"
#include "utilities/Utilities.hpp"

void Config::parseCli(int argc, char *argv[]) {
  if (argc == 1) {
    return;
  }

  for (int i = 1; i < argc; i++) {
    const std::string arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      std::cout << "\nusage: regbank [-C config] [-S stimulus] [-L level]\n\n";
      std::cout << "-C, --config \t : path to config file\n";
      std::cout << "-S, --stimulus \t : path to stimulus script\n";
      std::cout << "-L, --log-level : trace, debug, info, warn, error, "
                   "critical or off\n";
      exit(0);
    } else if (i + 1 >= argc) {
      spdlog::error("CLI option \"{}\" requires a value, exiting...", arg);
      exit(1);
    } else if (arg == "-C" || arg == "--config") {
      m_config["ConfigFile"] = std::string(argv[i + 1]);
      spdlog::info("Loading config from file: {:s}", argv[i + 1]);
      i++;
    } else if (arg == "-S" || arg == "--stimulus") {
      m_config["StimulusFile"] = std::string(argv[i + 1]);
      spdlog::info("Replaying stimulus from: {:s}", m_config["StimulusFile"]);
      i++;
    } else if (arg == "-L" || arg == "--log-level") {
      m_config["LogLevel"] = std::string(argv[i + 1]);
      i++;
    } else {
      // Unrecognized option
      spdlog::error("Unrecognized CLI option \"{}\" exiting...", arg);
      exit(1);
    }
  }
}

void Config::parseFile(const std::string &fn) {
  if (fn != "") {
    m_configFileName = fn;
  } else if (m_config.find("ConfigFile") != m_config.end()) {
    m_configFileName = m_config["ConfigFile"];
  } else {
    m_configFileName = REGBANK_DEFAULT_CONFIG;
  }
  Utility::assertFileExists(m_configFileName);
  auto ymlconfig =
      YAML::LoadFile(m_configFileName).as<std::map<std::string, std::string>>();
  m_config.insert(ymlconfig.begin(),
                  ymlconfig.end());  // Note: CLI arguments override yaml-config
}

const std::string &Config::getString(const std::string &key) const {
  auto it = m_config.find(key);
  if (it != m_config.end()) {
    return it->second;
  } else {
    throw std::invalid_argument(key + ": not found in config file " +
                                m_configFileName);
  }
}

unsigned int Config::getUint(const std::string &key) const {
  const auto val = Utility::parseUint(getString(key));
  if (val > std::numeric_limits<unsigned int>::max()) {
    throw std::invalid_argument(key + " is out of range.");
  }
  return static_cast<unsigned int>(val);
}

std::vector<uint64_t> Config::getUintList(const std::string &key,
                                          const uint64_t limit) const {
  try {
    return Utility::parseUintList(getString(key), limit);
  } catch (const std::invalid_argument &e) {
    throw std::invalid_argument(key + ": " + e.what());
  }
}

double Config::getDouble(const std::string &key) const {
  const auto &str = getString(key);
  size_t pos = 0;
  double val;
  try {
    val = std::stod(str, &pos);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(key + ": \"" + str + "\" is not a number");
  }
  if (pos != str.size()) {
    throw std::invalid_argument(key + ": \"" + str + "\" is not a number");
  }
  return val;
}

bool Config::getBool(const std::string &key) const {
  const auto &val = getString(key);
  if (val == "True" || val == "true") {
    return true;
  } else if (val == "False" || val == "false") {
    return false;
  } else {
    throw std::invalid_argument(key + " is not a boolean value.");
  }
}

bool Config::contains(const std::string &key) const {
  return m_config.find(key) != m_config.end();
}

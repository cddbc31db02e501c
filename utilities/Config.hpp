/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdint.h>
#include <map>
#include <string>
#include <vector>

/**
 * @brief The Config class Process-wide store of the simulator settings.
 * Values are kept as strings, keyed by their YAML name, and converted by the
 * typed getters. Every getter throws std::invalid_argument when the key is
 * missing or its value does not convert.
 */
class Config {
 public:
  static Config &get() {
    static Config instance;
    return instance;
  }

  /**
   * @brief parseFile Merge a flat YAML map into the store. Keys already set
   * on the command line keep their value.
   * @param fn YAML file. Falls back to the -C argument, then to
   * REGBANK_DEFAULT_CONFIG.
   */
  void parseFile(const std::string &fn = "");

  /**
   * @brief parseCli Handle -C, -S, -L and -h. Exits on unknown options or a
   * missing option value.
   */
  void parseCli(int argc, char *argv[]);

  //! Raw value of key
  const std::string &getString(const std::string &key) const;

  /**
   * @brief getUint Decimal or 0x-prefixed value that fits an unsigned int.
   */
  unsigned int getUint(const std::string &key) const;

  /**
   * @brief getUintList Comma-separated values and ranges, e.g. "0,1,4-7".
   * @param limit every value must be below limit, unbounded if 0
   */
  std::vector<uint64_t> getUintList(const std::string &key,
                                    const uint64_t limit = 0) const;

  //! Whole value parsed as a floating point number
  double getDouble(const std::string &key) const;

  //! True/true or False/false
  bool getBool(const std::string &key) const;

  bool contains(const std::string &key) const;

  /**
   * @brief clear Forget every value and the file name, for tests that load
   * several files.
   */
  void clear() {
    m_config.clear();
    m_configFileName.clear();
  }

 private:
  /* ------ Private variables ------ */
  std::map<std::string, std::string> m_config{};  //! Key -> raw value
  std::string m_configFileName;                   //! Last file parsed

  /* ------ Private methods ------ */
  Config() {}

  Config(const Config &);

  Config &operator=(const Config &);
};

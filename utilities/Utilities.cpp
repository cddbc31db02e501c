/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <assert.h>
#include <spdlog/spdlog.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "utilities/Utilities.hpp"

void Utility::unpackBytes(uint8_t *const data, uint64_t val,
                          const size_t width) {
  assert(width <= sizeof(uint64_t));
  for (unsigned int i = 0; i < width; i++) {
    data[i] = static_cast<uint8_t>(val);
    val >>= 8;
  }
}

std::vector<uint8_t> Utility::repeatLanes(const uint32_t pattern,
                                          const size_t width) {
  uint8_t word[sizeof(pattern)];
  unpackBytes(word, pattern, sizeof(pattern));
  std::vector<uint8_t> lanes(width);
  for (size_t i = 0; i < width; i++) {
    lanes[i] = word[i % sizeof(pattern)];
  }
  return lanes;
}

uint64_t Utility::parseUint(const std::string &str) {
  size_t pos = 0;
  uint64_t val;
  try {
    const bool hex = str.size() > 2 && str[0] == '0' &&
                     (str[1] == 'x' || str[1] == 'X');
    val = std::stoull(str, &pos, hex ? 16 : 10);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("\"" + str + "\" is not a number");
  }
  if (pos != str.size() || str.find('-') != std::string::npos) {
    throw std::invalid_argument("\"" + str + "\" is not a number");
  }
  return val;
}

std::vector<uint64_t> Utility::parseUintList(const std::string &str,
                                             const uint64_t limit) {
  std::vector<uint64_t> res;
  std::stringstream ss(str);
  std::string item;
  while (std::getline(ss, item, ',')) {
    // Trim
    const auto first = item.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    item = item.substr(first, item.find_last_not_of(" \t") - first + 1);

    const auto dash = item.find('-');
    const auto lo = parseUint(item.substr(0, dash));
    const auto hi =
        (dash == std::string::npos) ? lo : parseUint(item.substr(dash + 1));
    if (hi < lo) {
      throw std::invalid_argument("Empty range \"" + item + "\"");
    }
    if (limit != 0 && hi >= limit) {
      throw std::invalid_argument("\"" + item + "\" out of range, limit is " +
                                  std::to_string(limit));
    }
    for (auto v = lo;; v++) {
      res.push_back(v);
      if (v == hi) {
        break;
      }
    }
  }
  return res;
}

std::vector<std::string> Utility::split(const std::string &str) {
  std::vector<std::string> res;
  std::stringstream ss(str);
  std::string token;
  while (ss >> token) {
    res.push_back(token);
  }
  return res;
}

bool Utility::assertFileExists(const std::string &filename) {
  std::ifstream ifile(filename.c_str());
  if (!(bool)ifile) {
    spdlog::error("File {} does not exist.", filename);
    exit(1);
  }
  return (bool)ifile;
}

spdlog::level::level_enum Utility::parseLogLevel(const std::string &name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("Unknown log level \"" + name + "\"");
  }
  return level;
}

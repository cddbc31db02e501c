/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdint.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One line of a stimulus script.
 *
 * Script syntax, one command per line, '#' starts a comment:
 *   write <addr> <b0> [b1 ..] [prot=<n>] [strobe=<mask>]
 *   read <addr> [prot=<n>]
 *   expect <addr> <b0> [b1 ..] [prot=<n>]
 *   load <index> <value>
 *   unload <index>
 *   wait <cycles>
 */
struct StimulusCommand {
  enum class Kind { Write, Read, Expect, Load, Unload, Wait };

  Kind kind{Kind::Wait};
  uint64_t address{0};            //! Bus address, or byte index for (un)load
  std::vector<uint8_t> data;      //! Write data, expected data or load value
  unsigned prot{0};               //! Protection bits
  std::optional<uint64_t> strobe;  //! Bit i enables data[i], all if unset
  uint64_t cycles{0};             //! Wait duration
  size_t line{0};                 //! Source line, for diagnostics
};

namespace Stimulus {

/**
 * @brief parse Parse a stimulus script. Throws std::invalid_argument with
 * the offending line number on malformed input.
 */
std::vector<StimulusCommand> parse(std::istream &is);

/**
 * @brief parseFile Parse a stimulus script from a file.
 */
std::vector<StimulusCommand> parseFile(const std::string &filename);

}  // namespace Stimulus

/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <stdint.h>
#include <fstream>
#include <stdexcept>
#include <string>
#include "utilities/Stimulus.hpp"
#include "utilities/Utilities.hpp"

namespace {

uint8_t parseByte(const std::string &token) {
  const auto v = Utility::parseUint(token);
  if (v > 0xff) {
    throw std::invalid_argument(token + " is not a byte");
  }
  return static_cast<uint8_t>(v);
}

StimulusCommand parseLine(const std::vector<std::string> &tokens) {
  StimulusCommand cmd;
  const auto &op = tokens[0];
  std::vector<std::string> args;

  // Split positional arguments from key=value options
  for (size_t i = 1; i < tokens.size(); i++) {
    const auto eq = tokens[i].find('=');
    if (eq == std::string::npos) {
      args.push_back(tokens[i]);
      continue;
    }
    const auto key = tokens[i].substr(0, eq);
    const auto val = Utility::parseUint(tokens[i].substr(eq + 1));
    if (key == "prot") {
      cmd.prot = static_cast<unsigned>(val);
    } else if (key == "strobe") {
      cmd.strobe = val;
    } else {
      throw std::invalid_argument("unknown option \"" + key + "\"");
    }
  }

  auto expectArgs = [&](const size_t min, const size_t max) {
    if (args.size() < min || args.size() > max) {
      throw std::invalid_argument("wrong number of arguments to " + op);
    }
  };

  if (op == "write" || op == "expect") {
    expectArgs(2, SIZE_MAX);
    cmd.kind = (op == "write") ? StimulusCommand::Kind::Write
                               : StimulusCommand::Kind::Expect;
    cmd.address = Utility::parseUint(args[0]);
    for (size_t i = 1; i < args.size(); i++) {
      cmd.data.push_back(parseByte(args[i]));
    }
  } else if (op == "read") {
    expectArgs(1, 1);
    cmd.kind = StimulusCommand::Kind::Read;
    cmd.address = Utility::parseUint(args[0]);
  } else if (op == "load") {
    expectArgs(2, 2);
    cmd.kind = StimulusCommand::Kind::Load;
    cmd.address = Utility::parseUint(args[0]);
    cmd.data.push_back(parseByte(args[1]));
  } else if (op == "unload") {
    expectArgs(1, 1);
    cmd.kind = StimulusCommand::Kind::Unload;
    cmd.address = Utility::parseUint(args[0]);
  } else if (op == "wait") {
    expectArgs(1, 1);
    cmd.kind = StimulusCommand::Kind::Wait;
    cmd.cycles = Utility::parseUint(args[0]);
  } else {
    throw std::invalid_argument("unknown command \"" + op + "\"");
  }

  if (cmd.strobe && cmd.kind != StimulusCommand::Kind::Write) {
    throw std::invalid_argument("strobe= only applies to write");
  }
  return cmd;
}

}  // namespace

std::vector<StimulusCommand> Stimulus::parse(std::istream &is) {
  std::vector<StimulusCommand> cmds;
  std::string line;
  size_t lineNo = 0;
  while (std::getline(is, line)) {
    lineNo++;
    const auto comment = line.find('#');
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    const auto tokens = Utility::split(line);
    if (tokens.empty()) {
      continue;
    }
    try {
      cmds.push_back(parseLine(tokens));
    } catch (const std::invalid_argument &e) {
      spdlog::error("Stimulus line {}: {}", lineNo, e.what());
      throw std::invalid_argument("line " + std::to_string(lineNo) + ": " +
                                  e.what());
    }
    cmds.back().line = lineNo;
  }
  return cmds;
}

std::vector<StimulusCommand> Stimulus::parseFile(const std::string &filename) {
  Utility::assertFileExists(filename);
  std::ifstream ifs(filename);
  return parse(ifs);
}

/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <assert.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include "utilities/Stimulus.hpp"
#include "utilities/Utilities.hpp"

using Kind = StimulusCommand::Kind;

namespace {
bool rejected(const std::string &script) {
  std::istringstream is(script);
  try {
    Stimulus::parse(is);
  } catch (const std::invalid_argument &e) {
    spdlog::info("Rejected as expected: {}", e.what());
    return true;
  }
  return false;
}
}  // namespace

int main() {
  spdlog::info("------ TEST: Number parsing");
  assert(Utility::parseUint("42") == 42);
  assert(Utility::parseUint("0x2a") == 42);
  assert(Utility::parseUint("010") == 10);
  assert(Utility::parseUintList("0, 2-4,9") ==
         (std::vector<uint64_t>{0, 2, 3, 4, 9}));
  assert(Utility::parseUintList("0xfffffffffffffffe-0xffffffffffffffff") ==
         (std::vector<uint64_t>{0xfffffffffffffffeull, 0xffffffffffffffffull}));
  assert(Utility::parseUintList("1-3", 4).size() == 3);
  for (const auto *list : {"1-4", "0-0xffffffffffffffff", "2, 7", "3-1"}) {
    bool thrown = false;
    try {
      Utility::parseUintList(list, 4);
    } catch (const std::invalid_argument &e) {
      spdlog::info("Rejected as expected: {}", e.what());
      thrown = true;
    }
    assert(thrown);
  }

  spdlog::info("------ TEST: Log level names");
  assert(Utility::parseLogLevel("debug") == spdlog::level::debug);
  assert(Utility::parseLogLevel("warn") == spdlog::level::warn);
  assert(Utility::parseLogLevel("off") == spdlog::level::off);
  {
    bool thrown = false;
    try {
      Utility::parseLogLevel("verbose");
    } catch (const std::invalid_argument &) {
      thrown = true;
    }
    assert(thrown);
  }

  spdlog::info("------ TEST: Lane unpacking");
  {
    uint8_t buf[4];
    Utility::unpackBytes(buf, 0xBA5E1E55, 4);
    assert(buf[0] == 0x55 && buf[3] == 0xba);
    assert(Utility::repeatLanes(0xBA5E1E55, 6) ==
           (std::vector<uint8_t>{0x55, 0x1e, 0x5e, 0xba, 0x55, 0x1e}));
  }

  spdlog::info("------ TEST: Full script");
  {
    std::istringstream is(
        "# comment line\n"
        "\n"
        "write 0x4 0x01 0x02 prot=0x3 strobe=0x2\n"
        "read 0x10   # trailing comment\n"
        "expect 8 0xaa\n"
        "load 5 0x42\n"
        "unload 5\n"
        "wait 3\n");
    const auto cmds = Stimulus::parse(is);
    assert(cmds.size() == 6);

    assert(cmds[0].kind == Kind::Write);
    assert(cmds[0].address == 4);
    assert((cmds[0].data == std::vector<uint8_t>{0x01, 0x02}));
    assert(cmds[0].prot == 3);
    assert(cmds[0].strobe && *cmds[0].strobe == 2);
    assert(cmds[0].line == 3);

    assert(cmds[1].kind == Kind::Read && cmds[1].address == 0x10);
    assert(!cmds[1].strobe && cmds[1].prot == 0);
    assert(cmds[1].line == 4);

    assert(cmds[2].kind == Kind::Expect && cmds[2].address == 8);
    assert(cmds[2].data.size() == 1 && cmds[2].data[0] == 0xaa);

    assert(cmds[3].kind == Kind::Load && cmds[3].address == 5);
    assert(cmds[3].data[0] == 0x42);
    assert(cmds[4].kind == Kind::Unload && cmds[4].address == 5);
    assert(cmds[5].kind == Kind::Wait && cmds[5].cycles == 3);
  }

  spdlog::info("------ TEST: Malformed scripts");
  assert(rejected("poke 0x0 1\n"));
  assert(rejected("write 0x0\n"));
  assert(rejected("write 0x0 0x100\n"));
  assert(rejected("read 0x0 0x1\n"));
  assert(rejected("read zz\n"));
  assert(rejected("read 0x0 strobe=1\n"));
  assert(rejected("write 0x0 1 colour=red\n"));
  assert(rejected("wait\n"));
  assert(rejected("load 1 -1\n"));

  {
    std::istringstream is("wait 1\nwait 1\nbogus\n");
    bool thrown = false;
    try {
      Stimulus::parse(is);
    } catch (const std::invalid_argument &e) {
      thrown = std::string(e.what()).find("line 3") != std::string::npos;
    }
    assert(thrown);
  }

  spdlog::info("------ All tests passed ------");
  return 0;
}

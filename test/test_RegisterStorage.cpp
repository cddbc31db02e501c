/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <assert.h>
#include <iostream>
#include <stdexcept>
#include "csr/RegisterStorage.hpp"

int main() {
  RegisterFileConfig config(6, 4);
  config.readOnly[1] = true;
  config.resetValues = {0x10, 0x11, 0x12, 0x13, 0x14, 0x15};
  RegisterStorage dut(config);

  // TEST - Reset values
  assert(dut.size() == 6);
  for (size_t i = 0; i < dut.size(); i++) {
    assert(dut.read(i) == 0x10 + i);
    assert(dut.resetValue(i) == 0x10 + i);
  }
  assert(dut.isReadOnly(1));
  assert(!dut.isReadOnly(0));

  // TEST - Update only touches the given bytes
  dut.update({{0, 0xaa}, {5, 0x55}});
  assert(dut.read(0) == 0xaa);
  assert(dut.read(5) == 0x55);
  for (size_t i = 1; i < 5; i++) {
    assert(dut.read(i) == 0x10 + i);
  }

  // TEST - Storage itself does not enforce read-only (direct loads pass)
  dut.update({{1, 0x42}});
  assert(dut.read(1) == 0x42);

  std::cout << dut << std::endl;

  // TEST - Snapshot
  const auto snap = dut.snapshot();
  assert(snap.size() == 6);
  assert(snap[0] == 0xaa && snap[1] == 0x42 && snap[5] == 0x55);

  // TEST - Out of range update leaves the array intact
  bool thrown = false;
  try {
    dut.update({{2, 0x00}, {6, 0x00}});
  } catch (const std::out_of_range &) {
    thrown = true;
  }
  assert(thrown);
  assert(dut.read(2) == 0x12);

  thrown = false;
  try {
    dut.read(6);
  } catch (const std::out_of_range &) {
    thrown = true;
  }
  assert(thrown);

  // TEST - Reset
  dut.reset();
  assert(dut.read(0) == 0x10);
  assert(dut.read(1) == 0x11);

  // TEST - Malformed config rejected
  RegisterFileConfig bad(4, 4);
  bad.readOnly.pop_back();
  thrown = false;
  try {
    RegisterStorage s(bad);
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  assert(thrown);

  return 0;
}

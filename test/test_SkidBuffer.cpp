/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <assert.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>
#include "csr/SkidBuffer.hpp"

int main() {
  SkidBuffer<int> dut;

  // TEST - Empty buffer
  assert(!dut.consumerValid());
  assert(!dut.poll());
  assert(dut.producerReady());

  // TEST - One cycle of latency
  assert(dut.offer(1));
  assert(!dut.consumerValid());  // Not visible before the tick
  dut.tick();
  assert(dut.consumerValid());
  assert(*dut.poll() == 1);

  // TEST - Full and consumer not ready: back-pressure, value held
  dut.accept(false);
  assert(!dut.producerReady());
  assert(!dut.offer(2));
  assert(!dut.tick());
  assert(*dut.poll() == 1);

  // TEST - Full and consumer ready: pop and push in the same cycle
  dut.accept(true);
  assert(dut.producerReady());
  assert(dut.offer(2));
  assert(dut.tick());
  assert(*dut.poll() == 2);

  // TEST - Producer not valid: nothing taken
  dut.accept(true);
  assert(dut.offer(3, /*producerValid=*/false));
  assert(dut.tick());
  assert(!dut.consumerValid());

  // TEST - Consumer readiness only lasts one cycle
  dut.offer(4);
  dut.tick();
  dut.accept(true);
  dut.tick();
  assert(!dut.consumerValid());
  dut.offer(5);
  dut.tick();
  assert(!dut.producerReady());

  // TEST - Streaming: one transfer per cycle, no loss, no duplication
  dut.reset();
  std::vector<int> received;
  for (int i = 0; i < 10; i++) {
    if (dut.poll()) {
      received.push_back(*dut.poll());
    }
    dut.accept(true);
    assert(dut.offer(100 + i));
    dut.tick();
  }
  received.push_back(*dut.poll());
  assert(received.size() == 10);
  for (int i = 0; i < 10; i++) {
    assert(received[i] == 100 + i);
  }

  // TEST - Second offer in the same cycle is a usage error
  dut.reset();
  dut.offer(1);
  bool thrown = false;
  try {
    dut.offer(2);
  } catch (const std::logic_error &) {
    thrown = true;
  }
  assert(thrown);

  // TEST - Reset drops the held value
  dut.reset();
  dut.offer(7);
  dut.tick();
  dut.reset();
  assert(!dut.consumerValid());
  assert(dut.producerReady());

  spdlog::info("------ All tests passed ------");
  return 0;
}

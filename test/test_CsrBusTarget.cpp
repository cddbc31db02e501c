/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <tlm_utils/simple_initiator_socket.h>
#include <stdint.h>
#include <iostream>
#include <systemc>
#include <tlm>
#include <vector>
#include "bus/ClockSource.hpp"
#include "bus/CsrBusTarget.hpp"
#include "bus/ProtectionExtension.hpp"

using namespace sc_core;

#define NUM_BYTES 11

namespace {
RegisterFileConfig makeConfig() {
  RegisterFileConfig c(NUM_BYTES, 4, 8);
  for (const size_t i : {4, 5, 6, 7, 9}) {
    c.readOnly[i] = true;
  }
  c.resetValues = {0x00, 0x00, 0x00, 0x00, 0xde, 0xad,
                   0xbe, 0xef, 0x00, 0x5a, 0x00};
  c.privilegedOnly = true;
  return c;
}

// Lane 0 is the least significant byte
uint32_t lanesToWord(const std::vector<uint8_t> &data) {
  uint32_t res = 0;
  for (size_t i = data.size(); i > 0; i--) {
    res = (res << 8) | data[i - 1];
  }
  return res;
}
}  // namespace

SC_MODULE(dut) {
 public:
  // Signals
  sc_signal<bool> nReset{"nReset", true};
  sc_vector<sc_signal<bool>> loadEnable{"loadEnable", NUM_BYTES};
  sc_vector<sc_signal<uint8_t>> loadValue{"loadValue", NUM_BYTES};
  sc_vector<sc_signal<bool>> writeActive{"writeActive", NUM_BYTES};
  sc_vector<sc_signal<bool>> readActive{"readActive", NUM_BYTES};
  tlm_utils::simple_initiator_socket<dut> iSocket{"iSocket"};
  ClockSource clk{"clk", sc_time(10, SC_NS)};

  // Bytes seen active on any edge so far
  std::vector<bool> seenWrite = std::vector<bool>(NUM_BYTES, false);
  std::vector<bool> seenRead = std::vector<bool>(NUM_BYTES, false);

  SC_CTOR(dut) {
    m_dut.clk.bind(clk);
    m_dut.tSocket.bind(iSocket);
    m_dut.nReset.bind(nReset);
    m_dut.loadEnable.bind(loadEnable);
    m_dut.loadValue.bind(loadValue);
    m_dut.writeActive.bind(writeActive);
    m_dut.readActive.bind(readActive);

    SC_METHOD(monitor);
    sensitive << clk;
    dont_initialize();
  }

  void monitor() {
    for (size_t i = 0; i < NUM_BYTES; i++) {
      seenWrite[i] = seenWrite[i] || writeActive[i].read();
      seenRead[i] = seenRead[i] || readActive[i].read();
    }
  }

  void clearSeen() {
    seenWrite.assign(NUM_BYTES, false);
    seenRead.assign(NUM_BYTES, false);
  }

  CsrBusTarget m_dut{"dut", makeConfig()};
};

SC_MODULE(tester) {
 public:
  SC_CTOR(tester) {
    SC_THREAD(runtests);
    SC_THREAD(releaseLoad);
    SC_THREAD(resetOnResponseEdge);
  }

  const unsigned PRIV = REGBANK_PROT_PRIVILEGED;

  void runtests() {
    wait(test.clk.default_event());

    spdlog::info("------ TEST: Round trip");
    sc_assert(write({0x11, 0x22, 0x33, 0x44}, 0x0) == tlm::TLM_OK_RESPONSE);
    for (size_t i = 0; i < NUM_BYTES; i++) {
      sc_assert(test.seenWrite[i] == (i < 4));
      sc_assert(!test.seenRead[i]);
    }
    sc_assert(read32(0x0) == 0x44332211);
    for (size_t i = 0; i < NUM_BYTES; i++) {
      sc_assert(!test.seenWrite[i]);
      sc_assert(test.seenRead[i] == (i < 4));
    }

    spdlog::info("------ TEST: Access takes two clock edges");
    {
      const auto start = test.clk.cycles();
      read32(0x0);
      sc_assert(test.clk.cycles() - start == 2);
    }

    spdlog::info("------ TEST: Fully read-only chunk");
    sc_assert(write({0xff, 0xff, 0xff, 0xff}, 0x4) ==
              tlm::TLM_GENERIC_ERROR_RESPONSE);
    sc_assert(read32(0x4) == 0xefbeadde);

    spdlog::info("------ TEST: Mixed chunk and out-of-range lane");
    sc_assert(write({0x01, 0x02, 0x03, 0x04}, 0x8) == tlm::TLM_OK_RESPONSE);
    sc_assert(read32(0x8) == 0x00035a01);

    spdlog::info("------ TEST: Out-of-range read returns the sentinel");
    {
      tlm::tlm_response_status status;
      sc_assert(read32(0x0c, PRIV, &status) == REGBANK_READ_ERROR_SENTINEL);
      sc_assert(status == tlm::TLM_GENERIC_ERROR_RESPONSE);
    }

    spdlog::info("------ TEST: Address bits above the bus width ignored");
    sc_assert(read32(0x100) == 0x44332211);

    spdlog::info("------ TEST: Narrow access and byte enables");
    sc_assert(write({0xaa, 0xbb}, 0x2, PRIV, {tlm::TLM_BYTE_ENABLED,
                                              tlm::TLM_BYTE_DISABLED}) ==
              tlm::TLM_OK_RESPONSE);
    sc_assert(read32(0x0) == 0x44aa2211);
    {
      std::vector<uint8_t> data(1);
      sc_assert(access(tlm::TLM_READ_COMMAND, 0x9, PRIV, data, {}) ==
                tlm::TLM_OK_RESPONSE);
      sc_assert(data[0] == 0x5a);
    }

    spdlog::info("------ TEST: Access crossing a chunk boundary rejected");
    {
      const auto start = sc_time_stamp();
      sc_assert(write({0x01, 0x02}, 0x3) == tlm::TLM_BURST_ERROR_RESPONSE);
      sc_assert(sc_time_stamp() == start);
    }

    spdlog::info("------ TEST: Protection");
    sc_assert(write({0x00, 0x00, 0x00, 0x00}, 0x0, 0) ==
              tlm::TLM_GENERIC_ERROR_RESPONSE);
    {
      tlm::tlm_response_status status;
      sc_assert(read32(0x0, 0, &status) == REGBANK_READ_ERROR_SENTINEL);
      sc_assert(status == tlm::TLM_GENERIC_ERROR_RESPONSE);
    }
    sc_assert(read32(0x0) == 0x44aa2211);

    spdlog::info("------ TEST: Direct load reaches a read-only byte");
    test.loadValue[5].write(0x42);
    test.loadEnable[5].write(true);
    wait(test.clk.default_event());
    wait(test.clk.default_event());
    test.loadEnable[5].write(false);
    sc_assert(read32(0x4) == 0xefbe42de);

    spdlog::info("------ TEST: Write stalls while its chunk is loaded");
    {
      test.loadValue[1].write(0x77);
      test.loadEnable[1].write(true);
      const auto holdTime = 10 * test.clk.getPeriod();
      m_release.notify(holdTime);
      const auto start = sc_time_stamp();
      sc_assert(write({0x10, 0x20, 0x30, 0x40}, 0x0) == tlm::TLM_OK_RESPONSE);
      sc_assert(sc_time_stamp() - start >= holdTime);
      sc_assert(read32(0x0) == 0x40302010);
    }

    spdlog::info("------ TEST: Debug transport");
    {
      std::vector<uint8_t> data{0x99};
      sc_assert(debug(tlm::TLM_WRITE_COMMAND, 7, data) == 1);
      data[0] = 0;
      sc_assert(debug(tlm::TLM_READ_COMMAND, 7, data) == 1);
      sc_assert(data[0] == 0x99);
      std::vector<uint8_t> tooLong(2);
      sc_assert(debug(tlm::TLM_READ_COMMAND, 10, tooLong) == 0);
    }

    spdlog::info("------ TEST: Reset");
    test.nReset.write(false);
    wait(test.clk.default_event());
    test.nReset.write(true);
    wait(SC_ZERO_TIME);
    sc_assert(read32(0x0) == 0x0);
    sc_assert(read32(0x4) == 0xefbeadde);

    std::cout << test.m_dut << std::endl;
    spdlog::info("------ TEST: Reset on the response edge keeps the write");
    {
      // Accepted on the first edge, response drained on the second, reset
      // asserted on that same edge
      m_armReset.notify();
      sc_assert(write({0x5a, 0x5a, 0x5a, 0x5a}, 0x0) == tlm::TLM_OK_RESPONSE);
      test.nReset.write(true);
      wait(SC_ZERO_TIME);
      sc_assert(read32(0x0) == 0x0);
    }

    spdlog::info("------ TEST: Reset while waiting aborts the write");
    {
      test.loadValue[0].write(0x01);
      test.loadEnable[0].write(true);
      m_pulseReset.notify(5 * test.clk.getPeriod());
      sc_assert(write({0x5a, 0x5a, 0x5a, 0x5a}, 0x0) ==
                tlm::TLM_GENERIC_ERROR_RESPONSE);
      test.loadEnable[0].write(false);
      test.nReset.write(true);
      wait(SC_ZERO_TIME);
    }

    spdlog::info("------ All tests passed ------");
    sc_stop();
  }

  void resetOnResponseEdge() {
    while (true) {
      wait(m_armReset | m_pulseReset);
      if (m_armReset.triggered()) {
        wait(test.clk.default_event());
        wait(test.clk.default_event());
      }
      test.nReset.write(false);
    }
  }

  void releaseLoad() {
    while (true) {
      wait(m_release);
      test.loadEnable[1].write(false);
    }
  }

  tlm::tlm_response_status access(
      const tlm::tlm_command cmd, const uint64_t addr, const unsigned prot,
      std::vector<uint8_t> &data, std::vector<uint8_t> byteEnable) {
    sc_time delay = SC_ZERO_TIME;
    tlm::tlm_generic_payload trans;
    ProtectionExtension ext(ProtectionAttributes::fromBits(prot));
    trans.set_command(cmd);
    trans.set_address(addr);
    trans.set_data_ptr(data.data());
    trans.set_data_length(data.size());
    if (!byteEnable.empty()) {
      trans.set_byte_enable_ptr(byteEnable.data());
      trans.set_byte_enable_length(byteEnable.size());
    }
    trans.set_extension(&ext);
    if (cmd == tlm::TLM_WRITE_COMMAND) {
      std::cout << ext << std::endl;
    }
    test.iSocket->b_transport(trans, delay);
    wait(delay);
    trans.clear_extension(&ext);
    return trans.get_response_status();
  }

  tlm::tlm_response_status write(std::vector<uint8_t> data,
                                 const uint64_t addr,
                                 const unsigned prot = REGBANK_PROT_PRIVILEGED,
                                 std::vector<uint8_t> byteEnable = {}) {
    test.clearSeen();
    return access(tlm::TLM_WRITE_COMMAND, addr, prot, data, byteEnable);
  }

  uint32_t read32(const uint64_t addr,
                  const unsigned prot = REGBANK_PROT_PRIVILEGED,
                  tlm::tlm_response_status *status = nullptr) {
    std::vector<uint8_t> data(4, 0);
    test.clearSeen();
    const auto s = access(tlm::TLM_READ_COMMAND, addr, prot, data, {});
    if (status != nullptr) {
      *status = s;
    } else {
      sc_assert(s == tlm::TLM_OK_RESPONSE);
    }
    return lanesToWord(data);
  }

  unsigned debug(const tlm::tlm_command cmd, const uint64_t index,
                 std::vector<uint8_t> &data) {
    tlm::tlm_generic_payload trans;
    trans.set_command(cmd);
    trans.set_address(index);
    trans.set_data_ptr(data.data());
    trans.set_data_length(data.size());
    return test.iSocket->transport_dbg(trans);
  }

  sc_event m_release;
  sc_event m_armReset;
  sc_event m_pulseReset;
  dut test{"dut"};
};

int sc_main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
  tester t("tester");
  sc_start();
  return false;
}

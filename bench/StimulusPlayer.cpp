/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>
#include "bench/StimulusPlayer.hpp"
#include "bus/ProtectionExtension.hpp"

using namespace sc_core;

namespace {
std::string toHex(const std::vector<uint8_t> &data) {
  std::string s;
  for (const auto b : data) {
    s += fmt::format("{}{:02x}", s.empty() ? "" : " ", b);
  }
  return s;
}

const char *toString(const tlm::tlm_response_status status) {
  switch (status) {
    case tlm::TLM_OK_RESPONSE:
      return "OK";
    case tlm::TLM_INCOMPLETE_RESPONSE:
      return "INCOMPLETE";
    case tlm::TLM_GENERIC_ERROR_RESPONSE:
      return "GENERIC_ERROR";
    case tlm::TLM_ADDRESS_ERROR_RESPONSE:
      return "ADDRESS_ERROR";
    case tlm::TLM_COMMAND_ERROR_RESPONSE:
      return "COMMAND_ERROR";
    case tlm::TLM_BURST_ERROR_RESPONSE:
      return "BURST_ERROR";
    case tlm::TLM_BYTE_ENABLE_ERROR_RESPONSE:
      return "BYTE_ENABLE_ERROR";
  }
  return "UNKNOWN";
}
}  // namespace

StimulusPlayer::StimulusPlayer(const sc_module_name name,
                               const size_t numBytes, const size_t laneWidth,
                               std::vector<StimulusCommand> commands)
    : sc_module(name),
      loadEnable("loadEnable", numBytes),
      loadValue("loadValue", numBytes),
      m_laneWidth(laneWidth),
      m_commands(std::move(commands)) {
  SC_THREAD(run);
}

tlm::tlm_response_status StimulusPlayer::access(
    const tlm::tlm_command cmd, const uint64_t addr, const unsigned prot,
    std::vector<uint8_t> &data, const std::vector<uint8_t> &byteEnable) {
  sc_time delay = SC_ZERO_TIME;
  tlm::tlm_generic_payload trans;
  ProtectionExtension ext(ProtectionAttributes::fromBits(prot));
  std::vector<uint8_t> be(byteEnable);

  trans.set_command(cmd);
  trans.set_address(addr);
  trans.set_data_ptr(data.data());
  trans.set_data_length(data.size());
  if (!be.empty()) {
    trans.set_byte_enable_ptr(be.data());
    trans.set_byte_enable_length(be.size());
  }
  trans.set_extension(&ext);

  iSocket->b_transport(trans, delay);
  wait(delay);

  trans.clear_extension(&ext);
  if (trans.is_response_error()) {
    m_errorResponses++;
  }
  return trans.get_response_status();
}

void StimulusPlayer::run() {
  for (size_t i = 0; i < loadEnable.size(); i++) {
    loadEnable[i].write(false);
    loadValue[i].write(0);
  }
  wait(clk->default_event());

  for (const auto &c : m_commands) {
    switch (c.kind) {
      case StimulusCommand::Kind::Write: {
        std::vector<uint8_t> data(c.data);
        std::vector<uint8_t> be;
        if (c.strobe) {
          for (size_t i = 0; i < data.size(); i++) {
            be.push_back(((*c.strobe >> i) & 1u) ? tlm::TLM_BYTE_ENABLED
                                                  : tlm::TLM_BYTE_DISABLED);
          }
        }
        const auto status =
            access(tlm::TLM_WRITE_COMMAND, c.address, c.prot, data, be);
        spdlog::info("{} @{}: write 0x{:x} [{}] -> {}", this->name(),
                     clk->cycles(), c.address, toHex(c.data),
                     toString(status));
        break;
      }
      case StimulusCommand::Kind::Read:
      case StimulusCommand::Kind::Expect: {
        // A plain read returns the rest of the chunk
        const size_t len = (c.kind == StimulusCommand::Kind::Read)
                               ? m_laneWidth - (c.address % m_laneWidth)
                               : c.data.size();
        std::vector<uint8_t> data(len, 0);
        const auto status =
            access(tlm::TLM_READ_COMMAND, c.address, c.prot, data, {});
        spdlog::info("{} @{}: read 0x{:x} -> {} [{}]", this->name(),
                     clk->cycles(), c.address,
                     toString(status),
                     toHex(data));
        if (c.kind == StimulusCommand::Kind::Expect &&
            (status != tlm::TLM_OK_RESPONSE || data != c.data)) {
          spdlog::error("{}: line {}: expected [{}] at 0x{:x}, got [{}]",
                        this->name(), c.line, toHex(c.data), c.address,
                        toHex(data));
          m_failures++;
        }
        break;
      }
      case StimulusCommand::Kind::Load:
        if (c.address >= loadEnable.size()) {
          spdlog::error("{}: line {}: load index {} out of range",
                        this->name(), c.line, c.address);
          m_failures++;
          break;
        }
        loadValue[c.address].write(c.data[0]);
        loadEnable[c.address].write(true);
        break;
      case StimulusCommand::Kind::Unload:
        if (c.address >= loadEnable.size()) {
          spdlog::error("{}: line {}: unload index {} out of range",
                        this->name(), c.line, c.address);
          m_failures++;
          break;
        }
        loadEnable[c.address].write(false);
        break;
      case StimulusCommand::Kind::Wait:
        for (uint64_t n = 0; n < c.cycles; n++) {
          wait(clk->default_event());
        }
        break;
    }
  }

  m_finished = true;
  spdlog::info("{}: {} commands replayed, {} error responses, {} failures",
               this->name(), m_commands.size(), m_errorResponses, m_failures);
  sc_stop();
}

/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdint.h>
#include <systemc>
#include <tlm>
#include <tlm_utils/simple_initiator_socket.h>
#include <vector>
#include "bus/ClockSource.hpp"
#include "utilities/Stimulus.hpp"

/**
 * @brief The StimulusPlayer class Replays a stimulus script: bus accesses
 * through a TLM initiator socket, direct loads through signal ports.
 * Stops the simulation when the script ends.
 */
class StimulusPlayer : public sc_core::sc_module {
  SC_HAS_PROCESS(StimulusPlayer);

 public:
  /* ------ Ports ------ */
  sc_core::sc_port<ClockSourceIf> clk{"clk"};
  tlm_utils::simple_initiator_socket<StimulusPlayer> iSocket{"iSocket"};
  sc_core::sc_vector<sc_core::sc_out<bool>> loadEnable;
  sc_core::sc_vector<sc_core::sc_out<uint8_t>> loadValue;

  /* ------ Public methods ------ */
  /**
   * @brief StimulusPlayer Constructor
   * @param name module name
   * @param numBytes register array size
   * @param laneWidth bus data width in bytes
   * @param commands script to replay
   */
  StimulusPlayer(const sc_core::sc_module_name name, const size_t numBytes,
                 const size_t laneWidth,
                 std::vector<StimulusCommand> commands);

  //! Number of failed expect commands
  unsigned failures() const { return m_failures; }

  //! Number of bus accesses that completed with an error response
  unsigned errorResponses() const { return m_errorResponses; }

  //! Every command replayed
  bool finished() const { return m_finished; }

 private:
  /* ------ Private variables ------ */
  const size_t m_laneWidth;
  const std::vector<StimulusCommand> m_commands;
  unsigned m_failures{0};
  unsigned m_errorResponses{0};
  bool m_finished{false};

  /* ------ Private methods ------ */
  void run();

  /**
   * @brief access Issue one blocking bus access.
   * @retval response status
   */
  tlm::tlm_response_status access(const tlm::tlm_command cmd,
                                  const uint64_t addr, const unsigned prot,
                                  std::vector<uint8_t> &data,
                                  const std::vector<uint8_t> &byteEnable);
};

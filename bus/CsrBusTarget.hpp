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
#include <systemc>
#include <tlm>
#include "bus/ClockSource.hpp"
#include "csr/RegisterFileConfig.hpp"
#include "csr/RegisterFileController.hpp"

/**
 * @brief The CsrBusTarget class Clocked register file behind a TLM-2.0 target
 * socket.
 *
 * The controller is stepped on every clock edge. b_transport posts its
 * request on the write or read channel and blocks the calling thread until
 * the controller has accepted it and the response has been drained, so it
 * must be called from an SC_THREAD. One transaction per channel is in flight
 * at a time; further callers queue up behind it.
 *
 * A payload addresses one chunk: bytes [addr, addr + len) must not cross a
 * chunk boundary.
 */
class CsrBusTarget : public sc_core::sc_module,
                     public tlm::tlm_fw_transport_if<> {
  SC_HAS_PROCESS(CsrBusTarget);

 public:
  /* ------ Ports ------ */
  //! Controller clock
  sc_core::sc_port<ClockSourceIf> clk{"clk"};

  //! TLM bus socket
  tlm::tlm_target_socket<> tSocket;

  //! Active-low reset, registers held at reset values while low
  sc_core::sc_in<bool> nReset{"nReset"};

  //! Direct-load side channel, one entry per register byte
  sc_core::sc_vector<sc_core::sc_in<bool>> loadEnable;
  sc_core::sc_vector<sc_core::sc_in<uint8_t>> loadValue;

  //! Activity taps, one entry per register byte, updated on each edge
  sc_core::sc_vector<sc_core::sc_out<bool>> writeActive;
  sc_core::sc_vector<sc_core::sc_out<bool>> readActive;

  /* ------ Public methods ------ */
  /**
   * @brief CsrBusTarget Constructor. Throws std::invalid_argument if the
   * configuration is malformed.
   * @param name module name
   * @param config register file configuration
   */
  CsrBusTarget(const sc_core::sc_module_name name,
               const RegisterFileConfig &config);

  /**
   * @brief b_transport Blocking bus access through the controller.
   */
  virtual void b_transport(tlm::tlm_generic_payload &trans,
                           sc_core::sc_time &delay) override;

  /**
   * @brief transport_dbg Backdoor access to the register array, without
   * advancing simulation time. The address is a byte index. Writes bypass
   * read-only protection.
   */
  virtual unsigned int transport_dbg(tlm::tlm_generic_payload &trans) override;

  /**
   * @brief reset Registers to reset values, response buffers emptied. Callers
   * blocked in b_transport are released with TLM_GENERIC_ERROR_RESPONSE,
   * unless their response was already taken.
   */
  void reset();

  const RegisterFileController &controller() const { return m_ctrl; }

  /**
   * @brief << debug printout.
   */
  friend std::ostream &operator<<(std::ostream &os, const CsrBusTarget &rhs);

  /*------ Dummy methods --------------------------------------------------*/

  // dummy method
  [[noreturn]] virtual tlm::tlm_sync_enum nb_transport_fw(
      tlm::tlm_generic_payload &trans[[maybe_unused]],
      tlm::tlm_phase &phase[[maybe_unused]],
      sc_core::sc_time &delay[[maybe_unused]]) override {
    SC_REPORT_ERROR(this->name(), "not implemented");
    exit(1);
  }

  // dummy method
  virtual bool get_direct_mem_ptr(
      tlm::tlm_generic_payload &trans[[maybe_unused]],
      tlm::tlm_dmi &data[[maybe_unused]]) override {
    return false;
  }

 private:
  /* ------ Types ------ */
  //! State of one bus channel as seen from the TLM side
  template <typename Req, typename Resp>
  struct Channel {
    bool busy{false};            //! A caller owns the channel
    std::optional<Req> request;  //! Posted, not yet accepted
    std::optional<Resp> result;  //! Response drained from the controller
    bool aborted{false};         //! Released by reset
    sc_core::sc_event done;      //! result or aborted set
    sc_core::sc_event free;      //! busy cleared

    //! Waiting for the response, i.e. response channel ready
    bool awaitingResponse() const { return busy && !request && !result; }

    void release() {
      busy = false;
      free.notify(sc_core::SC_ZERO_TIME);
    }
  };

  /* ------ Private variables ------ */
  RegisterFileController m_ctrl;
  Channel<WriteRequest, WriteResponse> m_write;
  Channel<ReadRequest, ReadResponse> m_read;

  /* ------ Private methods ------ */
  /**
   * @brief process Sample inputs and step the controller on a clock edge.
   */
  void process();

  /**
   * @brief resetProcess reset on the falling edge of nReset
   */
  void resetProcess();

  /**
   * @brief checkPayload check that the payload fits one chunk. Sets the
   * response status and returns false otherwise.
   */
  bool checkPayload(tlm::tlm_generic_payload &trans) const;

  static tlm::tlm_response_status toTlm(const BusResponse resp);
};

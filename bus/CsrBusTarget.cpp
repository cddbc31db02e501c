/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <systemc>
#include <tlm>
#include "bus/CsrBusTarget.hpp"
#include "bus/ProtectionExtension.hpp"

using namespace sc_core;

CsrBusTarget::CsrBusTarget(const sc_module_name name,
                           const RegisterFileConfig &config)
    : sc_module(name),
      tSocket("tSocket"),
      loadEnable("loadEnable", config.numBytes),
      loadValue("loadValue", config.numBytes),
      writeActive("writeActive", config.numBytes),
      readActive("readActive", config.numBytes),
      m_ctrl(config) {
  tSocket.bind(*this);

  SC_METHOD(process);
  sensitive << clk;
  dont_initialize();

  SC_METHOD(resetProcess);
  sensitive << nReset.neg();
  dont_initialize();
}

void CsrBusTarget::reset() {
  m_ctrl.reset();
  // A caller whose response was already drained completes normally
  if (m_write.busy && !m_write.result) {
    m_write.request.reset();
    m_write.aborted = true;
    m_write.done.notify(SC_ZERO_TIME);
  }
  if (m_read.busy && !m_read.result) {
    m_read.request.reset();
    m_read.aborted = true;
    m_read.done.notify(SC_ZERO_TIME);
  }
}

void CsrBusTarget::resetProcess() {
  spdlog::info("{}: reset @{}", this->name(), sc_time_stamp().to_string());
  reset();
}

void CsrBusTarget::process() {
  if (!nReset.read()) {
    return;  // Held in reset
  }

  const size_t n = m_ctrl.config().numBytes;
  RegisterFileController::Inputs in;
  in.write = m_write.request;
  in.read = m_read.request;
  in.writeResponseReady = m_write.awaitingResponse();
  in.readResponseReady = m_read.awaitingResponse();
  in.load = DirectLoad(n);
  for (size_t i = 0; i < n; i++) {
    if (loadEnable[i].read()) {
      in.load.set(i, loadValue[i].read());
    }
  }

  const auto out = m_ctrl.step(in);

  if (out.writeAccepted) {
    m_write.request.reset();
  }
  if (out.readAccepted) {
    m_read.request.reset();
  }
  if (out.writeResponseTaken(in)) {
    m_write.result = out.writeResponse;
    m_write.done.notify(SC_ZERO_TIME);
  }
  if (out.readResponseTaken(in)) {
    m_read.result = out.readResponse;
    m_read.done.notify(SC_ZERO_TIME);
  }

  for (size_t i = 0; i < n; i++) {
    writeActive[i].write(out.writeActive[i]);
    readActive[i].write(out.readActive[i]);
  }
}

bool CsrBusTarget::checkPayload(tlm::tlm_generic_payload &trans) const {
  const size_t w = m_ctrl.config().dataWidthBytes;
  const auto addr = trans.get_address();
  const auto len = trans.get_data_length();

  if (len == 0 || (addr % w) + len > w) {
    spdlog::warn("{}: rejected access of {} bytes at 0x{:x}, must fit one "
                 "{}-byte chunk",
                 this->name(), len, addr, w);
    trans.set_response_status(tlm::TLM_BURST_ERROR_RESPONSE);
    return false;
  }
  if (trans.get_command() != tlm::TLM_WRITE_COMMAND &&
      trans.get_command() != tlm::TLM_READ_COMMAND) {
    SC_REPORT_FATAL(this->name(), "Payload command not supported.");
  }
  return true;
}

void CsrBusTarget::b_transport(tlm::tlm_generic_payload &trans,
                               sc_time &delay) {
  if (!checkPayload(trans)) {
    return;
  }

  // Synchronise with the initiator's local time
  wait(delay);
  delay = SC_ZERO_TIME;

  const size_t w = m_ctrl.config().dataWidthBytes;
  const auto addr = trans.get_address();
  const size_t ofs = addr % w;
  const size_t len = trans.get_data_length();
  uint8_t *data = trans.get_data_ptr();
  const auto prot = ProtectionExtension::of(trans);

  if (trans.get_command() == tlm::TLM_WRITE_COMMAND) {
    WriteRequest req{addr, prot, std::vector<uint8_t>(w, 0),
                     std::vector<bool>(w, false)};
    const uint8_t *be = trans.get_byte_enable_ptr();
    const auto beLen = trans.get_byte_enable_length();
    for (size_t i = 0; i < len; i++) {
      req.data[ofs + i] = data[i];
      req.strobe[ofs + i] =
          (be == nullptr) || (be[i % beLen] == tlm::TLM_BYTE_ENABLED);
    }

    while (m_write.busy) {
      wait(m_write.free);
    }
    m_write.busy = true;
    m_write.aborted = false;
    m_write.result.reset();
    m_write.request = req;
    wait(m_write.done);

    trans.set_response_status(m_write.aborted
                                  ? tlm::TLM_GENERIC_ERROR_RESPONSE
                                  : toTlm(m_write.result->resp));
    m_write.result.reset();
    m_write.release();
  } else {
    while (m_read.busy) {
      wait(m_read.free);
    }
    m_read.busy = true;
    m_read.aborted = false;
    m_read.result.reset();
    m_read.request = ReadRequest{addr, prot};
    wait(m_read.done);

    if (m_read.aborted) {
      trans.set_response_status(tlm::TLM_GENERIC_ERROR_RESPONSE);
    } else {
      for (size_t i = 0; i < len; i++) {
        data[i] = m_read.result->data[ofs + i];
      }
      trans.set_response_status(toTlm(m_read.result->resp));
    }
    m_read.result.reset();
    m_read.release();
  }
}

unsigned int CsrBusTarget::transport_dbg(tlm::tlm_generic_payload &trans) {
  const auto &regs = m_ctrl.storage();
  const auto addr = trans.get_address();
  const size_t len = trans.get_data_length();
  uint8_t *data = trans.get_data_ptr();

  if (addr >= regs.size() || len > regs.size() - addr) {
    trans.set_response_status(tlm::TLM_ADDRESS_ERROR_RESPONSE);
    return 0;
  }

  if (trans.get_command() == tlm::TLM_WRITE_COMMAND) {
    RegisterStorage::Loads loads;
    for (size_t i = 0; i < len; i++) {
      loads[addr + i] = data[i];
    }
    m_ctrl.backdoorWrite(loads);
  } else if (trans.get_command() == tlm::TLM_READ_COMMAND) {
    for (size_t i = 0; i < len; i++) {
      data[i] = regs.read(addr + i);
    }
  } else {
    SC_REPORT_FATAL(this->name(), "Payload command not supported.");
  }

  trans.set_response_status(tlm::TLM_OK_RESPONSE);
  return len;
}

tlm::tlm_response_status CsrBusTarget::toTlm(const BusResponse resp) {
  return resp == BusResponse::OK ? tlm::TLM_OK_RESPONSE
                                 : tlm::TLM_GENERIC_ERROR_RESPONSE;
}

std::ostream &operator<<(std::ostream &os, const CsrBusTarget &rhs) {
  os << "<CsrBusTarget> " << rhs.name() << "\n" << rhs.m_ctrl;
  return os;
}

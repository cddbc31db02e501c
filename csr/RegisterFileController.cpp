/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>
#include "csr/RegisterFileController.hpp"

const RegisterFileConfig &RegisterFileController::validated(
    const RegisterFileConfig &config) {
  config.validate();
  return config;
}

RegisterFileController::RegisterFileController(
    const RegisterFileConfig &config)
    : m_config(validated(config)),
      m_decoder(AddressDecoder::forChunks(m_config.numChunks(),
                                          m_config.dataWidthBytes)),
      m_storage(m_config),
      m_writeController(m_config, m_decoder),
      m_readController(m_config, m_decoder) {}

void RegisterFileController::reset() {
  m_storage.reset();
  m_writeResponses.reset();
  m_readResponses.reset();
  m_cycle = 0;
}

RegisterFileController::Outputs RegisterFileController::step(
    const Inputs &in) {
  Outputs out;

  // Registered response channels, as seen during this cycle
  out.writeResponse = m_writeResponses.poll();
  out.readResponse = m_readResponses.poll();
  m_writeResponses.accept(in.writeResponseReady);
  m_readResponses.accept(in.readResponseReady);

  auto wd = m_writeController.evaluate(m_storage, in.load, in.write,
                                       m_writeResponses.producerReady());
  auto rd = m_readController.evaluate(m_storage, in.read,
                                      m_readResponses.producerReady());

  if (wd.response) {
    m_writeResponses.offer(*wd.response);
  }
  if (rd.response) {
    m_readResponses.offer(*rd.response);
  }

  out.writeAccepted = wd.accepted;
  out.readAccepted = rd.accepted;
  out.writeOutcome = wd.outcome;
  out.readOutcome = rd.outcome;
  out.writeActive = std::move(wd.writeActive);
  out.readActive = std::move(rd.readActive);

  if (wd.outcome != WriteController::Outcome::Idle) {
    spdlog::debug("RegisterFileController @{}: write 0x{:x} -> {}", m_cycle,
                  in.write->address, toString(wd.outcome));
  }
  if (rd.outcome != ReadController::Outcome::Idle) {
    spdlog::debug("RegisterFileController @{}: read 0x{:x} -> {}", m_cycle,
                  in.read->address, toString(rd.outcome));
  }

  // Tick
  checkReadOnly(wd);
  m_storage.update(wd.next);
  m_writeResponses.tick();
  m_readResponses.tick();
  m_cycle++;

  return out;
}

void RegisterFileController::checkReadOnly(
    const WriteController::Decision &wd) const {
  for (const auto &l : wd.next) {
    if (m_storage.isReadOnly(l.first) && !wd.loaded[l.first]) {
      spdlog::critical(
          "RegisterFileController @{}: read-only byte {} written without a "
          "direct load",
          m_cycle, l.first);
      throw std::logic_error("read-only byte " + std::to_string(l.first) +
                             " modified by the bus");
    }
  }
}

std::ostream &operator<<(std::ostream &os, const RegisterFileController &rhs) {
  os << "<RegisterFileController> cycle " << rhs.m_cycle << "\n"
     << rhs.m_config << "\n"
     << "Write response pending: " << rhs.m_writeResponses.consumerValid()
     << "\nRead response pending: " << rhs.m_readResponses.consumerValid()
     << "\n"
     << rhs.m_storage;
  return os;
}

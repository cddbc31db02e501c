/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <stdexcept>
#include <string>
#include "csr/WriteController.hpp"

WriteController::WriteController(const RegisterFileConfig &config,
                                 const AddressDecoder &decoder)
    : m_config(config), m_decoder(decoder) {
  const size_t w = m_config.dataWidthBytes;
  for (size_t c = 0; c < m_config.numChunks(); c++) {
    const size_t end = std::min((c + 1) * w, m_config.numBytes);
    bool allReadOnly = true;
    for (size_t b = c * w; b < end; b++) {
      allReadOnly &= m_config.readOnly[b];
    }
    m_chunkReadOnly.push_back(allReadOnly);
  }
}

WriteController::Decision WriteController::evaluate(
    const RegisterStorage &regs, const DirectLoad &load,
    const std::optional<WriteRequest> &req, const bool responseReady) const {
  const size_t n = m_config.numBytes;
  const size_t w = m_config.dataWidthBytes;

  Decision d;
  d.loaded.assign(n, false);
  d.writeActive.assign(n, false);

  // Direct loads, unconditionally
  if (!load.enable.empty()) {
    if (load.enable.size() != n || load.value.size() != n) {
      throw std::invalid_argument(
          "WriteController: direct-load vector must have " +
          std::to_string(n) + " entries");
    }
    for (size_t i = 0; i < n; i++) {
      if (load.enable[i]) {
        d.next[i] = load.value[i];
        d.loaded[i] = true;
      }
    }
  }

  if (!req) {
    d.outcome = Outcome::Idle;
    return d;
  }
  if (!responseReady) {
    d.outcome = Outcome::NotReady;
    return d;
  }
  if (req->data.size() != w || req->strobe.size() != w) {
    throw std::invalid_argument("WriteController: write data and strobe must "
                                "have one entry per lane (" +
                                std::to_string(w) + ")");
  }

  if (!m_config.protectionAllows(req->prot)) {
    d.accepted = true;
    d.response = WriteResponse{BusResponse::SLAVE_ERROR};
    d.outcome = Outcome::ProtectionError;
    return d;
  }

  const auto dec = m_decoder.decode(m_config.maskAddress(req->address));
  if (!dec.valid) {
    d.accepted = true;
    d.response = WriteResponse{BusResponse::SLAVE_ERROR};
    d.outcome = Outcome::DecodeError;
    return d;
  }

  const size_t base = dec.index * w;
  const size_t end = std::min(base + w, n);

  // Bus write to a chunk under direct load: not accepted, retried by caller
  for (size_t b = base; b < end; b++) {
    if (d.loaded[b]) {
      d.outcome = Outcome::LoadConflictStall;
      return d;
    }
  }

  for (size_t b = base; b < end; b++) {
    const size_t lane = b - base;
    if (!req->strobe[lane]) {
      continue;
    }
    d.writeActive[b] = true;
    if (!regs.isReadOnly(b)) {
      d.next[b] = req->data[lane];
    }
  }

  d.accepted = true;
  if (m_chunkReadOnly[dec.index]) {
    d.response = WriteResponse{BusResponse::SLAVE_ERROR};
    d.outcome = Outcome::ReadOnlyChunkError;
  } else {
    d.response = WriteResponse{BusResponse::OK};
    d.outcome = Outcome::Accepted;
  }
  return d;
}

const char *toString(const WriteController::Outcome outcome) {
  switch (outcome) {
    case WriteController::Outcome::Idle:
      return "Idle";
    case WriteController::Outcome::NotReady:
      return "NotReady";
    case WriteController::Outcome::LoadConflictStall:
      return "LoadConflictStall";
    case WriteController::Outcome::ProtectionError:
      return "ProtectionError";
    case WriteController::Outcome::DecodeError:
      return "DecodeError";
    case WriteController::Outcome::ReadOnlyChunkError:
      return "ReadOnlyChunkError";
    case WriteController::Outcome::Accepted:
      return "Accepted";
  }
  return "Unknown";
}

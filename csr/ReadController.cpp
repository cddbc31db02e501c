/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <utility>
#include "csr/ReadController.hpp"
#include "utilities/Utilities.hpp"

ReadController::ReadController(const RegisterFileConfig &config,
                               const AddressDecoder &decoder)
    : m_config(config),
      m_decoder(decoder),
      m_errorPayload(Utility::repeatLanes(REGBANK_READ_ERROR_SENTINEL,
                                          config.dataWidthBytes)) {}

ReadController::Decision ReadController::evaluate(
    const RegisterStorage &regs, const std::optional<ReadRequest> &req,
    const bool responseReady) const {
  const size_t n = m_config.numBytes;
  const size_t w = m_config.dataWidthBytes;

  Decision d;
  d.readActive.assign(n, false);

  if (!req) {
    d.outcome = Outcome::Idle;
    return d;
  }
  if (!responseReady) {
    d.outcome = Outcome::NotReady;
    return d;
  }

  d.accepted = true;
  if (!m_config.protectionAllows(req->prot)) {
    d.response = ReadResponse{BusResponse::SLAVE_ERROR, m_errorPayload};
    d.outcome = Outcome::ProtectionError;
    return d;
  }

  const auto dec = m_decoder.decode(m_config.maskAddress(req->address));
  if (!dec.valid) {
    d.response = ReadResponse{BusResponse::SLAVE_ERROR, m_errorPayload};
    d.outcome = Outcome::DecodeError;
    return d;
  }

  ReadResponse resp{BusResponse::OK, std::vector<uint8_t>(w, 0)};
  const size_t base = dec.index * w;
  for (size_t lane = 0; lane < w && base + lane < n; lane++) {
    resp.data[lane] = regs.read(base + lane);
    d.readActive[base + lane] = true;
  }
  d.response = std::move(resp);
  d.outcome = Outcome::Accepted;
  return d;
}

const char *toString(const ReadController::Outcome outcome) {
  switch (outcome) {
    case ReadController::Outcome::Idle:
      return "Idle";
    case ReadController::Outcome::NotReady:
      return "NotReady";
    case ReadController::Outcome::ProtectionError:
      return "ProtectionError";
    case ReadController::Outcome::DecodeError:
      return "DecodeError";
    case ReadController::Outcome::Accepted:
      return "Accepted";
  }
  return "Unknown";
}

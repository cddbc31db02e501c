/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>
#include "csr/AddressDecoder.hpp"
#include "csr/BusTypes.hpp"
#include "csr/RegisterFileConfig.hpp"
#include "csr/RegisterStorage.hpp"

/**
 * @brief The ReadController class Multiplexes one chunk of the register
 * array onto the read response.
 */
class ReadController {
 public:
  /* ------ Types ------ */
  enum class Outcome {
    Idle,             //! No read request
    NotReady,         //! Response buffer full, request not accepted
    ProtectionError,  //! SLAVE_ERROR, protection gate failed
    DecodeError,      //! SLAVE_ERROR, address outside every chunk
    Accepted          //! OK
  };

  struct Decision {
    std::vector<bool> readActive;          //! Byte read this cycle
    bool accepted{false};                  //! ar handshake completes
    std::optional<ReadResponse> response;  //! Enqueued iff accepted
    Outcome outcome{Outcome::Idle};
  };

  /* ------ Public methods ------ */
  ReadController(const RegisterFileConfig &config,
                 const AddressDecoder &decoder);

  /**
   * @brief evaluate Compute this cycle's read-path decision.
   * @param regs committed register state
   * @param req pending read request, if any
   * @param responseReady the read response buffer can take a value
   */
  Decision evaluate(const RegisterStorage &regs,
                    const std::optional<ReadRequest> &req,
                    const bool responseReady) const;

  /**
   * @brief errorPayload payload returned with SLAVE_ERROR
   */
  const std::vector<uint8_t> &errorPayload() const { return m_errorPayload; }

 private:
  const RegisterFileConfig &m_config;
  const AddressDecoder &m_decoder;
  std::vector<uint8_t> m_errorPayload;
};

const char *toString(const ReadController::Outcome outcome);

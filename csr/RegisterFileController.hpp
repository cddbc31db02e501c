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
#include <vector>
#include "csr/AddressDecoder.hpp"
#include "csr/BusTypes.hpp"
#include "csr/ReadController.hpp"
#include "csr/RegisterFileConfig.hpp"
#include "csr/RegisterStorage.hpp"
#include "csr/SkidBuffer.hpp"
#include "csr/WriteController.hpp"

/**
 * @brief The RegisterFileController class Cycle-based model of a
 * memory-mapped register file with independent read and write channels.
 *
 * step() is called once per clock edge. Everything it derives comes from
 * the state committed at the previous edge; storage and both response
 * buffers are updated together at the end of the call. Responses therefore
 * appear on the response channels one step after their request was
 * accepted, and a read never observes a write from the same step.
 */
class RegisterFileController {
 public:
  /* ------ Types ------ */
  //! Signals sampled on a clock edge
  struct Inputs {
    std::optional<WriteRequest> write;  //! aw/w valid with payload
    std::optional<ReadRequest> read;    //! ar valid with payload
    DirectLoad load;                    //! Empty for no direct loads
    bool writeResponseReady{true};      //! b channel ready
    bool readResponseReady{true};       //! r channel ready
  };

  //! Signals driven during the cycle leading up to the edge
  struct Outputs {
    bool writeAccepted{false};                   //! aw/w ready && valid
    bool readAccepted{false};                    //! ar ready && valid
    std::optional<WriteResponse> writeResponse;  //! b channel (valid if set)
    std::optional<ReadResponse> readResponse;    //! r channel (valid if set)
    std::vector<bool> writeActive;
    std::vector<bool> readActive;
    WriteController::Outcome writeOutcome{WriteController::Outcome::Idle};
    ReadController::Outcome readOutcome{ReadController::Outcome::Idle};

    //! b handshake completed this cycle
    bool writeResponseTaken(const Inputs &in) const {
      return writeResponse && in.writeResponseReady;
    }
    //! r handshake completed this cycle
    bool readResponseTaken(const Inputs &in) const {
      return readResponse && in.readResponseReady;
    }
  };

  /* ------ Public methods ------ */
  /**
   * @brief RegisterFileController Constructor. Throws std::invalid_argument
   * if the configuration is malformed.
   */
  explicit RegisterFileController(const RegisterFileConfig &config);

  RegisterFileController(const RegisterFileController &) = delete;
  RegisterFileController &operator=(const RegisterFileController &) = delete;

  /**
   * @brief step Evaluate one clock cycle and commit it.
   * @param in inputs sampled at this edge
   * @retval outputs observed during this cycle
   */
  Outputs step(const Inputs &in);

  /**
   * @brief reset Registers to reset values, response buffers emptied.
   */
  void reset();

  const RegisterFileConfig &config() const { return m_config; }
  const RegisterStorage &storage() const { return m_storage; }
  const AddressDecoder &decoder() const { return m_decoder; }

  /**
   * @brief backdoorWrite Write registers outside the bus, read-only bytes
   * included. Used for debug access between steps.
   */
  void backdoorWrite(const RegisterStorage::Loads &loads) {
    m_storage.update(loads);
  }

  //! Number of steps since construction or reset
  uint64_t cycle() const { return m_cycle; }

  friend std::ostream &operator<<(std::ostream &os,
                                  const RegisterFileController &rhs);

 private:
  /* ------ Private variables ------ */
  const RegisterFileConfig m_config;
  const AddressDecoder m_decoder;
  RegisterStorage m_storage;
  const WriteController m_writeController;
  const ReadController m_readController;
  SkidBuffer<WriteResponse> m_writeResponses;
  SkidBuffer<ReadResponse> m_readResponses;
  uint64_t m_cycle{0};

  /* ------ Private methods ------ */
  /**
   * @brief checkReadOnly verify no read-only byte is committed without a
   * direct load. Throws std::logic_error on violation.
   */
  void checkReadOnly(const WriteController::Decision &wd) const;

  static const RegisterFileConfig &validated(const RegisterFileConfig &config);
};

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
 * @brief The WriteController class Write-path policy of the register file.
 *
 * Evaluated once per cycle from the committed register state. Direct loads
 * always take effect, read-only bytes included. A bus write is only
 * considered when the response buffer can take its response, and is stalled
 * (not accepted) while any byte of its target chunk is under direct load.
 * Nothing here mutates state: the returned Decision is committed by the
 * caller at the tick.
 */
class WriteController {
 public:
  /* ------ Types ------ */
  //! What happened to the bus write this cycle
  enum class Outcome {
    Idle,                //! No write request
    NotReady,            //! Response buffer full, request not accepted
    LoadConflictStall,   //! Target chunk under direct load, not accepted
    ProtectionError,     //! SLAVE_ERROR, protection gate failed
    DecodeError,         //! SLAVE_ERROR, address outside every chunk
    ReadOnlyChunkError,  //! SLAVE_ERROR, every byte of the chunk read-only
    Accepted             //! OK
  };

  struct Decision {
    RegisterStorage::Loads next;            //! Values to commit at the tick
    std::vector<bool> loaded;               //! Byte under direct load
    std::vector<bool> writeActive;          //! Byte targeted by the bus
    bool accepted{false};                   //! aw/w handshake completes
    std::optional<WriteResponse> response;  //! Enqueued iff accepted
    Outcome outcome{Outcome::Idle};
  };

  /* ------ Public methods ------ */
  /**
   * @brief WriteController Constructor
   * @param config validated configuration, must outlive this object
   * @param decoder chunk decoder, must outlive this object
   */
  WriteController(const RegisterFileConfig &config,
                  const AddressDecoder &decoder);

  /**
   * @brief evaluate Compute this cycle's write-path decision.
   * @param regs committed register state
   * @param load direct-load vector; empty vectors mean no loads
   * @param req pending write request, if any
   * @param responseReady the write response buffer can take a value
   */
  Decision evaluate(const RegisterStorage &regs, const DirectLoad &load,
                    const std::optional<WriteRequest> &req,
                    const bool responseReady) const;

  /**
   * @brief chunkReadOnly true if every in-range byte of a chunk is read-only
   */
  bool chunkReadOnly(const size_t chunk) const {
    return m_chunkReadOnly.at(chunk);
  }

 private:
  const RegisterFileConfig &m_config;
  const AddressDecoder &m_decoder;
  std::vector<bool> m_chunkReadOnly;
};

const char *toString(const WriteController::Outcome outcome);

/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdint.h>
#include <iostream>
#include <vector>
#include "csr/BusTypes.hpp"

/**
 * @brief The RegisterFileConfig struct Static construction parameters of a
 * register-file controller. Immutable once the controller is built.
 */
struct RegisterFileConfig {
  size_t numBytes{0};             //! Register array size (N)
  size_t dataWidthBytes{4};       //! Data channel width in bytes (W)
  unsigned addressWidth{32};      //! Bus address width in bits
  std::vector<bool> readOnly;     //! Per-byte read-only mask
  std::vector<uint8_t> resetValues;  //! Per-byte reset values
  bool privilegedOnly{false};     //! Reject unprivileged requests
  bool secureOnly{false};         //! Reject non-secure requests

  RegisterFileConfig() = default;

  /**
   * @brief RegisterFileConfig All bytes writable, reset to zero.
   */
  RegisterFileConfig(const size_t numBytes_, const size_t dataWidthBytes_,
                     const unsigned addressWidth_ = 32)
      : numBytes(numBytes_),
        dataWidthBytes(dataWidthBytes_),
        addressWidth(addressWidth_),
        readOnly(numBytes_, false),
        resetValues(numBytes_, 0) {}

  /**
   * @brief numChunks number of W-byte chunks covering the array.
   */
  size_t numChunks() const {
    return (numBytes + dataWidthBytes - 1) / dataWidthBytes;
  }

  /**
   * @brief validate Check the parameters. Throws std::invalid_argument
   * describing the first violation found.
   */
  void validate() const;

  /**
   * @brief protectionAllows Apply the protection gate to a request.
   */
  bool protectionAllows(const ProtectionAttributes &prot) const {
    return (!privilegedOnly || prot.privileged) &&
           (!secureOnly || !prot.nonSecure);
  }

  /**
   * @brief maskAddress drop address bits above the bus address width.
   */
  uint64_t maskAddress(const uint64_t addr) const {
    if (addressWidth >= REGBANK_MAX_ADDRESS_WIDTH) {
      return addr;
    }
    return addr & ((uint64_t(1) << addressWidth) - 1);
  }

  /**
   * @brief minAddressWidth ceil(log2(N)).
   */
  static unsigned minAddressWidth(const size_t numBytes);

  /**
   * @brief fromConfig Build from the global Config store.
   */
  static RegisterFileConfig fromConfig();

  friend std::ostream &operator<<(std::ostream &os,
                                  const RegisterFileConfig &rhs);
};

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
#include "include/regbank.h"

/**
 * @brief Response status reported on the write and read response channels.
 */
enum class BusResponse { OK, SLAVE_ERROR };

/**
 * @brief ProtectionAttributes Protection bits carried by a request.
 */
struct ProtectionAttributes {
  bool privileged{false};
  bool nonSecure{false};
  bool instruction{false};

  ProtectionAttributes() = default;
  ProtectionAttributes(const bool privileged_, const bool nonSecure_,
                       const bool instruction_ = false)
      : privileged(privileged_),
        nonSecure(nonSecure_),
        instruction(instruction_) {}

  /**
   * @brief fromBits decode AxPROT-style bits.
   */
  static ProtectionAttributes fromBits(const unsigned bits) {
    return ProtectionAttributes(bits & REGBANK_PROT_PRIVILEGED,
                                bits & REGBANK_PROT_NONSECURE,
                                bits & REGBANK_PROT_INSTRUCTION);
  }

  unsigned toBits() const {
    return (privileged ? REGBANK_PROT_PRIVILEGED : 0) |
           (nonSecure ? REGBANK_PROT_NONSECURE : 0) |
           (instruction ? REGBANK_PROT_INSTRUCTION : 0);
  }
};

//! Write address + write data, presented jointly
struct WriteRequest {
  uint64_t address{0};
  ProtectionAttributes prot{};
  std::vector<uint8_t> data;  //! One byte per lane
  std::vector<bool> strobe;   //! One strobe per lane
};

//! Read address
struct ReadRequest {
  uint64_t address{0};
  ProtectionAttributes prot{};
};

struct WriteResponse {
  BusResponse resp{BusResponse::OK};
};

struct ReadResponse {
  BusResponse resp{BusResponse::OK};
  std::vector<uint8_t> data;  //! One byte per lane
};

/**
 * @brief DirectLoad per-byte out-of-band load vector, sampled every cycle.
 */
struct DirectLoad {
  std::vector<uint8_t> value;
  std::vector<bool> enable;

  DirectLoad() = default;
  explicit DirectLoad(const size_t numBytes)
      : value(numBytes, 0), enable(numBytes, false) {}

  void set(const size_t index, const uint8_t v) {
    value.at(index) = v;
    enable.at(index) = true;
  }

  void clear(const size_t index) { enable.at(index) = false; }
};

std::ostream &operator<<(std::ostream &os, const BusResponse &rhs);
std::ostream &operator<<(std::ostream &os, const WriteRequest &rhs);
std::ostream &operator<<(std::ostream &os, const ReadRequest &rhs);
std::ostream &operator<<(std::ostream &os, const ReadResponse &rhs);

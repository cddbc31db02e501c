/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdint.h>
#include <iostream>
#include <map>
#include <vector>
#include "csr/RegisterFileConfig.hpp"

/**
 * @brief The RegisterStorage class Array of independently loadable byte
 * registers, each with a static read-only flag and reset value.
 *
 * Storage does not enforce read-only itself: bus writes are filtered by the
 * write controller, direct loads are allowed to reach read-only cells.
 */
class RegisterStorage {
 public:
  /* ------ Types ------ */
  //! One byte register
  struct Register {
    uint8_t val;               //! Value held in register
    const uint8_t resetValue;  //! Reset value
    const bool readOnly;       //! Not writable from the bus

    Register(const uint8_t resetValue_, const bool readOnly_)
        : val(resetValue_), resetValue(resetValue_), readOnly(readOnly_) {}

    void reset() { val = resetValue; }
  };

  //! Index -> next value, committed at the next tick
  using Loads = std::map<size_t, uint8_t>;

  /* ------ Public methods ------ */
  /**
   * @brief RegisterStorage Constructor, registers start at their reset values
   * @param config validated controller configuration
   */
  explicit RegisterStorage(const RegisterFileConfig &config);

  /**
   * @brief reset reset all register values to their reset values.
   */
  void reset() {
    for (auto &r : m_regs) {
      r.reset();
    }
  }

  /**
   * @brief update Commit the given values, all other registers keep theirs.
   * @param loads index -> value
   */
  void update(const Loads &loads);

  /**
   * @brief read Read a single register.
   */
  uint8_t read(const size_t index) const { return find(index).val; }

  bool isReadOnly(const size_t index) const { return find(index).readOnly; }

  uint8_t resetValue(const size_t index) const {
    return find(index).resetValue;
  }

  /**
   * @brief size Return number of registers
   */
  size_t size() const { return m_regs.size(); }

  /**
   * @brief snapshot copy of all register values.
   */
  std::vector<uint8_t> snapshot() const;

  /**
   * @brief << debug printout.
   */
  friend std::ostream &operator<<(std::ostream &os, const RegisterStorage &rhs);

 private:
  const Register &find(const size_t index) const;

  /* ------ Private variables ------ */
  std::vector<Register> m_regs;  //! Registers
};

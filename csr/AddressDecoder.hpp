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

/**
 * @brief The AddressDecoder class Maps an address onto one entry of a static
 * table of half-open address ranges.
 */
class AddressDecoder {
 public:
  /* ------ Types ------ */
  //! One entry of the range table, covers [start, end)
  struct Range {
    size_t index;
    uint64_t start;
    uint64_t end;
  };

  //! Decode result. index is meaningless when valid is false.
  struct Result {
    size_t index{0};
    bool valid{false};
  };

  /* ------ Public methods ------ */
  /**
   * @brief AddressDecoder Constructor. Throws std::invalid_argument if a
   * range is empty or two ranges overlap.
   * @param ranges range table
   */
  explicit AddressDecoder(std::vector<Range> ranges);

  /**
   * @brief forChunks build the table for numChunks consecutive chunks of
   * width bytes, starting at address 0.
   */
  static AddressDecoder forChunks(const size_t numChunks, const size_t width);

  /**
   * @brief decode find the range containing addr.
   */
  Result decode(const uint64_t addr) const;

  const std::vector<Range> &ranges() const { return m_ranges; }

  friend std::ostream &operator<<(std::ostream &os, const AddressDecoder &rhs);

 private:
  std::vector<Range> m_ranges;  //! Sorted by start address
};

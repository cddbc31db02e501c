/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include "csr/AddressDecoder.hpp"

AddressDecoder::AddressDecoder(std::vector<Range> ranges)
    : m_ranges(std::move(ranges)) {
  std::sort(m_ranges.begin(), m_ranges.end(),
            [](const Range &a, const Range &b) { return a.start < b.start; });

  for (size_t i = 0; i < m_ranges.size(); i++) {
    if (m_ranges[i].start >= m_ranges[i].end) {
      throw std::invalid_argument("AddressDecoder: range " +
                                  std::to_string(m_ranges[i].index) +
                                  " is empty");
    }
    if (i > 0 && m_ranges[i].start < m_ranges[i - 1].end) {
      throw std::invalid_argument(
          "AddressDecoder: ranges " + std::to_string(m_ranges[i - 1].index) +
          " and " + std::to_string(m_ranges[i].index) + " overlap");
    }
  }
}

AddressDecoder AddressDecoder::forChunks(const size_t numChunks,
                                         const size_t width) {
  std::vector<Range> ranges;
  ranges.reserve(numChunks);
  for (size_t i = 0; i < numChunks; i++) {
    ranges.push_back(Range{i, i * width, (i + 1) * width});
  }
  return AddressDecoder(std::move(ranges));
}

AddressDecoder::Result AddressDecoder::decode(const uint64_t addr) const {
  // First range ending after addr
  auto it = std::upper_bound(
      m_ranges.begin(), m_ranges.end(), addr,
      [](const uint64_t a, const Range &r) { return a < r.end; });
  if (it == m_ranges.end() || addr < it->start) {
    return Result{};
  }
  return Result{it->index, true};
}

std::ostream &operator<<(std::ostream &os, const AddressDecoder &rhs) {
  os << "<AddressDecoder>";
  for (const auto &r : rhs.m_ranges) {
    os << "\n  " << r.index << ": [0x" << std::hex << r.start << ", 0x"
       << r.end << ")" << std::dec;
  }
  return os;
}

/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <spdlog/spdlog.h>
#include <iomanip>
#include <stdexcept>
#include <string>
#include "csr/RegisterStorage.hpp"

RegisterStorage::RegisterStorage(const RegisterFileConfig &config) {
  config.validate();
  m_regs.reserve(config.numBytes);
  for (size_t i = 0; i < config.numBytes; i++) {
    m_regs.emplace_back(config.resetValues[i], config.readOnly[i]);
  }
}

void RegisterStorage::update(const Loads &loads) {
  // Check everything before touching anything
  if (!loads.empty() && loads.rbegin()->first >= m_regs.size()) {
    spdlog::error("RegisterStorage::update Index {} not found.",
                  loads.rbegin()->first);
    throw std::out_of_range("RegisterStorage::update index " +
                            std::to_string(loads.rbegin()->first));
  }
  for (const auto &l : loads) {
    m_regs[l.first].val = l.second;
  }
}

std::vector<uint8_t> RegisterStorage::snapshot() const {
  std::vector<uint8_t> values;
  values.reserve(m_regs.size());
  for (const auto &r : m_regs) {
    values.push_back(r.val);
  }
  return values;
}

const RegisterStorage::Register &RegisterStorage::find(
    const size_t index) const {
  if (index >= m_regs.size()) {
    spdlog::error("RegisterStorage::find Index {} not found.", index);
    throw std::out_of_range("RegisterStorage index " + std::to_string(index));
  }
  return m_regs[index];
}

std::ostream &operator<<(std::ostream &os, const RegisterStorage &rhs) {
  os << "<RegisterStorage> " << rhs.size() << " bytes";
  for (size_t i = 0; i < rhs.m_regs.size(); i++) {
    const auto &r = rhs.m_regs[i];
    os << "\n  [" << std::dec << i << "] 0x" << std::hex << std::setw(2)
       << std::setfill('0') << static_cast<unsigned>(r.val)
       << (r.readOnly ? " (RO)" : "") << std::dec << std::setfill(' ');
  }
  return os;
}

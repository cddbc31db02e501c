/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdexcept>
#include <string>
#include "csr/RegisterFileConfig.hpp"
#include "utilities/Config.hpp"

unsigned RegisterFileConfig::minAddressWidth(const size_t numBytes) {
  unsigned width = 0;
  while (width < REGBANK_MAX_ADDRESS_WIDTH && (size_t(1) << width) < numBytes) {
    width++;
  }
  return width;
}

void RegisterFileConfig::validate() const {
  if (numBytes == 0) {
    throw std::invalid_argument("RegisterFileConfig: register array is empty");
  }
  if (dataWidthBytes == 0 || (dataWidthBytes & (dataWidthBytes - 1)) != 0) {
    throw std::invalid_argument(
        "RegisterFileConfig: data width must be a power of two, got " +
        std::to_string(dataWidthBytes) + " bytes");
  }
  if (addressWidth > REGBANK_MAX_ADDRESS_WIDTH) {
    throw std::invalid_argument(
        "RegisterFileConfig: address width " + std::to_string(addressWidth) +
        " exceeds " + std::to_string(REGBANK_MAX_ADDRESS_WIDTH) + " bits");
  }
  if (addressWidth < minAddressWidth(numBytes)) {
    throw std::invalid_argument(
        "RegisterFileConfig: address width " + std::to_string(addressWidth) +
        " too narrow for " + std::to_string(numBytes) + " bytes (need " +
        std::to_string(minAddressWidth(numBytes)) + ")");
  }
  if (readOnly.size() != numBytes) {
    throw std::invalid_argument(
        "RegisterFileConfig: read-only mask has " +
        std::to_string(readOnly.size()) + " entries, expected " +
        std::to_string(numBytes));
  }
  if (resetValues.size() != numBytes) {
    throw std::invalid_argument(
        "RegisterFileConfig: reset values have " +
        std::to_string(resetValues.size()) + " entries, expected " +
        std::to_string(numBytes));
  }
}

RegisterFileConfig RegisterFileConfig::fromConfig() {
  const auto &config = Config::get();
  RegisterFileConfig c(config.getUint("NumBytes"),
                       config.getUint("DataWidthBytes"),
                       config.getUint("AddressWidth"));
  // Sizes first, the lists below are bounded by numBytes
  c.validate();

  if (config.contains("ReadOnlyBytes")) {
    // Bounded by the array size before any range is expanded
    for (const auto idx : config.getUintList("ReadOnlyBytes", c.numBytes)) {
      c.readOnly[idx] = true;
    }
  }

  if (config.contains("ResetValues")) {
    const auto values = config.getUintList("ResetValues", 0x100);
    c.resetValues.clear();
    for (const auto v : values) {
      c.resetValues.push_back(static_cast<uint8_t>(v));
    }
    if (c.resetValues.size() == 1) {
      // A single value applies to every byte
      c.resetValues.assign(c.numBytes, c.resetValues[0]);
    }
  }

  if (config.contains("PrivilegedOnly")) {
    c.privilegedOnly = config.getBool("PrivilegedOnly");
  }
  if (config.contains("SecureOnly")) {
    c.secureOnly = config.getBool("SecureOnly");
  }

  c.validate();
  return c;
}

std::ostream &operator<<(std::ostream &os, const RegisterFileConfig &rhs) {
  size_t nReadOnly = 0;
  for (const bool ro : rhs.readOnly) {
    nReadOnly += ro;
  }
  os << "<RegisterFileConfig> " << rhs.numBytes << " bytes, "
     << rhs.dataWidthBytes << "-byte lanes, " << rhs.numChunks()
     << " chunks, " << rhs.addressWidth << "-bit address, " << nReadOnly
     << " read-only bytes"
     << (rhs.privilegedOnly ? ", privileged only" : "")
     << (rhs.secureOnly ? ", secure only" : "");
  return os;
}

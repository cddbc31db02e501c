/*
 * Copyright (c) 2019-2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iomanip>
#include "csr/BusTypes.hpp"

namespace {
void printLanes(std::ostream &os, const std::vector<uint8_t> &data) {
  os << std::hex << std::setfill('0');
  for (size_t i = 0; i < data.size(); i++) {
    os << (i ? " " : "") << std::setw(2) << static_cast<unsigned>(data[i]);
  }
  os << std::dec << std::setfill(' ');
}
}  // namespace

std::ostream &operator<<(std::ostream &os, const BusResponse &rhs) {
  os << (rhs == BusResponse::OK ? "OK" : "SLAVE_ERROR");
  return os;
}

std::ostream &operator<<(std::ostream &os, const WriteRequest &rhs) {
  os << "<WriteRequest> @0x" << std::hex << rhs.address << std::dec
     << " prot=" << rhs.prot.toBits() << " data=[";
  printLanes(os, rhs.data);
  os << "] strobe=";
  for (size_t i = 0; i < rhs.strobe.size(); i++) {
    os << (rhs.strobe[i] ? '1' : '0');
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const ReadRequest &rhs) {
  os << "<ReadRequest> @0x" << std::hex << rhs.address << std::dec
     << " prot=" << rhs.prot.toBits();
  return os;
}

std::ostream &operator<<(std::ostream &os, const ReadResponse &rhs) {
  os << "<ReadResponse> " << rhs.resp << " data=[";
  printLanes(os, rhs.data);
  os << "]";
  return os;
}

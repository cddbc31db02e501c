/*
 * Copyright (c) 2020, University of Southampton and Contributors.
 * All rights reserved.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <systemc>
#include <tlm>
#include "csr/BusTypes.hpp"

/**
 * @brief Protection attributes of a bus transaction. Payloads without this
 * extension are treated as unprivileged, secure data accesses.
 */
struct ProtectionExtension : public tlm::tlm_extension<ProtectionExtension> {
 public:
  /* ------ Public variables ------ */
  ProtectionAttributes prot{};

 public:
  /* ------ Public methods ------ */
  ProtectionExtension(void) = default;

  explicit ProtectionExtension(const ProtectionAttributes &prot_)
      : prot(prot_) {}

  /**
   * @brief of Protection attributes of a payload, defaults if none attached.
   */
  static ProtectionAttributes of(const tlm::tlm_generic_payload &trans) {
    const auto *ext = trans.get_extension<ProtectionExtension>();
    return ext ? ext->prot : ProtectionAttributes{};
  }

  /**
   * Mandatory function for tlm payload extensions
   */
  virtual tlm::tlm_extension_base *clone() const override {
    return new ProtectionExtension(prot);
  }

  /**
   * Mandatory function for tlm payload extensions
   */
  virtual void copy_from(const tlm::tlm_extension_base &ext) override {
    prot = static_cast<const ProtectionExtension &>(ext).prot;
  }

  /**
   * @brief << debug printout.
   */
  friend std::ostream &operator<<(std::ostream &os,
                                  const ProtectionExtension &rhs) {
    os << "<ProtectionExtension>: privileged " << rhs.prot.privileged
       << ", non-secure " << rhs.prot.nonSecure << ", instruction "
       << rhs.prot.instruction;
    return os;
  }
};

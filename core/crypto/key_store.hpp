/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "crypto/sr25519_types.hpp"

namespace vigil::crypto {

  /**
   * Local keys of the node. Approval voting only hands it over to the
   * assignment criteria, which look up the node's assignment keys in it.
   */
  class KeyStore {
   public:
    virtual ~KeyStore() = default;

    /// Public parts of all assignment keys held locally
    virtual std::vector<Sr25519PublicKey> getAssignmentKeys() const = 0;
  };

}  // namespace vigil::crypto

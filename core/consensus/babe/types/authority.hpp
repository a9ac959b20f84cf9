/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include "crypto/sr25519_types.hpp"

namespace vigil::consensus::babe {

  using AuthorityId = crypto::Sr25519PublicKey;

  using AuthorityWeight = uint64_t;

  /// Position of the block author in the epoch authority list
  using AuthorityIndex = uint32_t;

  struct Authority {
    AuthorityId id;
    AuthorityWeight weight{};
    bool operator==(const Authority &other) const = default;
  };

  using Authorities = std::vector<Authority>;

}  // namespace vigil::consensus::babe

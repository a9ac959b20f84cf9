/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"
#include "crypto/sr25519_types.hpp"

namespace vigil::consensus {

  /// slot number of the block production
  using SlotNumber = uint64_t;

  /// number of the epoch in the block production
  using EpochNumber = uint64_t;

  /// random value, which serves as a seed for VRF slot leadership selection
  using Randomness = common::Blob<crypto::constants::sr25519::vrf::OUTPUT_SIZE>;

}  // namespace vigil::consensus

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/authority.hpp"
#include "consensus/timeline/types.hpp"

namespace vigil::consensus::babe {

  /**
   * BABE epoch as reported by the runtime at a given block
   */
  struct Epoch {
    /// the epoch index
    EpochNumber epoch_index{};

    /// starting slot of the epoch
    SlotNumber start_slot{};

    /// duration of the epoch (number of slots it takes)
    SlotNumber duration{};

    /// authorities of the epoch with their weights
    Authorities authorities;

    /// randomness of the epoch
    Randomness randomness{};

    bool operator==(const Epoch &) const = default;
  };

}  // namespace vigil::consensus::babe

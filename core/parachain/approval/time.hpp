/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/timeline/types.hpp"
#include "parachain/types.hpp"

namespace vigil::parachain::approval {

  /// Duration of one approval tick
  constexpr uint64_t kTickDurationMs = 500ull;

  /// assumes `slot_duration_millis` evenly divided by tick duration.
  constexpr Tick slotNumberToTick(uint64_t slot_duration_millis,
                                  consensus::SlotNumber slot) {
    const auto ticks_per_slot = slot_duration_millis / kTickDurationMs;
    return slot * ticks_per_slot;
  }

}  // namespace vigil::parachain::approval

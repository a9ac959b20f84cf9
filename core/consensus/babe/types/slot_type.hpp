/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <scale/enum_traits.hpp>

namespace vigil::consensus::babe {

  /// How the author of a block obtained the right to produce it
  enum class SlotType : uint8_t {
    /// VRF lottery win
    Primary = 1,
    /// Round-robin secondary slot without VRF output
    SecondaryPlain = 2,
    /// Round-robin secondary slot carrying a VRF output
    SecondaryVRF = 3,
  };

}  // namespace vigil::consensus::babe

SCALE_DEFINE_ENUM_VALUE_RANGE(vigil::consensus::babe,
                              SlotType,
                              vigil::consensus::babe::SlotType::Primary,
                              vigil::consensus::babe::SlotType::SecondaryVRF);

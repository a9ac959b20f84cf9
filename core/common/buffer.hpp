/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace vigil::common {

  /// Owning byte sequence, SCALE-encoded as a length-prefixed collection
  using Buffer = std::vector<uint8_t>;

  /// Non-owning view over bytes
  using BufferView = std::span<const uint8_t>;

}  // namespace vigil::common

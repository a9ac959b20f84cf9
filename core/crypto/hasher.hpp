/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace vigil::crypto {
  class Hasher {
   protected:
    using Hash256 = common::Hash256;

   public:
    virtual ~Hasher() = default;

    /**
     * @brief blake2b_256 function calculates 32-byte blake2b hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 blake2b_256(common::BufferView data) const = 0;
  };
}  // namespace vigil::crypto

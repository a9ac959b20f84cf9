/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/hasher.hpp"

namespace vigil::crypto {

  class HasherMock : public Hasher {
   public:
    MOCK_METHOD(Hash256, blake2b_256, (common::BufferView), (const, override));
  };

}  // namespace vigil::crypto

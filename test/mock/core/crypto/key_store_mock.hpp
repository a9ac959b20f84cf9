/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/key_store.hpp"

namespace vigil::crypto {

  class KeyStoreMock : public KeyStore {
   public:
    MOCK_METHOD(std::vector<Sr25519PublicKey>,
                getAssignmentKeys,
                (),
                (const, override));
  };

}  // namespace vigil::crypto

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/vrf_provider.hpp"

namespace vigil::crypto {

  class VRFProviderMock : public VRFProvider {
   public:
    MOCK_METHOD(outcome::result<VRFStory>,
                computeRelayVrfStory,
                (const Sr25519PublicKey &,
                 const VRFOutput &,
                 const consensus::Randomness &,
                 consensus::SlotNumber,
                 consensus::EpochNumber),
                (const, override));
  };

}  // namespace vigil::crypto

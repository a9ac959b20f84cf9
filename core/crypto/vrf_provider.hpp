/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/authority.hpp"
#include "consensus/timeline/types.hpp"
#include "crypto/sr25519_types.hpp"
#include "outcome/outcome.hpp"

namespace vigil::crypto {

  /// 32 bytes extracted from a block author's VRF output
  using VRFStory = common::Blob<32>;

  /**
   * sr25519 VRF operations over the BABE transcript
   */
  class VRFProvider {
   public:
    virtual ~VRFProvider() = default;

    /**
     * Re-creates the BABE transcript of the given slot, attaches the author's
     * VRF output to it and extracts the relay VRF story bytes
     * @param author public key of the block author
     * @param vrf_output VRF output from the BABE pre-digest
     * @param randomness epoch randomness
     * @param slot slot the block was authored in
     * @param epoch epoch index
     * @return story bytes, or an error if the output doesn't verify against
     * the transcript
     */
    virtual outcome::result<VRFStory> computeRelayVrfStory(
        const Sr25519PublicKey &author,
        const VRFOutput &vrf_output,
        const consensus::Randomness &randomness,
        consensus::SlotNumber slot,
        consensus::EpochNumber epoch) const = 0;
  };

}  // namespace vigil::crypto

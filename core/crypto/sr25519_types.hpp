/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>

#include "common/blob.hpp"

namespace vigil::crypto {
  namespace constants::sr25519 {
    enum {
      PUBLIC_SIZE = 32,
      SIGNATURE_SIZE = 64,
    };

    namespace vrf {
      enum {
        PROOF_SIZE = 64,
        OUTPUT_SIZE = 32,
      };
    }  // namespace vrf
  }  // namespace constants::sr25519

  using Sr25519PublicKey = common::Blob<constants::sr25519::PUBLIC_SIZE>;

  using VRFPreOutput =
      std::array<uint8_t, constants::sr25519::vrf::OUTPUT_SIZE>;
  using VRFProof = std::array<uint8_t, constants::sr25519::vrf::PROOF_SIZE>;

  /**
   * Output of a verifiable random function.
   * Consists of pre-output, which is an internal representation of the
   * generated random value, and the proof to this value.
   */
  struct VRFOutput {
    // an internal representation of the generated random value
    VRFPreOutput output{};
    // the proof to the output, serves as the verification of its randomness
    VRFProof proof{};

    bool operator==(const VRFOutput &) const = default;
  };

}  // namespace vigil::crypto

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/blob.hpp"
#include "crypto/sr25519_types.hpp"
#include "primitives/common.hpp"

namespace vigil::parachain {

  using Hash = common::Hash256;
  using Signature = common::Blob<crypto::constants::sr25519::SIGNATURE_SIZE>;
  using ParachainId = uint32_t;
  using CollatorPublicKey = crypto::Sr25519PublicKey;
  using ValidatorIndex = uint32_t;
  using ValidatorId = crypto::Sr25519PublicKey;
  using CandidateHash = Hash;
  using CandidateIndex = uint32_t;
  using CoreIndex = uint32_t;
  using GroupIndex = uint32_t;
  using BlockNumber = primitives::BlockNumber;
  using SessionIndex = uint32_t;
  using Tick = uint64_t;

  /// Validators assigning to check a particular candidate are split up into
  /// tranches. Earlier tranches of validators check first, with later tranches
  /// serving as backup.
  using DelayTranche = uint32_t;

  /**
   * Unique descriptor of a candidate receipt.
   */
  struct CandidateDescriptor {
    /// Parachain Id
    ParachainId para_id{};
    /// Hash of the relay chain block the candidate is executed in the context
    /// of
    primitives::BlockHash relay_parent;
    /// Collators public key
    CollatorPublicKey collator_id;
    /// Hash of the persisted validation data
    primitives::BlockHash persisted_data_hash;
    /// Hash of the PoV block
    primitives::BlockHash pov_hash;
    /// Root of the block's erasure encoding Merkle tree
    common::Hash256 erasure_encoding_root;
    /// Collator signature of the concatenated components
    Signature signature;
    /// Hash of the parachain head data of this candidate
    primitives::BlockHash para_head_hash;
    /// Hash of the parachain Runtime
    primitives::BlockHash validation_code_hash;

    bool operator==(const CandidateDescriptor &) const = default;
  };

  /// A receipt of a parachain candidate; its SCALE-encoding hashes to the
  /// candidate hash
  struct CandidateReceipt {
    CandidateDescriptor descriptor;
    Hash commitments_hash;

    bool operator==(const CandidateReceipt &) const = default;
  };

}  // namespace vigil::parachain

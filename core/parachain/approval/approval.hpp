/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <functional>
#include <vector>

#include <boost/variant.hpp>
#include <scale/bitvec.hpp>

#include "consensus/babe/types/authority.hpp"
#include "consensus/timeline/types.hpp"
#include "crypto/sr25519_types.hpp"
#include "crypto/vrf_provider.hpp"
#include "outcome/outcome.hpp"
#include "parachain/types.hpp"

namespace vigil::parachain::approval {

  /// An assignment story based on the VRF that authorized the relay-chain block
  /// where the candidate was included combined with a sample number.
  struct RelayVRFModulo {
    uint32_t sample;  /// The sample number used in this cert.

    bool operator==(const RelayVRFModulo &) const = default;
  };

  /// An assignment story based on the VRF that authorized the relay-chain block
  /// where the candidate was included combined with the index of a particular
  /// core.
  struct RelayVRFDelay {
    CoreIndex core_index;  /// The core index chosen in this cert.

    bool operator==(const RelayVRFDelay &) const = default;
  };

  /// Random bytes derived from the VRF submitted within the block by the
  /// block author as a credential and used as input to approval assignment
  /// criteria.
  struct RelayVRFStory {
    common::Blob<32> data;

    bool operator==(const RelayVRFStory &) const = default;
  };

  /// Different kinds of input data or criteria that can prove a validator's
  /// assignment to check a particular parachain.
  using AssignmentCertKind = boost::variant<RelayVRFModulo, RelayVRFDelay>;

  /// A certification of assignment.
  struct AssignmentCert {
    /// The criterion which is claimed to be met by this cert.
    AssignmentCertKind kind;
    /// The VRF showing the criterion is met.
    crypto::VRFOutput vrf;

    bool operator==(const AssignmentCert &) const = default;
  };

  /// Assignment of the local validator to check a candidate
  struct OurAssignment {
    AssignmentCert cert;
    DelayTranche tranche;
    ValidatorIndex validator_index;
    /// Whether the assignment has been triggered already.
    bool triggered;

    bool operator==(const OurAssignment &) const = default;
  };

  /// Metadata about a block which is now live in the approval protocol.
  struct BlockApprovalMeta {
    primitives::BlockHash hash;         /// The hash of the block.
    primitives::BlockNumber number;     /// The number of the block.
    primitives::BlockHash parent_hash;  /// The hash of the parent block.
    /// The candidates included by the block. Note that these are not the same
    /// as the candidates that appear within the block body.
    std::vector<CandidateHash> candidates;
    consensus::SlotNumber slot;  /// The consensus slot of the block.
    SessionIndex session;        /// The session of the block.

    bool operator==(const BlockApprovalMeta &) const = default;
  };

  inline size_t count_ones(const scale::BitVec &v) {
    return static_cast<size_t>(
        std::count(v.bits.begin(), v.bits.end(), true));
  }

  /// An unsafe VRF output. Provide BABE Epoch info to create a `RelayVRFStory`.
  struct UnsafeVRFOutput {
    enum class Error { AuthorityOutOfBounds = 1, ComputeRandomnessFailed };

    std::reference_wrapper<const crypto::VRFOutput> vrf_output;
    consensus::SlotNumber slot;
    consensus::babe::AuthorityIndex authority_index;

    /// Get the slot.
    consensus::SlotNumber getSlot() const {
      return slot;
    }

    /// Compute the randomness associated with this VRF output.
    outcome::result<void> compute_randomness(
        RelayVRFStory &vrf_story,
        const consensus::babe::Authorities &authorities,
        const consensus::Randomness &randomness,
        consensus::EpochNumber epoch_index,
        const crypto::VRFProvider &vrf_provider) const;
  };

}  // namespace vigil::parachain::approval

OUTCOME_HPP_DECLARE_ERROR(vigil::parachain::approval, UnsafeVRFOutput::Error);

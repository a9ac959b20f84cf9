/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/variant.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "parachain/types.hpp"

namespace vigil::runtime {

  using Buffer = common::Buffer;
  using HeadData = Buffer;
  using CandidateReceipt = parachain::CandidateReceipt;
  using CoreIndex = parachain::CoreIndex;
  using GroupIndex = parachain::GroupIndex;
  using SessionIndex = parachain::SessionIndex;
  using ValidatorId = parachain::ValidatorId;
  using ValidatorIndex = parachain::ValidatorIndex;
  using AuthorityDiscoveryId = common::Hash256;
  using AssignmentId = common::Blob<32>;

  struct Candidate {
    CandidateReceipt candidate_receipt;
    HeadData head_data;
    CoreIndex core_index{};

    bool operator==(const Candidate &) const = default;
  };

  struct CandidateBacked : public Candidate {
    GroupIndex group_index{};

    bool operator==(const CandidateBacked &) const = default;
  };

  struct CandidateIncluded : public Candidate {
    GroupIndex group_index{};

    bool operator==(const CandidateIncluded &) const = default;
  };

  struct CandidateTimedOut : public Candidate {
    bool operator==(const CandidateTimedOut &) const = default;
  };

  using CandidateEvent = boost::variant<
      /// This candidate receipt was backed in the most recent block.
      CandidateBacked,  // 0
      /// This candidate receipt was included and became a parablock at the
      /// most recent block, together with the core it was occupying and the
      /// group responsible for backing it.
      CandidateIncluded,  // 1
      /// This candidate receipt was not made available in time and timed out.
      CandidateTimedOut  // 2
      >;

  /// Per-session validator metadata published by the runtime
  struct SessionInfo {
    /// All the validators actively participating in parachain consensus.
    std::vector<ValidatorIndex> active_validator_indices;
    /// A secure random seed for the session, gathered from BABE.
    common::Blob<32> random_seed;
    /// The amount of sessions to keep for disputes.
    SessionIndex dispute_period{};
    /// Validators in canonical ordering.
    std::vector<ValidatorId> validators;
    /// Validators' authority discovery keys for the session in canonical
    /// ordering.
    std::vector<AuthorityDiscoveryId> discovery_keys;
    /// The assignment keys for validators.
    std::vector<AssignmentId> assignment_keys;
    /// Validators in shuffled ordering, referred to by `GroupIndex`.
    std::vector<std::vector<ValidatorIndex>> validator_groups;
    /// The number of availability cores used by the protocol during this
    /// session.
    uint32_t n_cores{};
    /// The zeroth delay tranche width.
    uint32_t zeroth_delay_tranche_width{};
    /// The number of samples we do of `relay_vrf_modulo`.
    uint32_t relay_vrf_modulo_samples{};
    /// The number of delay tranches in total.
    uint32_t n_delay_tranches{};
    /// How many slots must pass before an assignment is considered a no-show.
    uint32_t no_show_slots{};
    /// The number of validators needed to approve a block.
    uint32_t needed_approvals{};

    bool operator==(const SessionInfo &) const = default;
  };

}  // namespace vigil::runtime

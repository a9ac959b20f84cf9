/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <scale/bitvec.hpp>

#include "consensus/timeline/types.hpp"
#include "parachain/approval/approval.hpp"
#include "parachain/types.hpp"

namespace vigil::parachain::approval {

  /// Metadata regarding a specific tranche of assignments for a specific
  /// candidate.
  struct TrancheEntry {
    DelayTranche tranche;
    // Assigned validators, and the instant we received their assignment,
    // rounded to the nearest tick.
    std::vector<std::pair<ValidatorIndex, Tick>> assignments;

    bool operator==(const TrancheEntry &) const = default;
  };

  /// Approval state of a candidate in the context of one including block
  struct ApprovalEntry {
    std::vector<TrancheEntry> tranches;
    GroupIndex backing_group;
    std::optional<OurAssignment> our_assignment;
    std::optional<Signature> our_approval_sig;
    // `n_validators` bits.
    scale::BitVec assignments;
    bool approved;

    ApprovalEntry(GroupIndex group_index,
                  std::optional<OurAssignment> assignment,
                  size_t assignments_size)
        : backing_group{group_index},
          our_assignment{std::move(assignment)},
          approved(false) {
      assignments.bits.insert(assignments.bits.end(), assignments_size, false);
    }

    /// Get the number of validators in this approval entry.
    auto n_validators() const {
      return assignments.bits.size();
    }

    bool operator==(const ApprovalEntry &) const = default;
  };

  struct CandidateEntry {
    CandidateReceipt candidate;
    SessionIndex session;
    // Assignments are based on blocks, so we need to track assignments
    // separately based on the block we are looking at.
    std::unordered_map<primitives::BlockHash, ApprovalEntry> block_assignments;
    // `n_validators` bits.
    scale::BitVec approvals;

    CandidateEntry(CandidateReceipt receipt,
                   SessionIndex session_index,
                   size_t approvals_size)
        : candidate(std::move(receipt)), session(session_index) {
      approvals.bits.insert(approvals.bits.end(), approvals_size, false);
    }

    std::optional<std::reference_wrapper<const ApprovalEntry>> approval_entry(
        const primitives::BlockHash &block_hash) const {
      if (auto it = block_assignments.find(block_hash);
          it != block_assignments.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    bool operator==(const CandidateEntry &) const = default;
  };

  /// Metadata regarding approval of a particular block, by way of approval of
  /// the candidates contained within it.
  struct BlockEntry {
    primitives::BlockHash block_hash;
    primitives::BlockHash parent_hash;
    primitives::BlockNumber block_number;
    SessionIndex session;
    consensus::SlotNumber slot;
    RelayVRFStory relay_vrf_story;

    // The candidates included as-of this block and the index of the core they
    // are leaving.
    std::vector<std::pair<CoreIndex, CandidateHash>> candidates;

    // A bitfield where the i'th bit corresponds to the i'th candidate in
    // `candidates`. The i'th bit is `true` iff the candidate has been
    // approved in the context of this block.
    scale::BitVec approved_bitfield;

    std::vector<primitives::BlockHash> children;

    bool operator==(const BlockEntry &) const = default;

    std::optional<CandidateIndex> candidate_index(
        const CandidateHash &candidate_hash) const {
      for (size_t ix = 0ul; ix < candidates.size(); ++ix) {
        if (candidates[ix].second == candidate_hash) {
          return CandidateIndex(ix);
        }
      }
      return std::nullopt;
    }

    /// Whether the block entry is fully approved.
    bool is_fully_approved() const {
      return count_ones(approved_bitfield) == approved_bitfield.bits.size();
    }
  };

  /// Information about a block and imported candidates.
  struct BlockImportedCandidates {
    primitives::BlockHash block_hash{};
    primitives::BlockNumber block_number{};
    Tick block_tick{};
    Tick no_show_duration{};
    std::vector<std::pair<CandidateHash, CandidateEntry>> imported_candidates{};
  };

}  // namespace vigil::parachain::approval

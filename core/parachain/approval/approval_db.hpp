/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "outcome/outcome.hpp"
#include "parachain/approval/approval_entries.hpp"

namespace vigil::parachain::approval {

  /// Everything needed to create or extend the entry of a newly included
  /// candidate
  struct NewCandidateInfo {
    CandidateReceipt candidate;
    GroupIndex backing_group;
    std::optional<OurAssignment> our_assignment;
  };

  using CandidateInfoFn =
      std::function<std::optional<NewCandidateInfo>(const CandidateHash &)>;

  /**
   * Read access to the approval database. Each read is atomic for a single
   * key and returns a copy of the stored value.
   */
  class ApprovalDbReader {
   public:
    virtual ~ApprovalDbReader() = default;

    virtual outcome::result<std::optional<BlockEntry>> load_block_entry(
        const primitives::BlockHash &block_hash) const = 0;

    virtual outcome::result<std::optional<CandidateEntry>> load_candidate_entry(
        const CandidateHash &candidate_hash) const = 0;

    virtual outcome::result<std::vector<primitives::BlockHash>>
    load_blocks_at_height(primitives::BlockNumber block_number) const = 0;
  };

  class ApprovalDbWriter {
   public:
    virtual ~ApprovalDbWriter() = default;

    /**
     * Records a newly imported block. Candidate entries are created or
     * extended with an approval entry for the block, then the parent (if
     * tracked) gets the block appended to its children, then the block entry
     * itself is written.
     * @param parent_hash parent of the block
     * @param number height of the block
     * @param entry block entry with empty children
     * @param n_validators size of the validator set of the block session
     * @param candidate_info supplies receipt, backing group and own assignment
     * per candidate of the entry; if it lacks any of them nothing is written
     * @return entries of all candidates of the block as stored after the
     * write; empty if the block is already tracked
     */
    virtual outcome::result<std::vector<std::pair<CandidateHash, CandidateEntry>>>
    add_block_entry(const primitives::BlockHash &parent_hash,
                    primitives::BlockNumber number,
                    BlockEntry entry,
                    size_t n_validators,
                    const CandidateInfoFn &candidate_info) = 0;
  };

  class ApprovalDb : public ApprovalDbReader, public ApprovalDbWriter {};

}  // namespace vigil::parachain::approval

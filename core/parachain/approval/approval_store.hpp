/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "log/logger.hpp"
#include "parachain/approval/approval_db.hpp"
#include "parachain/approval/store.hpp"

namespace vigil::parachain::approval {

  /**
   * In-memory approval database: block entries, candidate entries and the
   * blocks-at-height index
   */
  class ApprovalStore final : public ApprovalDb {
   public:
    ApprovalStore();

    outcome::result<std::optional<BlockEntry>> load_block_entry(
        const primitives::BlockHash &block_hash) const override;

    outcome::result<std::optional<CandidateEntry>> load_candidate_entry(
        const CandidateHash &candidate_hash) const override;

    outcome::result<std::vector<primitives::BlockHash>> load_blocks_at_height(
        primitives::BlockNumber block_number) const override;

    outcome::result<std::vector<std::pair<CandidateHash, CandidateEntry>>>
    add_block_entry(const primitives::BlockHash &parent_hash,
                    primitives::BlockNumber number,
                    BlockEntry entry,
                    size_t n_validators,
                    const CandidateInfoFn &candidate_info) override;

   private:
    using BlockEntries = StorePair<primitives::BlockHash, BlockEntry>;
    using CandidateEntries = StorePair<CandidateHash, CandidateEntry>;
    using BlocksAtHeight =
        StorePair<primitives::BlockNumber, std::vector<primitives::BlockHash>>;

    auto &storedBlockEntries() {
      return as<BlockEntries>(store_);
    }
    const auto &storedBlockEntries() const {
      return as<BlockEntries>(store_);
    }

    auto &storedCandidateEntries() {
      return as<CandidateEntries>(store_);
    }
    const auto &storedCandidateEntries() const {
      return as<CandidateEntries>(store_);
    }

    auto &storedBlocksAtHeight() {
      return as<BlocksAtHeight>(store_);
    }
    const auto &storedBlocksAtHeight() const {
      return as<BlocksAtHeight>(store_);
    }

    Store<BlockEntries, CandidateEntries, BlocksAtHeight> store_;
    log::Logger logger_;
  };

}  // namespace vigil::parachain::approval

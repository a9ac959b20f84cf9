/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/approval_store.hpp"

#include <algorithm>

namespace vigil::parachain::approval {

  ApprovalStore::ApprovalStore()
      : logger_(log::createLogger("ApprovalStore", "parachain")) {}

  outcome::result<std::optional<BlockEntry>> ApprovalStore::load_block_entry(
      const primitives::BlockHash &block_hash) const {
    if (auto entry = storedBlockEntries().get(block_hash)) {
      return std::optional<BlockEntry>{entry->get()};
    }
    return std::nullopt;
  }

  outcome::result<std::optional<CandidateEntry>>
  ApprovalStore::load_candidate_entry(
      const CandidateHash &candidate_hash) const {
    if (auto entry = storedCandidateEntries().get(candidate_hash)) {
      return std::optional<CandidateEntry>{entry->get()};
    }
    return std::nullopt;
  }

  outcome::result<std::vector<primitives::BlockHash>>
  ApprovalStore::load_blocks_at_height(
      primitives::BlockNumber block_number) const {
    if (auto blocks = storedBlocksAtHeight().get(block_number)) {
      return blocks->get();
    }
    return std::vector<primitives::BlockHash>{};
  }

  outcome::result<std::vector<std::pair<CandidateHash, CandidateEntry>>>
  ApprovalStore::add_block_entry(const primitives::BlockHash &parent_hash,
                                 primitives::BlockNumber number,
                                 BlockEntry entry,
                                 size_t n_validators,
                                 const CandidateInfoFn &candidate_info) {
    const auto block_hash = entry.block_hash;
    OUTCOME_TRY(blocks_at_height, load_blocks_at_height(number));
    if (std::find(blocks_at_height.begin(), blocks_at_height.end(), block_hash)
            != blocks_at_height.end()
        or storedBlockEntries().contains(block_hash)) {
      SL_DEBUG(logger_, "Block {} is already tracked", block_hash);
      return std::vector<std::pair<CandidateHash, CandidateEntry>>{};
    }

    std::vector<NewCandidateInfo> infos;
    infos.reserve(entry.candidates.size());
    for (const auto &[_, candidate_hash] : entry.candidates) {
      auto info = candidate_info(candidate_hash);
      if (not info) {
        SL_WARN(logger_,
                "No info for candidate {} of block {}, block entry skipped",
                candidate_hash,
                block_hash);
        return std::vector<std::pair<CandidateHash, CandidateEntry>>{};
      }
      infos.emplace_back(std::move(*info));
    }

    blocks_at_height.emplace_back(block_hash);
    storedBlocksAtHeight().set(number, std::move(blocks_at_height));

    std::vector<std::pair<CandidateHash, CandidateEntry>> candidate_entries;
    candidate_entries.reserve(entry.candidates.size());
    for (size_t ix = 0; ix < entry.candidates.size(); ++ix) {
      const auto &candidate_hash = entry.candidates[ix].second;
      auto &info = infos[ix];

      OUTCOME_TRY(stored, load_candidate_entry(candidate_hash));
      CandidateEntry candidate_entry =
          stored ? std::move(*stored)
                 : CandidateEntry(
                     std::move(info.candidate), entry.session, n_validators);
      candidate_entry.block_assignments.insert_or_assign(
          block_hash,
          ApprovalEntry(
              info.backing_group, std::move(info.our_assignment), n_validators));

      storedCandidateEntries().set(candidate_hash,
                                   CandidateEntry{candidate_entry});
      candidate_entries.emplace_back(candidate_hash,
                                     std::move(candidate_entry));
    }

    // Update the child index for the parent.
    if (auto parent = storedBlockEntries().get(parent_hash)) {
      parent->get().children.emplace_back(block_hash);
    }

    SL_TRACE(logger_,
             "Block entry added. (block number={}, block hash={}, "
             "candidates={})",
             number,
             block_hash,
             entry.candidates.size());
    storedBlockEntries().set(block_hash, std::move(entry));

    return candidate_entries;
  }

}  // namespace vigil::parachain::approval

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/new_blocks.hpp"

#include <algorithm>

namespace vigil::parachain::approval {

  namespace {

    outcome::result<bool> isKnown(const ApprovalDbReader &db,
                                  const primitives::BlockHash &hash) {
      OUTCOME_TRY(entry, db.load_block_entry(hash));
      return entry.has_value();
    }

    /// Headers of all hashes in order, or nullopt if any of them can't be
    /// fetched
    std::optional<std::vector<primitives::BlockHeader>> fetchHeaders(
        const blockchain::ChainApi &chain_api,
        const std::vector<primitives::BlockHash> &hashes,
        const log::Logger &logger) {
      std::vector<primitives::BlockHeader> headers;
      headers.reserve(hashes.size());
      for (const auto &hash : hashes) {
        auto header_res = chain_api.getBlockHeader(hash);
        if (header_res.has_error()) {
          SL_DEBUG(logger,
                   "Header request failed. (block hash={}, error={})",
                   hash,
                   header_res.error());
          return std::nullopt;
        }
        auto &header = header_res.value();
        if (not header) {
          SL_DEBUG(logger, "Header of {} not found", hash);
          return std::nullopt;
        }
        headers.emplace_back(std::move(*header));
      }
      return headers;
    }

  }  // namespace

  outcome::result<NewBlocks> determineNewBlocks(
      const blockchain::ChainApi &chain_api,
      const ApprovalDbReader &db,
      const primitives::BlockHash &head_hash,
      const primitives::BlockHeader &head_header,
      primitives::BlockNumber finalized_number,
      const log::Logger &logger) {
    // Early exit if the block is in the DB or too early.
    {
      OUTCOME_TRY(already_known, isKnown(db, head_hash));
      const auto before_relevant = head_header.number <= finalized_number;
      if (already_known or before_relevant) {
        return NewBlocks{};
      }
    }

    NewBlocks ancestry{{head_hash, head_header}};

    // Early exit if the parent hash is in the DB.
    OUTCOME_TRY(parent_known, isKnown(db, head_header.parent_hash));
    if (parent_known) {
      return ancestry;
    }

    for (;;) {
      const auto last_hash = ancestry.back().first;
      const auto last_number = ancestry.back().second.number;

      // Walked back to genesis.
      if (last_number <= 1) {
        break;
      }

      auto batch_hashes_res = chain_api.ancestors(last_hash, kAncestryStep);
      if (batch_hashes_res.has_error()) {
        SL_DEBUG(logger,
                 "Ancestry request failed. (block hash={}, error={})",
                 last_hash,
                 batch_hashes_res.error());
        break;
      }
      const auto &batch_hashes = batch_hashes_res.value();
      if (batch_hashes.empty()) {
        break;
      }

      // Any failed header fetch ignores the whole batch.
      auto batch_headers = fetchHeaders(chain_api, batch_hashes, logger);
      if (not batch_headers) {
        break;
      }

      bool stop = false;
      for (size_t ix = 0; ix < batch_hashes.size(); ++ix) {
        auto &header = (*batch_headers)[ix];
        OUTCOME_TRY(is_known, isKnown(db, batch_hashes[ix]));
        const auto is_relevant = header.number > finalized_number;
        if (is_known or not is_relevant) {
          stop = true;
          break;
        }
        ancestry.emplace_back(batch_hashes[ix], std::move(header));
      }
      if (stop) {
        break;
      }
    }

    std::reverse(ancestry.begin(), ancestry.end());
    return ancestry;
  }

}  // namespace vigil::parachain::approval

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>
#include <vector>

#include "blockchain/chain_api.hpp"
#include "log/logger.hpp"
#include "parachain/approval/approval_db.hpp"

namespace vigil::parachain::approval {

  /// Number of ancestors requested from the chain at once
  constexpr size_t kAncestryStep = 4;

  using NewBlocks =
      std::vector<std::pair<primitives::BlockHash, primitives::BlockHeader>>;

  /**
   * Finds the blocks between the head and the closest block that is either
   * tracked in the approval db or finalized.
   * Ancestry is requested in batches of kAncestryStep. A failed ancestry
   * request or a batch with any unresolved header ends the walk, and what was
   * gathered so far is returned.
   * @param head_hash hash of the new head
   * @param head_header header of the new head
   * @param finalized_number blocks at or below it are not returned
   * @return untracked blocks ordered from the oldest to the head, empty if the
   * head itself is tracked or finalized; only db read errors are returned as
   * errors
   */
  outcome::result<NewBlocks> determineNewBlocks(
      const blockchain::ChainApi &chain_api,
      const ApprovalDbReader &db,
      const primitives::BlockHash &head_hash,
      const primitives::BlockHeader &head_header,
      primitives::BlockNumber finalized_number,
      const log::Logger &logger);

}  // namespace vigil::parachain::approval

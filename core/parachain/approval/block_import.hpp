/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "blockchain/chain_api.hpp"
#include "crypto/hasher.hpp"
#include "crypto/key_store.hpp"
#include "crypto/vrf_provider.hpp"
#include "log/logger.hpp"
#include "parachain/approval/approval_db.hpp"
#include "parachain/approval/assignment_criteria.hpp"
#include "parachain/approval/block_info.hpp"
#include "parachain/approval/i_approval_distribution.hpp"
#include "parachain/approval/rolling_session_window.hpp"
#include "runtime/runtime_api/parachain_host.hpp"

namespace vigil::parachain {

  /// The approval voting subsystem.
  struct ApprovalVotingSubsystem {
    uint64_t slot_duration_millis;
  };

}  // namespace vigil::parachain

namespace vigil::parachain::approval {

  /**
   * Imports new relay chain heads into approval voting: keeps the session
   * window up to date, finds the blocks not yet seen, records them with their
   * included candidates in the approval db and announces them downstream.
   * Not thread safe.
   */
  class BlockImport {
   public:
    BlockImport(ApprovalVotingSubsystem config,
                std::shared_ptr<blockchain::ChainApi> chain_api,
                std::shared_ptr<runtime::ParachainHost> parachain_host,
                std::shared_ptr<ApprovalDb> approval_db,
                std::shared_ptr<AssignmentCriteria> assignment_criteria,
                std::shared_ptr<crypto::KeyStore> keystore,
                std::shared_ptr<crypto::VRFProvider> vrf_provider,
                std::shared_ptr<crypto::Hasher> hasher,
                std::shared_ptr<IApprovalDistribution> approval_distribution);

    /**
     * Processes a new head.
     * @param head hash of the new head
     * @param finalized_number number of the last finalized block, if known;
     * otherwise the parent of the head is treated as finalized
     * @return imported blocks with their candidates, oldest first; empty if
     * the head header or the sessions are unavailable
     */
    outcome::result<std::vector<BlockImportedCandidates>> handle_new_head(
        const primitives::BlockHash &head,
        std::optional<primitives::BlockNumber> finalized_number);

    const RollingSessionWindow &session_window() const {
      return session_window_;
    }

   private:
    outcome::result<BlockImportedCandidates> importBlock(
        const primitives::BlockHash &block_hash,
        const primitives::BlockHeader &block_header,
        ImportedBlockInfo &&block_info,
        std::vector<BlockApprovalMeta> &approval_meta);

    const ApprovalVotingSubsystem config_;
    std::shared_ptr<blockchain::ChainApi> chain_api_;
    std::shared_ptr<runtime::ParachainHost> parachain_host_;
    std::shared_ptr<ApprovalDb> approval_db_;
    std::shared_ptr<AssignmentCriteria> assignment_criteria_;
    std::shared_ptr<crypto::KeyStore> keystore_;
    std::shared_ptr<crypto::VRFProvider> vrf_provider_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<IApprovalDistribution> approval_distribution_;

    RollingSessionWindow session_window_;
    log::Logger logger_;
  };

}  // namespace vigil::parachain::approval

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <tuple>
#include <vector>

#include "crypto/hasher.hpp"
#include "crypto/key_store.hpp"
#include "crypto/vrf_provider.hpp"
#include "log/logger.hpp"
#include "parachain/approval/assignment_criteria.hpp"
#include "parachain/approval/rolling_session_window.hpp"
#include "runtime/runtime_api/parachain_host.hpp"

namespace vigil::parachain::approval {

  /// Candidates included by a block: hash, receipt, core left, backing group
  using CandidateIncludedList = std::vector<
      std::tuple<CandidateHash, CandidateReceipt, CoreIndex, GroupIndex>>;

  /// Everything approval voting learns about a newly imported block
  struct ImportedBlockInfo {
    CandidateIncludedList included_candidates;
    SessionIndex session_index;
    AssignmentsList assignments;
    size_t n_validators;
    RelayVRFStory relay_vrf_story;
    consensus::SlotNumber slot;
  };

  /// Collaborators used to compute ImportedBlockInfo
  struct ImportedBlockInfoEnv {
    runtime::ParachainHost &parachain_host;
    const RollingSessionWindow &session_window;
    const AssignmentCriteria &assignment_criteria;
    std::shared_ptr<crypto::KeyStore> keystore;
    const crypto::VRFProvider &vrf_provider;
    const crypto::Hasher &hasher;
  };

  /**
   * Collects included candidates, session, relay VRF story and own
   * assignments of a block. The session is taken at the parent state and the
   * BABE epoch at the block's own state.
   * @return nullopt (with a log record) if any of the data is unavailable,
   * the session is older than the window, or the block carries no VRF output
   */
  std::optional<ImportedBlockInfo> importedBlockInfo(
      const ImportedBlockInfoEnv &env,
      const primitives::BlockHash &block_hash,
      const primitives::BlockHeader &block_header,
      const log::Logger &logger);

}  // namespace vigil::parachain::approval

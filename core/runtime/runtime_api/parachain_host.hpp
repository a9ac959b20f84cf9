/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "consensus/babe/types/epoch.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"
#include "runtime/runtime_api/parachain_host_types.hpp"

namespace vigil::runtime {

  /**
   * Runtime API queries used by approval voting. Every call is answered
   * against the state of the given block and yields exactly one value or one
   * error.
   */
  class ParachainHost {
   public:
    virtual ~ParachainHost() = default;

    /**
     * @brief Returns the session index expected at a child of the block.
     * @return session index
     */
    virtual outcome::result<SessionIndex> session_index_for_child(
        const primitives::BlockHash &block) = 0;

    /**
     * @brief Get the session info for the given session, if stored.
     * @param index session index
     * @return session info or nullopt if the runtime doesn't know it
     */
    virtual outcome::result<std::optional<SessionInfo>> session_info(
        const primitives::BlockHash &block, SessionIndex index) = 0;

    /**
     * @brief Get a vector of events concerning candidates that occurred
     * within a block.
     * @return vector of events
     */
    virtual outcome::result<std::vector<CandidateEvent>> candidate_events(
        const primitives::BlockHash &block) = 0;

    /**
     * @brief Returns the BABE epoch current at the state of the block.
     */
    virtual outcome::result<consensus::babe::Epoch> current_babe_epoch(
        const primitives::BlockHash &block) = 0;
  };

}  // namespace vigil::runtime

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <functional>
#include <optional>

#include "log/logger.hpp"
#include "primitives/block_header.hpp"
#include "runtime/runtime_api/parachain_host.hpp"

namespace vigil::parachain::approval {

  /// Number of sessions kept in the window
  constexpr SessionIndex kApprovalSessions = 6;

  /**
   * Contiguous cache of the session infos of the most recent sessions.
   * Entry `i` describes session `earliest_session() + i`. Filled by the first
   * head and moved forward by later ones; never holds more than
   * kApprovalSessions entries.
   */
  class RollingSessionWindow {
   public:
    RollingSessionWindow();

    /// Session info of the given session, if it is inside the window
    std::optional<std::reference_wrapper<const runtime::SessionInfo>>
    session_info(SessionIndex index) const;

    std::optional<SessionIndex> earliest_session() const;

    std::optional<SessionIndex> latest_session() const;

    bool contains(SessionIndex index) const;

    size_t size() const {
      return session_info_.size();
    }

    /**
     * Brings the window up to the session of the given head. The session
     * index is taken at the parent of the head, or at the head itself for
     * genesis. A head of an already covered or older session leaves the
     * window untouched. All sessions are fetched before the window changes,
     * so a failure keeps the previous window.
     * @return SessionIndexUnavailable if the session index query fails,
     * SessionsUnavailable if any needed session can't be fetched
     */
    outcome::result<void> cache_session_info_for_head(
        runtime::ParachainHost &parachain_host,
        const primitives::BlockHash &block_hash,
        const primitives::BlockHeader &block_header);

   private:
    outcome::result<std::deque<runtime::SessionInfo>> load_sessions(
        runtime::ParachainHost &parachain_host,
        const primitives::BlockHash &block_hash,
        SessionIndex start,
        SessionIndex end_inclusive) const;

    std::optional<SessionIndex> earliest_session_;
    std::deque<runtime::SessionInfo> session_info_;
    log::Logger logger_;
  };

}  // namespace vigil::parachain::approval

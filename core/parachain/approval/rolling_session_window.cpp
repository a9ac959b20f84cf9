/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/rolling_session_window.hpp"

#include <algorithm>
#include <iterator>

#include "parachain/approval/approval_voting_error.hpp"
#include "primitives/math.hpp"

namespace vigil::parachain::approval {

  RollingSessionWindow::RollingSessionWindow()
      : logger_(log::createLogger("RollingSessionWindow", "parachain")) {}

  std::optional<std::reference_wrapper<const runtime::SessionInfo>>
  RollingSessionWindow::session_info(SessionIndex index) const {
    if (not earliest_session_ or index < *earliest_session_) {
      return std::nullopt;
    }
    const auto offset = static_cast<size_t>(index - *earliest_session_);
    if (offset >= session_info_.size()) {
      return std::nullopt;
    }
    return session_info_[offset];
  }

  std::optional<SessionIndex> RollingSessionWindow::earliest_session() const {
    return earliest_session_;
  }

  std::optional<SessionIndex> RollingSessionWindow::latest_session() const {
    if (not earliest_session_ or session_info_.empty()) {
      return std::nullopt;
    }
    return *earliest_session_
         + static_cast<SessionIndex>(session_info_.size() - 1);
  }

  bool RollingSessionWindow::contains(SessionIndex index) const {
    auto latest = latest_session();
    return latest and index >= *earliest_session_ and index <= *latest;
  }

  outcome::result<std::deque<runtime::SessionInfo>>
  RollingSessionWindow::load_sessions(runtime::ParachainHost &parachain_host,
                                      const primitives::BlockHash &block_hash,
                                      SessionIndex start,
                                      SessionIndex end_inclusive) const {
    std::deque<runtime::SessionInfo> sessions;
    for (auto i = start; i <= end_inclusive; ++i) {
      auto session_info_res = parachain_host.session_info(block_hash, i);
      if (session_info_res.has_error()) {
        SL_DEBUG(logger_,
                 "Call 'session_info' failed. (block hash={}, session={}, "
                 "error={})",
                 block_hash,
                 i,
                 session_info_res.error());
        return SessionObtainingError::SessionsUnavailable;
      }
      auto &session_info_opt = session_info_res.value();
      if (not session_info_opt) {
        SL_DEBUG(logger_,
                 "Session info missing from runtime. (block hash={}, "
                 "session={})",
                 block_hash,
                 i);
        return SessionObtainingError::SessionsUnavailable;
      }
      sessions.emplace_back(std::move(*session_info_opt));
    }
    return sessions;
  }

  outcome::result<void> RollingSessionWindow::cache_session_info_for_head(
      runtime::ParachainHost &parachain_host,
      const primitives::BlockHash &block_hash,
      const primitives::BlockHeader &block_header) {
    // Genesis is the only block whose child session is queried at itself.
    const auto &session_index_at =
        block_header.number == 0 ? block_hash : block_header.parent_hash;

    auto session_index_res =
        parachain_host.session_index_for_child(session_index_at);
    if (session_index_res.has_error()) {
      SL_DEBUG(logger_,
               "Call 'session_index_for_child' failed. (block hash={}, "
               "error={})",
               session_index_at,
               session_index_res.error());
      return SessionObtainingError::SessionIndexUnavailable;
    }
    const SessionIndex session_index = session_index_res.value();

    const auto window_start =
        math::sat_sub_unsigned(session_index, kApprovalSessions - 1);

    const auto latest = latest_session();
    if (not latest) {
      SL_INFO(logger_,
              "Loading approval window from session {}",
              window_start);
      OUTCOME_TRY(sessions,
                  load_sessions(
                      parachain_host, block_hash, window_start, session_index));
      earliest_session_ = window_start;
      session_info_ = std::move(sessions);
      return outcome::success();
    }

    if (session_index <= *latest) {
      // Already cached, or the head moved back to an older session.
      return outcome::success();
    }

    const auto old_window_start = *earliest_session_;

    if (*latest < window_start) {
      // The window jumped past everything cached.
      OUTCOME_TRY(sessions,
                  load_sessions(
                      parachain_host, block_hash, window_start, session_index));
      SL_INFO(logger_,
              "Moving approval window from session {}..={} to {}..={}",
              old_window_start,
              *latest,
              window_start,
              session_index);
      earliest_session_ = window_start;
      session_info_ = std::move(sessions);
      return outcome::success();
    }

    OUTCOME_TRY(
        sessions,
        load_sessions(parachain_host, block_hash, *latest + 1, session_index));

    const auto overlap_start =
        std::min<size_t>(math::sat_sub_unsigned(window_start, old_window_start),
                         session_info_.size());
    if (overlap_start > 0) {
      SL_INFO(logger_,
              "Moving approval window from session {}..={} to {}..={}",
              old_window_start,
              *latest,
              window_start,
              session_index);
    }
    session_info_.erase(
        session_info_.begin(),
        std::next(session_info_.begin(),
                  static_cast<std::ptrdiff_t>(overlap_start)));
    std::move(
        sessions.begin(), sessions.end(), std::back_inserter(session_info_));
    earliest_session_ = std::max(window_start, old_window_start);
    return outcome::success();
  }

}  // namespace vigil::parachain::approval

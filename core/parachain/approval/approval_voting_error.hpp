/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace vigil::parachain {
  enum class ApprovalVotingError {
    NO_SESSION_INFO = 1,
    ALREADY_IMPORTING = 2,
    NOT_STARTED = 3,
  };

  /// Failures of keeping the rolling session window up to date
  enum class SessionObtainingError {
    /// A session of the window is unknown to the runtime or couldn't be
    /// fetched
    SessionsUnavailable = 1,
    /// The session index of the head couldn't be queried
    SessionIndexUnavailable,
  };
}  // namespace vigil::parachain

OUTCOME_HPP_DECLARE_ERROR(vigil::parachain, ApprovalVotingError);
OUTCOME_HPP_DECLARE_ERROR(vigil::parachain, SessionObtainingError);

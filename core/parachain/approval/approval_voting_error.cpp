/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/approval_voting_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vigil::parachain, ApprovalVotingError, e) {
  using E = vigil::parachain::ApprovalVotingError;
  switch (e) {
    case E::NO_SESSION_INFO:
      return "No session info";
    case E::ALREADY_IMPORTING:
      return "Block import is already in progress";
    case E::NOT_STARTED:
      return "Approval voting is not started";
  }
  return "Unknown approval-voting error";
}

OUTCOME_CPP_DEFINE_CATEGORY(vigil::parachain, SessionObtainingError, e) {
  using E = vigil::parachain::SessionObtainingError;
  switch (e) {
    case E::SessionsUnavailable:
      return "Sessions unavailable in the runtime";
    case E::SessionIndexUnavailable:
      return "Session index unavailable in the runtime";
  }
  return "Unknown session obtaining error";
}

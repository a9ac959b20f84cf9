/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

/// Error propagation for every vigil module: Boost.Outcome results as
/// re-exported by libp2p, together with OUTCOME_TRY and the
/// OUTCOME_HPP_DECLARE_ERROR / OUTCOME_CPP_DEFINE_CATEGORY macros.
namespace outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace outcome

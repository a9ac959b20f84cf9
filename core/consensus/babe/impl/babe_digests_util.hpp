/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/babe_block_header.hpp"
#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace vigil::consensus::babe {

  enum class DigestError {
    REQUIRED_DIGESTS_NOT_FOUND = 1,
    GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS,
  };

  outcome::result<SlotNumber> getSlot(const primitives::BlockHeader &header);

  /**
   * Finds and decodes the BABE pre-runtime digest of the block
   * @return the slot claim of the block author, or REQUIRED_DIGESTS_NOT_FOUND
   * when the header carries no BABE pre-runtime item, or the scale error of
   * a malformed one
   */
  outcome::result<BabeBlockHeader> getBabeBlockHeader(
      const primitives::BlockHeader &block_header);

}  // namespace vigil::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(vigil::consensus::babe, DigestError);

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/babe_digests_util.hpp"

#include <scale/scale.hpp>

#include "common/visitor.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vigil::consensus::babe, DigestError, e) {
  using E = vigil::consensus::babe::DigestError;
  switch (e) {
    case E::REQUIRED_DIGESTS_NOT_FOUND:
      return "the block must contain a BABE pre-runtime digest";
    case E::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS:
      return "genesis block can not have digests";
  }
  return "unknown error (vigil::consensus::babe::DigestError)";
}

namespace vigil::consensus::babe {

  outcome::result<SlotNumber> getSlot(const primitives::BlockHeader &header) {
    OUTCOME_TRY(babe_block_header, getBabeBlockHeader(header));
    return babe_block_header.slot_number;
  }

  outcome::result<BabeBlockHeader> getBabeBlockHeader(
      const primitives::BlockHeader &block_header) {
    [[unlikely]] if (block_header.number == 0) {
      return DigestError::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS;
    }

    for (const auto &digest : block_header.digest) {
      auto pre_runtime_opt = if_type<const primitives::PreRuntime>(digest);
      if (not pre_runtime_opt.has_value()) {
        continue;
      }
      const primitives::PreRuntime &pre_runtime = pre_runtime_opt->get();
      if (pre_runtime.consensus_engine_id != primitives::kBabeEngineId) {
        continue;
      }
      return scale::decode<BabeBlockHeader>(pre_runtime.data);
    }

    return DigestError::REQUIRED_DIGESTS_NOT_FOUND;
  }

}  // namespace vigil::consensus::babe

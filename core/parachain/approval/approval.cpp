/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/approval.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vigil::parachain::approval,
                            UnsafeVRFOutput::Error,
                            e) {
  using E = vigil::parachain::approval::UnsafeVRFOutput::Error;
  switch (e) {
    case E::AuthorityOutOfBounds:
      return "Authority index out of bounds";
    case E::ComputeRandomnessFailed:
      return "Compute randomness failed";
  }
  return "Unknown UnsafeVRFOutput error";
}

namespace vigil::parachain::approval {

  outcome::result<void> UnsafeVRFOutput::compute_randomness(
      RelayVRFStory &vrf_story,
      const consensus::babe::Authorities &authorities,
      const consensus::Randomness &randomness,
      consensus::EpochNumber epoch_index,
      const crypto::VRFProvider &vrf_provider) const {
    if (authorities.size() <= authority_index) {
      return Error::AuthorityOutOfBounds;
    }

    const auto &author = authorities[authority_index].id;
    auto story_res = vrf_provider.computeRelayVrfStory(
        author, vrf_output.get(), randomness, slot, epoch_index);
    if (story_res.has_error()) {
      return Error::ComputeRandomnessFailed;
    }

    vrf_story.data = story_res.value();
    return outcome::success();
  }

}  // namespace vigil::parachain::approval

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include <scale/scale.hpp>

#include "consensus/babe/types/babe_block_header.hpp"
#include "consensus/babe/types/epoch.hpp"
#include "parachain/approval/approval.hpp"
#include "primitives/digest.hpp"
#include "runtime/runtime_api/parachain_host_types.hpp"

namespace testutil {

  /// Digest with a BABE pre-runtime item claiming the slot
  inline vigil::primitives::Digest babeDigest(
      vigil::consensus::SlotNumber slot,
      vigil::consensus::babe::AuthorityIndex authority_index = 0,
      vigil::consensus::babe::SlotType slot_type =
          vigil::consensus::babe::SlotType::Primary) {
    vigil::consensus::babe::BabeBlockHeader babe_header{
        .slot_assignment_type = slot_type,
        .authority_index = authority_index,
        .slot_number = slot,
    };
    babe_header.vrf_output.output.fill(0x11);
    babe_header.vrf_output.proof.fill(0x22);

    vigil::primitives::PreRuntime pre_runtime;
    pre_runtime.consensus_engine_id = vigil::primitives::kBabeEngineId;
    pre_runtime.data = scale::encode(babe_header).value();
    return {pre_runtime};
  }

  /// Session with `n_validators` validators split in groups of two
  inline vigil::runtime::SessionInfo sessionInfo(size_t n_validators) {
    vigil::runtime::SessionInfo info;
    for (size_t i = 0; i < n_validators; ++i) {
      vigil::runtime::ValidatorId validator;
      validator[0] = static_cast<uint8_t>(i + 1);
      info.validators.emplace_back(validator);
      info.assignment_keys.emplace_back(validator);
      if (i % 2 == 0) {
        info.validator_groups.emplace_back();
      }
      info.validator_groups.back().emplace_back(
          static_cast<vigil::runtime::ValidatorIndex>(i));
    }
    info.n_cores = static_cast<uint32_t>(info.validator_groups.size());
    info.zeroth_delay_tranche_width = 0;
    info.relay_vrf_modulo_samples = 2;
    info.n_delay_tranches = 40;
    info.no_show_slots = 2;
    info.needed_approvals = 3;
    return info;
  }

  /// Epoch with `n_authorities` authorities
  inline vigil::consensus::babe::Epoch babeEpoch(size_t n_authorities) {
    vigil::consensus::babe::Epoch epoch;
    epoch.epoch_index = 7;
    epoch.randomness.fill(0x33);
    for (size_t i = 0; i < n_authorities; ++i) {
      vigil::consensus::babe::Authority authority;
      authority.id[0] = static_cast<uint8_t>(0xa0 + i);
      authority.weight = 1;
      epoch.authorities.emplace_back(authority);
    }
    return epoch;
  }

  /// Receipt whose commitments hash identifies it
  inline vigil::parachain::CandidateReceipt receiptOf(
      const vigil::parachain::CandidateHash &tag) {
    vigil::parachain::CandidateReceipt receipt;
    receipt.descriptor.para_id = 2000;
    receipt.commitments_hash = tag;
    return receipt;
  }

  /**
   * Hash standing in for blake2b: the last 32 bytes of the input. A SCALE
   * encoded receipt ends with its commitments hash, so the candidate hash of
   * receiptOf(tag) is tag.
   */
  inline vigil::common::Hash256 tailHash(vigil::common::BufferView data) {
    vigil::common::Hash256 hash;
    const auto n = std::min(data.size(), hash.size());
    std::copy(data.end() - static_cast<std::ptrdiff_t>(n),
              data.end(),
              hash.end() - static_cast<std::ptrdiff_t>(n));
    return hash;
  }

  inline vigil::runtime::CandidateEvent includedEvent(
      const vigil::parachain::CandidateHash &tag,
      vigil::parachain::CoreIndex core,
      vigil::parachain::GroupIndex group) {
    vigil::runtime::CandidateIncluded event;
    event.candidate_receipt = receiptOf(tag);
    event.core_index = core;
    event.group_index = group;
    return event;
  }

  inline vigil::runtime::CandidateEvent backedEvent(
      const vigil::parachain::CandidateHash &tag) {
    vigil::runtime::CandidateBacked event;
    event.candidate_receipt = receiptOf(tag);
    return event;
  }

  inline vigil::parachain::approval::OurAssignment ourAssignment(
      vigil::parachain::CoreIndex core) {
    return vigil::parachain::approval::OurAssignment{
        .cert =
            vigil::parachain::approval::AssignmentCert{
                .kind = vigil::parachain::approval::RelayVRFDelay{core},
                .vrf = {},
            },
        .tranche = 1,
        .validator_index = 0,
        .triggered = false,
    };
  }

}  // namespace testutil

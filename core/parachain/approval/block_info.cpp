/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/block_info.hpp"

#include <scale/scale.hpp>

#include "common/visitor.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"

namespace vigil::parachain::approval {

  namespace {

    outcome::result<CandidateIncludedList> requestIncludedCandidates(
        runtime::ParachainHost &parachain_host,
        const crypto::Hasher &hasher,
        const primitives::BlockHash &block_hash) {
      OUTCOME_TRY(candidate_events, parachain_host.candidate_events(block_hash));

      CandidateIncludedList included;
      for (const auto &candidate_event : candidate_events) {
        if (auto obj = if_type<const runtime::CandidateIncluded>(
                candidate_event)) {
          const runtime::CandidateIncluded &event = obj->get();
          OUTCOME_TRY(encoded_receipt, scale::encode(event.candidate_receipt));
          included.emplace_back(hasher.blake2b_256(encoded_receipt),
                                event.candidate_receipt,
                                event.core_index,
                                event.group_index);
        }
      }
      return included;
    }

  }  // namespace

  std::optional<ImportedBlockInfo> importedBlockInfo(
      const ImportedBlockInfoEnv &env,
      const primitives::BlockHash &block_hash,
      const primitives::BlockHeader &block_header,
      const log::Logger &logger) {
    // Runtime API errors mean these blocks are old and finalized, only
    // unfinalized blocks take part in approval voting.
    auto included_res =
        requestIncludedCandidates(env.parachain_host, env.hasher, block_hash);
    if (included_res.has_error()) {
      SL_DEBUG(logger,
               "Candidate events unavailable. (block hash={}, error={})",
               block_hash,
               included_res.error());
      return std::nullopt;
    }
    auto &included_candidates = included_res.value();

    auto session_index_res =
        env.parachain_host.session_index_for_child(block_header.parent_hash);
    if (session_index_res.has_error()) {
      SL_DEBUG(logger,
               "Session index unavailable. (block hash={}, error={})",
               block_hash,
               session_index_res.error());
      return std::nullopt;
    }
    const SessionIndex session_index = session_index_res.value();

    const auto earliest_session = env.session_window.earliest_session();
    if (not earliest_session or session_index < *earliest_session) {
      SL_DEBUG(logger,
               "Block {} is from ancient session {}. Skipping",
               block_hash,
               session_index);
      return std::nullopt;
    }

    // The post-state of a block always holds the epoch the block was authored
    // in, so the epoch is queried at the block itself.
    auto babe_epoch_res = env.parachain_host.current_babe_epoch(block_hash);
    if (babe_epoch_res.has_error()) {
      SL_DEBUG(logger,
               "BABE epoch unavailable. (block hash={}, error={})",
               block_hash,
               babe_epoch_res.error());
      return std::nullopt;
    }
    const auto &babe_epoch = babe_epoch_res.value();

    auto session_info = env.session_window.session_info(session_index);
    if (not session_info) {
      SL_DEBUG(logger, "Session info unavailable for block {}", block_hash);
      return std::nullopt;
    }

    auto babe_header_res = consensus::babe::getBabeBlockHeader(block_header);
    if (babe_header_res.has_error()) {
      SL_DEBUG(logger,
               "BABE VRF info unavailable for block {}. (error={})",
               block_hash,
               babe_header_res.error());
      return std::nullopt;
    }
    const auto &babe_header = babe_header_res.value();
    if (not babe_header.needVRFCheck()) {
      SL_DEBUG(logger,
               "Block {} is authored in a secondary plain slot, no VRF info",
               block_hash);
      return std::nullopt;
    }

    UnsafeVRFOutput unsafe_vrf{
        .vrf_output = babe_header.vrf_output,
        .slot = babe_header.slot_number,
        .authority_index = babe_header.authority_index,
    };

    RelayVRFStory relay_vrf_story;
    if (auto res = unsafe_vrf.compute_randomness(relay_vrf_story,
                                                 babe_epoch.authorities,
                                                 babe_epoch.randomness,
                                                 babe_epoch.epoch_index,
                                                 env.vrf_provider);
        res.has_error()) {
      SL_DEBUG(logger,
               "Relay VRF story unavailable for block {}. (error={})",
               block_hash,
               res.error());
      return std::nullopt;
    }

    LeavingCores leaving_cores;
    leaving_cores.reserve(included_candidates.size());
    for (const auto &[_0, _1, core, group] : included_candidates) {
      leaving_cores.emplace_back(core, group);
    }

    const runtime::SessionInfo &session = session_info->get();
    auto assignments = env.assignment_criteria.compute_assignments(
        env.keystore,
        relay_vrf_story,
        CriteriaConfig::from(session),
        leaving_cores);

    SL_TRACE(logger,
             "Imported block info. (block hash={}, session={}, "
             "candidates={}, assignments={})",
             block_hash,
             session_index,
             included_candidates.size(),
             assignments.size());

    return ImportedBlockInfo{
        .included_candidates = std::move(included_candidates),
        .session_index = session_index,
        .assignments = std::move(assignments),
        .n_validators = session.validators.size(),
        .relay_vrf_story = relay_vrf_story,
        .slot = unsafe_vrf.getSlot(),
    };
  }

}  // namespace vigil::parachain::approval

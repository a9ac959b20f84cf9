/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/block_import.hpp"

#include <unordered_map>

#include "parachain/approval/approval_voting_error.hpp"
#include "parachain/approval/new_blocks.hpp"
#include "parachain/approval/time.hpp"
#include "primitives/math.hpp"

namespace vigil::parachain::approval {

  BlockImport::BlockImport(
      ApprovalVotingSubsystem config,
      std::shared_ptr<blockchain::ChainApi> chain_api,
      std::shared_ptr<runtime::ParachainHost> parachain_host,
      std::shared_ptr<ApprovalDb> approval_db,
      std::shared_ptr<AssignmentCriteria> assignment_criteria,
      std::shared_ptr<crypto::KeyStore> keystore,
      std::shared_ptr<crypto::VRFProvider> vrf_provider,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<IApprovalDistribution> approval_distribution)
      : config_(config),
        chain_api_(std::move(chain_api)),
        parachain_host_(std::move(parachain_host)),
        approval_db_(std::move(approval_db)),
        assignment_criteria_(std::move(assignment_criteria)),
        keystore_(std::move(keystore)),
        vrf_provider_(std::move(vrf_provider)),
        hasher_(std::move(hasher)),
        approval_distribution_(std::move(approval_distribution)),
        logger_(log::createLogger("BlockImport", "parachain")) {
    BOOST_ASSERT(chain_api_);
    BOOST_ASSERT(parachain_host_);
    BOOST_ASSERT(approval_db_);
    BOOST_ASSERT(assignment_criteria_);
    BOOST_ASSERT(keystore_);
    BOOST_ASSERT(vrf_provider_);
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(approval_distribution_);
  }

  outcome::result<std::vector<BlockImportedCandidates>>
  BlockImport::handle_new_head(
      const primitives::BlockHash &head,
      std::optional<primitives::BlockNumber> finalized_number) {
    auto header_res = chain_api_->getBlockHeader(head);
    if (header_res.has_error()) {
      SL_DEBUG(logger_,
               "Header request failed, nothing to do. (head={}, error={})",
               head,
               header_res.error());
      return std::vector<BlockImportedCandidates>{};
    }
    if (not header_res.value()) {
      SL_WARN(logger_, "Chain does not know the header of new head {}", head);
      return std::vector<BlockImportedCandidates>{};
    }
    const primitives::BlockHeader &header = *header_res.value();

    if (auto res = session_window_.cache_session_info_for_head(
            *parachain_host_, head, header);
        res.has_error()) {
      SL_WARN(logger_,
              "Sessions unavailable for new head. (head={}, error={})",
              head,
              res.error());
      return std::vector<BlockImportedCandidates>{};
    }

    // Without finality data the whole history below the head is treated as
    // finalized.
    const auto finalized = finalized_number.value_or(
        math::sat_sub_unsigned(header.number, primitives::BlockNumber{1}));

    OUTCOME_TRY(new_blocks,
                determineNewBlocks(
                    *chain_api_, *approval_db_, head, header, finalized, logger_));
    SL_TRACE(logger_,
             "New blocks to import. (head={}, finalized={}, count={})",
             head,
             finalized,
             new_blocks.size());

    const ImportedBlockInfoEnv env{
        .parachain_host = *parachain_host_,
        .session_window = session_window_,
        .assignment_criteria = *assignment_criteria_,
        .keystore = keystore_,
        .vrf_provider = *vrf_provider_,
        .hasher = *hasher_,
    };

    std::vector<BlockImportedCandidates> imported_candidates;
    std::vector<BlockApprovalMeta> approval_meta;
    imported_candidates.reserve(new_blocks.size());
    approval_meta.reserve(new_blocks.size());

    for (const auto &[block_hash, block_header] : new_blocks) {
      auto block_info =
          importedBlockInfo(env, block_hash, block_header, logger_);
      if (not block_info) {
        SL_DEBUG(logger_,
                 "Skipping block {} with no approval data",
                 primitives::BlockInfo(block_header.number, block_hash));
        continue;
      }

      OUTCOME_TRY(imported,
                  importBlock(block_hash,
                              block_header,
                              std::move(*block_info),
                              approval_meta));
      imported_candidates.emplace_back(std::move(imported));
    }

    approval_distribution_->newBlocks(std::move(approval_meta));
    return imported_candidates;
  }

  outcome::result<BlockImportedCandidates> BlockImport::importBlock(
      const primitives::BlockHash &block_hash,
      const primitives::BlockHeader &block_header,
      ImportedBlockInfo &&block_info,
      std::vector<BlockApprovalMeta> &approval_meta) {
    auto session_info = session_window_.session_info(block_info.session_index);
    if (not session_info) {
      SL_TRACE(logger_,
               "No session info. (block hash={}, session index={})",
               block_hash,
               block_info.session_index);
      return ApprovalVotingError::NO_SESSION_INFO;
    }

    const auto block_tick =
        slotNumberToTick(config_.slot_duration_millis, block_info.slot);
    const auto no_show_duration = slotNumberToTick(
        config_.slot_duration_millis, session_info->get().no_show_slots);

    const auto num_candidates = block_info.included_candidates.size();

    std::vector<std::pair<CoreIndex, CandidateHash>> candidates;
    std::vector<CandidateHash> candidate_hashes;
    std::unordered_map<CandidateHash, NewCandidateInfo> candidate_infos;
    candidates.reserve(num_candidates);
    candidate_hashes.reserve(num_candidates);

    for (const auto &[candidate_hash, receipt, core_index, group_index] :
         block_info.included_candidates) {
      std::optional<OurAssignment> our_assignment;
      if (auto it = block_info.assignments.find(core_index);
          it != block_info.assignments.end()) {
        our_assignment = it->second;
      }
      candidate_infos.insert_or_assign(
          candidate_hash,
          NewCandidateInfo{
              .candidate = receipt,
              .backing_group = group_index,
              .our_assignment = std::move(our_assignment),
          });
      candidates.emplace_back(core_index, candidate_hash);
      candidate_hashes.emplace_back(candidate_hash);
    }

    scale::BitVec approved_bitfield;
    approved_bitfield.bits.insert(
        approved_bitfield.bits.end(), num_candidates, false);

    SL_TRACE(logger_,
             "Add block entry. (block number={}, block hash={}, parent "
             "hash={}, num candidates={})",
             block_header.number,
             block_hash,
             block_header.parent_hash,
             num_candidates);
    OUTCOME_TRY(
        entries,
        approval_db_->add_block_entry(
            block_header.parent_hash,
            block_header.number,
            BlockEntry{.block_hash = block_hash,
                       .parent_hash = block_header.parent_hash,
                       .block_number = block_header.number,
                       .session = block_info.session_index,
                       .slot = block_info.slot,
                       .relay_vrf_story = block_info.relay_vrf_story,
                       .candidates = std::move(candidates),
                       .approved_bitfield = std::move(approved_bitfield),
                       .children = {}},
            block_info.n_validators,
            [&](const CandidateHash &candidate_hash)
                -> std::optional<NewCandidateInfo> {
              if (auto it = candidate_infos.find(candidate_hash);
                  it != candidate_infos.end()) {
                return it->second;
              }
              return std::nullopt;
            }));

    approval_meta.emplace_back(BlockApprovalMeta{
        .hash = block_hash,
        .number = block_header.number,
        .parent_hash = block_header.parent_hash,
        .candidates = std::move(candidate_hashes),
        .slot = block_info.slot,
        .session = block_info.session_index,
    });

    return BlockImportedCandidates{.block_hash = block_hash,
                                   .block_number = block_header.number,
                                   .block_tick = block_tick,
                                   .no_show_duration = no_show_duration,
                                   .imported_candidates = std::move(entries)};
  }

}  // namespace vigil::parachain::approval

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/approval/approval_voting.hpp"

#include "parachain/approval/approval_thread_pool.hpp"
#include "parachain/approval/approval_voting_error.hpp"

namespace vigil::parachain {

  ApprovalVoting::ApprovalVoting(
      std::shared_ptr<ApprovalThreadPool> approval_thread_pool,
      std::shared_ptr<approval::BlockImport> block_import,
      ScheduleWakeup schedule_wakeup)
      : approval_thread_pool_(std::move(approval_thread_pool)),
        approval_thread_handler_(approval_thread_pool_->handler()),
        block_import_(std::move(block_import)),
        schedule_wakeup_(std::move(schedule_wakeup)),
        logger_(log::createLogger("ApprovalVoting", "parachain")) {
    BOOST_ASSERT(approval_thread_handler_);
    BOOST_ASSERT(block_import_);
    BOOST_ASSERT(schedule_wakeup_);
  }

  bool ApprovalVoting::start() {
    approval_thread_handler_->start();
    SL_DEBUG(logger_, "Approval voting started");
    return true;
  }

  void ApprovalVoting::stop() {
    approval_thread_handler_->stop();
    SL_DEBUG(logger_, "Approval voting stopped");
  }

  void ApprovalVoting::onActiveLeavesUpdate(const primitives::BlockHash &head) {
    if (not approval_thread_handler_->isActive()) {
      SL_DEBUG(logger_,
               "New head {} ignored: {}",
               head,
               make_error_code(ApprovalVotingError::NOT_STARTED));
      return;
    }
    REINVOKE(*approval_thread_handler_, onActiveLeavesUpdate, head);
    handleNewHead(head);
  }

  void ApprovalVoting::onFinalized(const primitives::BlockInfo &finalized) {
    if (not approval_thread_handler_->isActive()) {
      return;
    }
    REINVOKE(*approval_thread_handler_, onFinalized, finalized);

    const auto last = finalized_number_.load();
    if (not last or *last < finalized.number) {
      SL_TRACE(logger_, "Finalized {}", finalized);
      finalized_number_.store(finalized.number);
    }
  }

  void ApprovalVoting::handleNewHead(const primitives::BlockHash &head) {
    BOOST_ASSERT(approval_thread_handler_->isInCurrentThread());

    if (importing_.contains(head)) {
      SL_WARN(logger_,
              "Approving {} already in progress: {}",
              head,
              make_error_code(ApprovalVotingError::ALREADY_IMPORTING));
      return;
    }
    importing_.emplace(head);

    auto imported =
        block_import_->handle_new_head(head, finalized_number_.load());
    if (imported.has_error()) {
      SL_ERROR(logger_,
               "Internal error while retrieve block imported candidates: {}",
               imported.error());
      importing_.erase(head);
      return;
    }

    for (const auto &block : imported.value()) {
      SL_TRACE(logger_,
               "Block imported. (block={}, candidates={})",
               primitives::BlockInfo(block.block_number, block.block_hash),
               block.imported_candidates.size());
      schedule_wakeup_(block);
    }
    importing_.erase(head);
  }

}  // namespace vigil::parachain

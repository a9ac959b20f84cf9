/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_set>

#include "log/logger.hpp"
#include "parachain/approval/block_import.hpp"
#include "primitives/common.hpp"
#include "utils/pool_handler.hpp"

namespace vigil::parachain {
  class ApprovalThreadPool;

  /**
   * Drives block import of approval voting. Notifications may come from any
   * thread, they are processed one by one on the approval thread. Imported
   * blocks are handed to the wakeup scheduler.
   */
  class ApprovalVoting : public std::enable_shared_from_this<ApprovalVoting> {
   public:
    using ScheduleWakeup =
        std::function<void(const approval::BlockImportedCandidates &)>;

    ApprovalVoting(std::shared_ptr<ApprovalThreadPool> approval_thread_pool,
                   std::shared_ptr<approval::BlockImport> block_import,
                   ScheduleWakeup schedule_wakeup);

    bool start();
    void stop();

    /// A new best head appeared
    void onActiveLeavesUpdate(const primitives::BlockHash &head);

    /// Finality moved
    void onFinalized(const primitives::BlockInfo &finalized);

    /// Written on the approval thread, readable from any thread
    std::optional<primitives::BlockNumber> lastFinalized() const {
      return finalized_number_.load();
    }

   private:
    void handleNewHead(const primitives::BlockHash &head);

    std::shared_ptr<ApprovalThreadPool> approval_thread_pool_;
    std::shared_ptr<PoolHandler> approval_thread_handler_;
    std::shared_ptr<approval::BlockImport> block_import_;
    ScheduleWakeup schedule_wakeup_;

    std::atomic<std::optional<primitives::BlockNumber>> finalized_number_;
    std::unordered_set<primitives::BlockHash> importing_;
    log::Logger logger_;
  };

}  // namespace vigil::parachain

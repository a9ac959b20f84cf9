/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "parachain/approval/approval.hpp"

namespace vigil::parachain::approval {

  /// Receiver of the blocks that became live in the approval protocol
  class IApprovalDistribution {
   public:
    virtual ~IApprovalDistribution() = default;

    /// Notifies about newly imported blocks, oldest first
    virtual void newBlocks(std::vector<BlockApprovalMeta> &&metas) = 0;
  };

}  // namespace vigil::parachain::approval

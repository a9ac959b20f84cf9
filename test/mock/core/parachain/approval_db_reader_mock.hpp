/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "parachain/approval/approval_db.hpp"

namespace vigil::parachain::approval {

  class ApprovalDbReaderMock : public ApprovalDbReader {
   public:
    MOCK_METHOD(outcome::result<std::optional<BlockEntry>>,
                load_block_entry,
                (const primitives::BlockHash &),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<CandidateEntry>>,
                load_candidate_entry,
                (const CandidateHash &),
                (const, override));

    MOCK_METHOD(outcome::result<std::vector<primitives::BlockHash>>,
                load_blocks_at_height,
                (primitives::BlockNumber),
                (const, override));
  };

}  // namespace vigil::parachain::approval

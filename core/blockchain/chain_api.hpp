/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace vigil::blockchain {

  /**
   * Read access to the relay chain block tree
   */
  class ChainApi {
   public:
    virtual ~ChainApi() = default;

    /**
     * @param hash block to start from
     * @param k maximum number of ancestors to return
     * @return up to k ancestor hashes of the block, closest first; fewer if
     * genesis is reached
     */
    virtual outcome::result<std::vector<primitives::BlockHash>> ancestors(
        const primitives::BlockHash &hash, size_t k) const = 0;

    /**
     * @return header of the block, or nullopt if the block is unknown
     */
    virtual outcome::result<std::optional<primitives::BlockHeader>>
    getBlockHeader(const primitives::BlockHash &hash) const = 0;
  };

}  // namespace vigil::blockchain

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <functional>
#include <unordered_map>

#include <gmock/gmock.h>

#include "mock/core/blockchain/chain_api_mock.hpp"
#include "primitives/block_header.hpp"

namespace testutil {
  namespace primitives = vigil::primitives;
  namespace blockchain = vigil::blockchain;

  /**
   * Linear chain of `length` blocks starting at number `start`. The parent of
   * the first block is unknown to the chain.
   */
  class TestChain {
   public:
    using DigestFn = std::function<primitives::Digest(primitives::BlockNumber)>;

    TestChain(primitives::BlockNumber start,
              primitives::BlockNumber length,
              const DigestFn &digest = {})
        : start_(start), length_(length) {
      for (auto n = start; n < start + length; ++n) {
        primitives::BlockHeader header{
            .number = n,
            .parent_hash = hashOf(n - 1),
            .digest = digest ? digest(n) : primitives::Digest{},
        };
        headers_.emplace(hashOf(n), std::move(header));
      }
    }

    static primitives::BlockHash hashOf(primitives::BlockNumber number) {
      primitives::BlockHash hash;
      hash[0] = 0xab;
      hash[28] = static_cast<uint8_t>(number >> 24);
      hash[29] = static_cast<uint8_t>(number >> 16);
      hash[30] = static_cast<uint8_t>(number >> 8);
      hash[31] = static_cast<uint8_t>(number);
      return hash;
    }

    primitives::BlockHash head() const {
      return hashOf(start_ + length_ - 1);
    }

    const primitives::BlockHeader &headerOf(
        primitives::BlockNumber number) const {
      return headers_.at(hashOf(number));
    }

    std::optional<primitives::BlockHeader> lookup(
        const primitives::BlockHash &hash) const {
      if (auto it = headers_.find(hash); it != headers_.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    /// Up to `k` known ancestors of the block, closest first
    std::vector<primitives::BlockHash> ancestors(
        const primitives::BlockHash &hash, size_t k) const {
      std::vector<primitives::BlockHash> result;
      auto header = lookup(hash);
      while (header and result.size() < k) {
        auto parent = lookup(header->parent_hash);
        if (not parent) {
          break;
        }
        result.emplace_back(header->parent_hash);
        header = std::move(parent);
      }
      return result;
    }

    /// Makes the mock answer header and ancestry requests from this chain
    void install(blockchain::ChainApiMock &chain_api) const {
      ON_CALL(chain_api, getBlockHeader(::testing::_))
          .WillByDefault([this](const primitives::BlockHash &hash)
                             -> outcome::result<
                                 std::optional<primitives::BlockHeader>> {
            return lookup(hash);
          });
      ON_CALL(chain_api, ancestors(::testing::_, ::testing::_))
          .WillByDefault(
              [this](const primitives::BlockHash &hash, size_t k)
                  -> outcome::result<std::vector<primitives::BlockHash>> {
                return ancestors(hash, k);
              });
    }

   private:
    primitives::BlockNumber start_;
    primitives::BlockNumber length_;
    std::unordered_map<primitives::BlockHash, primitives::BlockHeader> headers_;
  };

}  // namespace testutil

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/variant.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace vigil::primitives {

  /// Identifier of the consensus engine a digest item belongs to
  using ConsensusEngineId = common::Blob<4>;

  inline const ConsensusEngineId kBabeEngineId{{'B', 'A', 'B', 'E'}};

  namespace detail {
    struct DigestItemCommon {
      ConsensusEngineId consensus_engine_id;
      common::Buffer data;

      bool operator==(const DigestItemCommon &) const = default;
    };
  }  // namespace detail

  /// Message from the consensus engine to the runtime, placed by the block
  /// author before the runtime is executed (e.g. BABE pre-digest)
  struct PreRuntime : public detail::DigestItemCommon {};

  /// Message from the runtime to the consensus engine
  struct Consensus : public detail::DigestItemCommon {};

  /// Block author's signature, always the last digest item
  struct Seal : public detail::DigestItemCommon {};

  /// Arbitrary data not interpreted by consensus
  struct Other {
    common::Buffer data;

    bool operator==(const Other &) const = default;
  };

  using DigestItem = boost::variant<Other, Consensus, Seal, PreRuntime>;

  using Digest = std::vector<DigestItem>;

}  // namespace vigil::primitives

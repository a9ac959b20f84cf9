/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "utils/thread_pool.hpp"

namespace vigil::parachain {
  /// Single thread all approval voting work runs on
  class ApprovalThreadPool final : public ThreadPool {
   public:
    ApprovalThreadPool() : ThreadPool("approval", 1) {}

    ApprovalThreadPool(TestThreadPool test) : ThreadPool{test} {}
  };
}  // namespace vigil::parachain

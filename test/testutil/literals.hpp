/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include "common/blob.hpp"

inline vigil::common::Hash256 operator""_hash256(const char *c, size_t s) {
  vigil::common::Hash256 hash{};
  std::copy_n(c, std::min(s, size_t{32}), hash.rbegin());
  return hash;
}

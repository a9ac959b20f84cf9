/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>

#include <boost/variant.hpp>

namespace vigil {

  /**
   * Looks at the alternative currently held by a boost::variant
   * @tparam TReturn expected alternative, const-qualified for const variants
   * @return reference to the alternative, or nullopt if another one is held
   */
  template <typename TReturn, typename TVariant>
  constexpr std::optional<std::reference_wrapper<TReturn>> if_type(
      TVariant &&variant) {
    if (auto ptr = boost::get<TReturn>(&variant)) {
      return *ptr;
    }
    return std::nullopt;
  }

}  // namespace vigil

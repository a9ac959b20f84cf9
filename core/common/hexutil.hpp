/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace vigil::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };

  /**
   * @brief Converts bytes to hex representation
   * @param bytes source bytes
   * @return lowercase hexstring
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   */
  std::string hex_lower_0x(BufferView bytes);

  /**
   * @brief Converts hex representation to bytes
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace vigil::common

OUTCOME_HPP_DECLARE_ERROR(vigil::common, UnhexError);

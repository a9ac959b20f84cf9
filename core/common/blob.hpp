/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <ostream>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/hexutil.hpp"

namespace vigil::common {

  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { INCORRECT_LENGTH = 1 };

  using byte_t = uint8_t;

  /**
   * Base type which represents blob of fixed size.
   */
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
    using Array = std::array<byte_t, size_>;

   public:
    // Next line is required at least for the scale-codec
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower({this->data(), size_});
    }

    /**
     * Create Blob from hex string
     * @return Blob if hex string has proper size and is in hex format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from hex string prefixed with 0x
     */
    static outcome::result<Blob<size_>> fromHexWithPrefix(
        std::string_view hex) {
      OUTCOME_TRY(res, unhexWith0x(hex));
      return fromSpan(res);
    }

    static outcome::result<Blob<size_>> fromSpan(BufferView span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  extern template class Blob<32ul>;
  extern template class Blob<64ul>;

  using Hash256 = Blob<32>;
  using Hash512 = Blob<64>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace vigil::common

namespace vigil {
  using common::Hash256;
}  // namespace vigil

template <size_t N>
struct std::hash<vigil::common::Blob<N>> {
  auto operator()(const vigil::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

template <size_t N>
struct fmt::formatter<vigil::common::Blob<N>> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = N > 4 ? 's' : 'l';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const vigil::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(ctx.out(),
                            "0x{:02x}{:02x}…{:02x}{:02x}",
                            blob[0],
                            blob[1],
                            blob[N - 2],
                            blob[N - 1]);
    }
    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};

OUTCOME_HPP_DECLARE_ERROR(vigil::common, BlobError);

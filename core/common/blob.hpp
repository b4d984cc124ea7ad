/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <ostream>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/hexutil.hpp"

/**
 * Declares `space_name::class_name`, a blob of `blob_size` bytes which does
 * not mix with other blobs of the same size, hashable and formattable like
 * the plain one.
 */
#define TRIBUNE_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)        \
  namespace space_name {                                                      \
    struct class_name : public ::tribune::common::Blob<blob_size> {           \
      using Base = ::tribune::common::Blob<blob_size>;                        \
                                                                              \
      class_name() = default;                                                 \
      explicit class_name(const Base &blob) : Base{blob} {}                   \
                                                                              \
      static ::outcome::result<class_name> fromHex(std::string_view hex) {    \
        OUTCOME_TRY(blob, Base::fromHex(hex));                                \
        return class_name{blob};                                              \
      }                                                                       \
    };                                                                        \
  };                                                                          \
                                                                              \
  template <>                                                                 \
  struct std::hash<space_name::class_name>                                    \
      : std::hash<space_name::class_name::Base> {};                           \
                                                                              \
  template <>                                                                 \
  struct fmt::formatter<space_name::class_name>                               \
      : fmt::formatter<space_name::class_name::Base> {};

namespace tribune::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  using byte_t = uint8_t;

  /**
   * Fixed size byte string: hashes, keys and signatures.
   */
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
    using Array = std::array<byte_t, size_>;

   public:
    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower({this->begin(), this->end()});
    }

    /**
     * @return blob decoded from `hex`, which must encode exactly `size_`
     * bytes
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }

    static outcome::result<Blob<size_>> fromSpan(
        std::span<const uint8_t> span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace tribune::common

template <size_t N>
struct std::hash<tribune::common::Blob<N>> {
  size_t operator()(const tribune::common::Blob<N> &blob) const {
    return boost::hash_range(blob.begin(), blob.end());
  }
};

/// Formats as `0xabcd…ef01` by default, `{:l}` gives all the bytes.
template <size_t N>
struct fmt::formatter<tribune::common::Blob<N>> {
  bool full = N <= 4;

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() and (*it == 's' or *it == 'l')) {
      full = *it++ == 'l';
    }
    if (it != ctx.end() and *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const tribune::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (full) {
      return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
    }
    return fmt::format_to(ctx.out(),
                          "0x{:02x}{:02x}…{:02x}{:02x}",
                          blob[0],
                          blob[1],
                          blob[N - 2],
                          blob[N - 1]);
  }
};

OUTCOME_HPP_DECLARE_ERROR(tribune::common, BlobError);

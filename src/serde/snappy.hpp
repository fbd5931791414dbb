/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <snappy.h>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/bytestr.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace oppool {
  enum class SnappyError {
    UNCOMPRESS_TOO_LONG,
    UNCOMPRESS_INVALID,
  };
  Q_ENUM_ERROR_CODE(SnappyError) {
    using E = decltype(e);
    switch (e) {
      case E::UNCOMPRESS_TOO_LONG:
        return "Snappy uncompressed length exceeds limit";
      case E::UNCOMPRESS_INVALID:
        return "Invalid snappy compressed data";
    }
    abort();
  }

  /// Raw (unframed) snappy block
  inline qtils::ByteVec snappyCompress(qtils::BytesIn input) {
    qtils::ByteVec compressed(snappy::MaxCompressedLength(input.size()));
    size_t compressed_size = 0;
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto output = reinterpret_cast<char *>(compressed.data());
    snappy::RawCompress(
        qtils::byte2str(input.data()), input.size(), output, &compressed_size);
    compressed.resize(compressed_size);
    return compressed;
  }

  /// Fails without allocating when the stored length exceeds `max_size`
  inline outcome::result<qtils::ByteVec> snappyUncompress(
      qtils::BytesIn compressed, size_t max_size) {
    auto compressed_str = qtils::byte2str(compressed.data());
    size_t size = 0;
    if (not snappy::GetUncompressedLength(
            compressed_str, compressed.size(), &size)) {
      return SnappyError::UNCOMPRESS_INVALID;
    }
    if (size > max_size) {
      return SnappyError::UNCOMPRESS_TOO_LONG;
    }
    qtils::ByteVec uncompressed(size);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto output = reinterpret_cast<char *>(uncompressed.data());
    if (not snappy::RawUncompress(compressed_str, compressed.size(), output)) {
      return SnappyError::UNCOMPRESS_INVALID;
    }
    return uncompressed;
  }
}  // namespace oppool

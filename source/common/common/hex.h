#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/types/span.h"

namespace Corral {
/**
 * Hex encoder. Produces lowercase hex digits, two per input byte, most significant nibble first.
 */
class Hex final {
public:
  /**
   * Generates a hex dump of the given data
   * @param data the binary data to convert
   * @return the hex encoded string representing data
   */
  static std::string encode(absl::Span<const uint8_t> data) {
    return encode(data.data(), data.size());
  }

  /**
   * Generates a hex dump of the given data
   * @param data the binary data to convert
   * @param length the length of the data
   * @return the hex encoded string representing data
   */
  static std::string encode(const uint8_t* data, size_t length);
};
} // namespace Corral

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace Corral {
namespace Common {
namespace Crypto {

/**
 * Message digests supported for content hashing. Values are part of the output contract of
 * anything that embeds a digest in a resource name: switching algorithm changes every name.
 */
enum class DigestAlgorithm { Sha1, Sha256 };

class Utility {
public:
  /**
   * Computes the digest of a string using the given algorithm.
   * @param algorithm the digest to compute.
   * @param input the bytes to hash.
   * @return a vector of bytes for the computed digest.
   */
  static std::vector<uint8_t> getDigest(DigestAlgorithm algorithm, absl::string_view input);

  /**
   * Computes the digest of a string and hex encodes it.
   * @param algorithm the digest to compute.
   * @param input the bytes to hash.
   * @return the lowercase hex encoded digest, two characters per digest byte.
   */
  static std::string getHexDigest(DigestAlgorithm algorithm, absl::string_view input);

  /**
   * @return the size in bytes of a digest produced by the given algorithm.
   */
  static size_t digestLength(DigestAlgorithm algorithm);
};

} // namespace Crypto
} // namespace Common
} // namespace Corral

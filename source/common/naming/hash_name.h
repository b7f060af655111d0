#pragma once

#include <cstdint>
#include <string>

#include "source/common/crypto/utility.h"

#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace Corral {
namespace Naming {

/**
 * Digest used to disambiguate truncated name segments. It is computed over all segments joined
 * with SegmentSeparator, so every truncated segment of one name carries the same digest.
 */
constexpr Common::Crypto::DigestAlgorithm SegmentDigest = Common::Crypto::DigestAlgorithm::Sha256;

/**
 * Number of hex characters of SegmentDigest appended to each truncated segment when a name has
 * more than one segment.
 */
constexpr size_t ShortDigestLength = 6;

constexpr absl::string_view SegmentSeparator = "/";

/**
 * Bounds a single token to max_len characters.
 *
 * If text fits it is returned unchanged. If max_len cannot hold more than the suffix, the first
 * max_len characters of the suffix are returned. Otherwise the result is a prefix of text, a
 * '-' and the whole suffix, exactly max_len characters long. A non-positive max_len leaves no
 * room and yields the empty string unless text is itself empty.
 *
 * @param max_len supplies the maximum length of the result.
 * @param text supplies the token to bound.
 * @param suffix supplies the disambiguator substituted for the truncated tail of text.
 * @return a string no longer than max_len (or empty when max_len <= 0).
 */
std::string truncate(int64_t max_len, absl::string_view text, absl::string_view suffix);

/**
 * Joins segments with '/' into a name whose length is bounded per segment.
 *
 * No segments yields the empty string. A single segment is bounded to max_len using the full
 * hex digest as its disambiguator. With n >= 2 segments each segment gets max_len / n characters;
 * segments that fit are kept as is and the others are truncated with the first
 * ShortDigestLength characters of the digest.
 *
 * The output is a pure function of the arguments. It is used verbatim as an Envoy resource name,
 * so any change to this function renames resources across the fleet.
 *
 * @param max_len supplies the length budget.
 * @param segments supplies the ordered name segments.
 * @return the bounded name.
 */
std::string hashName(int64_t max_len, absl::Span<const absl::string_view> segments);

} // namespace Naming
} // namespace Corral

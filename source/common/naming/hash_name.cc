#include "source/common/naming/hash_name.h"

#include <string>
#include <vector>

#include "source/common/common/logger.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace Corral {
namespace Naming {

namespace {

spdlog::logger& namingLogger() { return Logger::Registry::getLog(Logger::Id::naming); }

int64_t length(absl::string_view s) { return static_cast<int64_t>(s.size()); }

} // namespace

std::string truncate(int64_t max_len, absl::string_view text, absl::string_view suffix) {
  if (length(text) <= max_len) {
    return std::string(text);
  }
  if (max_len <= 0) {
    return "";
  }
  if (max_len <= length(suffix)) {
    return std::string(suffix.substr(0, max_len));
  }
  return absl::StrCat(text.substr(0, max_len - length(suffix) - 1), "-", suffix);
}

std::string hashName(int64_t max_len, absl::Span<const absl::string_view> segments) {
  if (segments.empty()) {
    return "";
  }

  const std::string joined = absl::StrJoin(segments, SegmentSeparator);
  if (segments.size() == 1) {
    if (length(joined) <= max_len) {
      return joined;
    }
    std::string bounded =
        truncate(max_len, joined, Common::Crypto::Utility::getHexDigest(SegmentDigest, joined));
    CORRAL_LOG_TO_LOGGER(namingLogger(), debug, "name '{}' exceeds {} characters, using '{}'",
                         joined, max_len, bounded);
    return bounded;
  }

  const int64_t budget = max_len / static_cast<int64_t>(segments.size());
  std::string short_digest;
  std::vector<std::string> bounded;
  bounded.reserve(segments.size());
  for (const absl::string_view segment : segments) {
    if (length(segment) <= budget) {
      bounded.emplace_back(segment);
      continue;
    }
    if (short_digest.empty()) {
      short_digest = Common::Crypto::Utility::getHexDigest(SegmentDigest, joined)
                         .substr(0, ShortDigestLength);
    }
    bounded.push_back(truncate(budget, segment, short_digest));
    CORRAL_LOG_TO_LOGGER(namingLogger(), debug,
                         "segment '{}' of '{}' exceeds {} characters, using '{}'", segment, joined,
                         budget, bounded.back());
  }
  return absl::StrJoin(bounded, SegmentSeparator);
}

} // namespace Naming
} // namespace Corral

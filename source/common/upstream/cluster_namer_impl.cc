#include "source/common/upstream/cluster_namer_impl.h"

#include <string>

#include "corral/common/exception.h"

#include "source/common/naming/hash_name.h"
#include "source/common/protobuf/utility.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace Corral {
namespace Upstream {

namespace {

// Whole seconds as hours, minutes and seconds with leading zero units dropped: "45s", "1m30s",
// "2h0m5s". Existing cluster names depend on this exact rendering.
std::string formatDuration(uint32_t seconds) {
  const uint32_t hours = seconds / 3600;
  const uint32_t minutes = (seconds % 3600) / 60;
  const uint32_t secs = seconds % 60;
  if (hours > 0) {
    return absl::StrCat(hours, "h", minutes, "m", secs, "s");
  }
  if (minutes > 0) {
    return absl::StrCat(minutes, "m", secs, "s");
  }
  return absl::StrCat(secs, "s");
}

// Free-form strings are length prefixed so that no value can forge a following entry.
void appendString(std::string& config, absl::string_view tag, absl::string_view value) {
  absl::StrAppend(&config, tag, "=", value.size(), ":", value, ";");
}

} // namespace

ClusterNamerImpl::ClusterNamerImpl()
    : ClusterNamerImpl(corral::config::naming::v1::NamingPolicy()) {}

ClusterNamerImpl::ClusterNamerImpl(const corral::config::naming::v1::NamingPolicy& policy)
    : identity_budget_(
          PROTOBUF_GET_WRAPPED_OR_DEFAULT(policy, identity_budget, DefaultIdentityBudget)),
      max_name_length_(
          PROTOBUF_GET_WRAPPED_OR_DEFAULT(policy, max_name_length, DefaultMaxNameLength)) {
  THROW_IF_NOT_OK(validatePolicy(policy));
}

absl::Status
ClusterNamerImpl::validatePolicy(const corral::config::naming::v1::NamingPolicy& policy) {
  const uint64_t identity_budget =
      PROTOBUF_GET_WRAPPED_OR_DEFAULT(policy, identity_budget, DefaultIdentityBudget);
  const uint64_t max_name_length =
      PROTOBUF_GET_WRAPPED_OR_DEFAULT(policy, max_name_length, DefaultMaxNameLength);
  if (identity_budget == 0) {
    return absl::InvalidArgumentError("naming policy: identity_budget must be greater than 0");
  }
  if (max_name_length < identity_budget + NonIdentityLength) {
    return absl::InvalidArgumentError(
        absl::StrCat("naming policy: max_name_length ", max_name_length,
                     " cannot hold an identity budget of ", identity_budget, " plus ",
                     NonIdentityLength, " characters of separators, port and fingerprint"));
  }
  return absl::OkStatus();
}

std::string
ClusterNamerImpl::canonicalConfig(const corral::config::backend::v1::BackendDescriptor& backend) {
  std::string config;
  if (!backend.load_balancer_strategy().empty()) {
    appendString(config, "lb", backend.load_balancer_strategy());
  }
  if (backend.has_health_check()) {
    const auto& health_check = backend.health_check();
    absl::StrAppend(&config, "hc;");
    if (health_check.timeout_seconds() > 0) {
      absl::StrAppend(&config, "timeout=", formatDuration(health_check.timeout_seconds()), ";");
    }
    if (health_check.interval_seconds() > 0) {
      absl::StrAppend(&config, "interval=", formatDuration(health_check.interval_seconds()), ";");
    }
    if (health_check.unhealthy_threshold_count() > 0) {
      absl::StrAppend(&config, "unhealthy=", health_check.unhealthy_threshold_count(), ";");
    }
    if (health_check.healthy_threshold_count() > 0) {
      absl::StrAppend(&config, "healthy=", health_check.healthy_threshold_count(), ";");
    }
    if (!health_check.path().empty()) {
      appendString(config, "path", health_check.path());
    }
  }
  return config;
}

std::string
ClusterNamerImpl::configFingerprint(const corral::config::backend::v1::BackendDescriptor& backend) {
  return Common::Crypto::Utility::getHexDigest(ConfigFingerprintDigest, canonicalConfig(backend))
      .substr(0, ConfigFingerprintLength);
}

std::string
ClusterNamerImpl::clusterName(const corral::config::backend::v1::BackendDescriptor& backend) const {
  std::string name = absl::StrCat(
      Naming::hashName(identity_budget_, {backend.namespace_(), backend.name()}),
      Naming::SegmentSeparator, backend.port(), Naming::SegmentSeparator,
      configFingerprint(backend));
  if (name.size() > max_name_length_) {
    CORRAL_LOG(debug, "cluster name '{}' is longer than the {} character limit", name,
               max_name_length_);
  }
  return name;
}

} // namespace Upstream
} // namespace Corral

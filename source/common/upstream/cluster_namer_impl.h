#pragma once

#include <cstdint>
#include <string>

#include "corral/config/backend/v1/backend.pb.h"
#include "corral/config/naming/v1/naming.pb.h"
#include "corral/upstream/cluster_namer.h"

#include "source/common/common/logger.h"
#include "source/common/crypto/utility.h"

#include "absl/status/status.h"

namespace Corral {
namespace Upstream {

/**
 * Digest of the canonical configuration string. The first ConfigFingerprintLength hex characters
 * form the last segment of every cluster name.
 */
constexpr Common::Crypto::DigestAlgorithm ConfigFingerprintDigest =
    Common::Crypto::DigestAlgorithm::Sha1;
constexpr size_t ConfigFingerprintLength = 10;

/**
 * Cluster names have the form <namespace>/<name>/<port>/<fingerprint>. Namespace and name are
 * bounded by the identity budget of the naming policy; the fingerprint covers the load balancer
 * strategy and health check so that backends differing only in those never share a name.
 */
class ClusterNamerImpl : public ClusterNamer, Logger::Loggable<Logger::Id::upstream> {
public:
  static constexpr uint32_t DefaultIdentityBudget = 30;
  // Envoy's historical default for --max-obj-name-len.
  static constexpr uint32_t DefaultMaxNameLength = 60;
  // Room needed beyond the identity budget: the '/' joining namespace and name, then
  // '/' + a five digit port + '/' + the fingerprint.
  static constexpr uint32_t NonIdentityLength = 1 + 1 + 5 + 1 + ConfigFingerprintLength;

  /**
   * Constructs a namer with the default policy.
   */
  ClusterNamerImpl();

  /**
   * @param policy supplies the naming policy. Throws CorralException if the policy is invalid.
   */
  explicit ClusterNamerImpl(const corral::config::naming::v1::NamingPolicy& policy);

  /**
   * Checks that a policy leaves room for every segment of a cluster name.
   */
  static absl::Status validatePolicy(const corral::config::naming::v1::NamingPolicy& policy);

  /**
   * Renders the non-identity configuration of a backend into the string that is fingerprinted.
   * Each set field becomes a tagged entry terminated by ';', in this order:
   *   lb=<len>:<strategy>;
   *   hc;                      (whenever a health check is present, even if all zero)
   *   timeout=<duration>;      (h/m/s rendering, e.g. "1m30s")
   *   interval=<duration>;
   *   unhealthy=<count>;
   *   healthy=<count>;
   *   path=<len>:<path>;
   * Zero and empty values are omitted, so a backend without a strategy or health check renders
   * as the empty string.
   */
  static std::string
  canonicalConfig(const corral::config::backend::v1::BackendDescriptor& backend);

  /**
   * @return the fingerprint segment for a backend's configuration.
   */
  static std::string
  configFingerprint(const corral::config::backend::v1::BackendDescriptor& backend);

  uint32_t identityBudget() const { return identity_budget_; }
  uint32_t maxNameLength() const { return max_name_length_; }

  // Upstream::ClusterNamer
  std::string
  clusterName(const corral::config::backend::v1::BackendDescriptor& backend) const override;

private:
  const uint32_t identity_budget_;
  const uint32_t max_name_length_;
};

} // namespace Upstream
} // namespace Corral

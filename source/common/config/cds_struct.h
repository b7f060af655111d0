#pragma once

#include <cstdint>
#include <string>

#include "corral/config/backend/v1/backend.pb.h"
#include "corral/upstream/cluster_namer.h"

#include "source/common/common/logger.h"
#include "source/common/protobuf/protobuf.h"

#include "absl/strings/string_view.h"

namespace Corral {
namespace Config {

/**
 * Renders backends as Envoy cluster definitions in struct form.
 */
class CdsStruct : Logger::Loggable<Logger::Id::config> {
public:
  // Health check values used when the backend leaves a parameter at zero.
  static constexpr uint32_t DefaultHealthCheckTimeoutSeconds = 2;
  static constexpr uint32_t DefaultHealthCheckIntervalSeconds = 10;
  static constexpr uint32_t DefaultUnhealthyThresholdCount = 3;
  static constexpr uint32_t DefaultHealthyThresholdCount = 2;

  static constexpr absl::string_view ConnectTimeout = "0.250s";

  /**
   * Translate a backend to an EDS cluster.
   * @param namer supplies the cluster name for the backend.
   * @param backend source backend descriptor.
   * @param cluster destination cluster struct. Existing fields are replaced.
   */
  static void translateCluster(const Upstream::ClusterNamer& namer,
                               const corral::config::backend::v1::BackendDescriptor& backend,
                               ProtobufWkt::Struct& cluster);

  /**
   * Translate a backend health check to an HTTP health check entry of a cluster.
   * @param backend_health_check source health check.
   * @param health_check destination health check struct.
   */
  static void
  translateHealthCheck(const corral::config::backend::v1::HealthCheck& backend_health_check,
                       ProtobufWkt::Struct& health_check);

  /**
   * Maps a load balancer strategy to the cluster lb_policy enum name. Unknown and empty
   * strategies map to ROUND_ROBIN.
   */
  static std::string lbPolicy(absl::string_view strategy);

  /**
   * @return the EDS service name, namespace/name with the port name appended when it is set.
   */
  static std::string
  edsServiceName(const corral::config::backend::v1::BackendDescriptor& backend);
};

} // namespace Config
} // namespace Corral

#include "source/common/config/cds_struct.h"

#include <string>

#include "source/common/config/utility.h"
#include "source/common/config/well_known_names.h"
#include "source/common/protobuf/utility.h"

#include "absl/strings/str_cat.h"

namespace Corral {
namespace Config {

namespace {

uint32_t valueOrDefault(uint32_t value, uint32_t default_value) {
  return value > 0 ? value : default_value;
}

} // namespace

void CdsStruct::translateCluster(const Upstream::ClusterNamer& namer,
                                 const corral::config::backend::v1::BackendDescriptor& backend,
                                 ProtobufWkt::Struct& cluster) {
  cluster.Clear();
  auto& fields = *cluster.mutable_fields();

  const std::string name = namer.clusterName(backend);
  fields["name"] = ValueUtil::stringValue(name);
  fields["type"] = ValueUtil::stringValue("EDS");

  ProtobufWkt::Struct eds_cluster_config;
  (*eds_cluster_config.mutable_fields())["eds_config"] =
      ValueUtil::structValue(Utility::grpcConfigSource());
  (*eds_cluster_config.mutable_fields())["service_name"] =
      ValueUtil::stringValue(edsServiceName(backend));
  fields["eds_cluster_config"] = ValueUtil::structValue(eds_cluster_config);

  fields["connect_timeout"] = ValueUtil::stringValue(ConnectTimeout);
  fields["lb_policy"] = ValueUtil::stringValue(lbPolicy(backend.load_balancer_strategy()));

  if (backend.has_health_check()) {
    ProtobufWkt::Struct health_check;
    translateHealthCheck(backend.health_check(), health_check);
    fields["health_checks"] = ValueUtil::listValue({ValueUtil::structValue(health_check)});
  }

  CORRAL_LOG(trace, "translated backend {}/{}:{} to cluster {}", backend.namespace_(),
             backend.name(), backend.port(), name);
}

void CdsStruct::translateHealthCheck(
    const corral::config::backend::v1::HealthCheck& backend_health_check,
    ProtobufWkt::Struct& health_check) {
  health_check.Clear();
  auto& fields = *health_check.mutable_fields();

  fields["timeout"] = ValueUtil::stringValue(Utility::durationString(valueOrDefault(
      backend_health_check.timeout_seconds(), DefaultHealthCheckTimeoutSeconds)));
  fields["interval"] = ValueUtil::stringValue(Utility::durationString(valueOrDefault(
      backend_health_check.interval_seconds(), DefaultHealthCheckIntervalSeconds)));
  fields["unhealthy_threshold"] = ValueUtil::numberValue(valueOrDefault(
      backend_health_check.unhealthy_threshold_count(), DefaultUnhealthyThresholdCount));
  fields["healthy_threshold"] = ValueUtil::numberValue(valueOrDefault(
      backend_health_check.healthy_threshold_count(), DefaultHealthyThresholdCount));

  ProtobufWkt::Struct http_health_check;
  (*http_health_check.mutable_fields())["path"] =
      ValueUtil::stringValue(backend_health_check.path());
  (*http_health_check.mutable_fields())["host"] =
      ValueUtil::stringValue(XdsNames::get().HealthCheckHost);
  fields["http_health_check"] = ValueUtil::structValue(http_health_check);
}

std::string CdsStruct::lbPolicy(absl::string_view strategy) {
  if (strategy == "WeightedLeastRequest") {
    return "LEAST_REQUEST";
  } else if (strategy == "Random") {
    return "RANDOM";
  } else if (strategy == "RingHash") {
    return "RING_HASH";
  } else if (strategy == "Maglev") {
    return "MAGLEV";
  } else {
    return "ROUND_ROBIN";
  }
}

std::string
CdsStruct::edsServiceName(const corral::config::backend::v1::BackendDescriptor& backend) {
  if (backend.port_name().empty()) {
    return absl::StrCat(backend.namespace_(), "/", backend.name());
  }
  return absl::StrCat(backend.namespace_(), "/", backend.name(), "/", backend.port_name());
}

} // namespace Config
} // namespace Corral

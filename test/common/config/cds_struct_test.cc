#include <string>

#include "corral/config/backend/v1/backend.pb.h"

#include "source/common/config/cds_struct.h"
#include "source/common/upstream/cluster_namer_impl.h"

#include "test/mocks/upstream/cluster_namer.h"
#include "test/test_common/logging.h"
#include "test/test_common/utility.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::_;
using testing::Return;

namespace Corral {
namespace Config {
namespace {

class CdsStructTest : public testing::Test {
public:
  CdsStructTest() {
    backend_.set_namespace_("default");
    backend_.set_name("backend");
    backend_.set_port(80);
  }

  corral::config::backend::v1::BackendDescriptor backend_;
  Upstream::MockClusterNamer namer_;
};

TEST_F(CdsStructTest, EdsCluster) {
  EXPECT_CALL(namer_, clusterName(ProtoEq(backend_))).WillOnce(Return("some-cluster"));

  ProtobufWkt::Struct cluster;
  CdsStruct::translateCluster(namer_, backend_, cluster);
  EXPECT_THAT(cluster, ProtoEq(TestUtility::jsonToStruct(R"EOF(
{
  "name": "some-cluster",
  "type": "EDS",
  "eds_cluster_config": {
    "eds_config": {
      "api_config_source": {
        "api_type": "GRPC",
        "grpc_services": [{"envoy_grpc": {"cluster_name": "corral"}}]
      }
    },
    "service_name": "default/backend"
  },
  "connect_timeout": "0.250s",
  "lb_policy": "ROUND_ROBIN"
}
)EOF")));
}

TEST_F(CdsStructTest, HealthCheckedCluster) {
  backend_.set_port_name("http");
  backend_.set_load_balancer_strategy("Maglev");
  auto* health_check = backend_.mutable_health_check();
  health_check->set_path("/healthz");
  health_check->set_interval_seconds(5);
  health_check->set_timeout_seconds(30);
  health_check->set_unhealthy_threshold_count(3);
  health_check->set_healthy_threshold_count(1);

  Upstream::ClusterNamerImpl namer;
  ProtobufWkt::Struct cluster;
  CdsStruct::translateCluster(namer, backend_, cluster);
  EXPECT_THAT(cluster, ProtoEq(TestUtility::jsonToStruct(R"EOF(
{
  "name": "default/backend/80/91cdead208",
  "type": "EDS",
  "eds_cluster_config": {
    "eds_config": {
      "api_config_source": {
        "api_type": "GRPC",
        "grpc_services": [{"envoy_grpc": {"cluster_name": "corral"}}]
      }
    },
    "service_name": "default/backend/http"
  },
  "connect_timeout": "0.250s",
  "lb_policy": "MAGLEV",
  "health_checks": [{
    "timeout": "30s",
    "interval": "5s",
    "unhealthy_threshold": 3,
    "healthy_threshold": 1,
    "http_health_check": {"path": "/healthz", "host": "corral-envoy-healthcheck"}
  }]
}
)EOF")));
}

TEST_F(CdsStructTest, ReplacesExistingFields) {
  EXPECT_CALL(namer_, clusterName(_)).WillOnce(Return("some-cluster"));

  ProtobufWkt::Struct cluster = MessageUtil::keyValueStruct("stale", "value");
  CdsStruct::translateCluster(namer_, backend_, cluster);
  EXPECT_EQ(0U, cluster.fields().count("stale"));
  EXPECT_EQ("some-cluster", cluster.fields().at("name").string_value());
}

TEST_F(CdsStructTest, LogsTranslation) {
  EXPECT_CALL(namer_, clusterName(_)).WillOnce(Return("some-cluster"));

  ProtobufWkt::Struct cluster;
  EXPECT_LOG_CONTAINS("trace", "translated backend default/backend:80 to cluster some-cluster",
                      CdsStruct::translateCluster(namer_, backend_, cluster));
}

TEST_F(CdsStructTest, DistinctClusterDefinitionsGetDistinctNames) {
  Upstream::ClusterNamerImpl namer;
  ProtobufWkt::Struct without_health_check;
  CdsStruct::translateCluster(namer, backend_, without_health_check);

  backend_.mutable_health_check();
  ProtobufWkt::Struct with_default_health_check;
  CdsStruct::translateCluster(namer, backend_, with_default_health_check);

  EXPECT_EQ(0U, without_health_check.fields().count("health_checks"));
  EXPECT_EQ(1U, with_default_health_check.fields().count("health_checks"));
  EXPECT_NE(without_health_check.fields().at("name").string_value(),
            with_default_health_check.fields().at("name").string_value());
}

TEST(CdsStructHealthCheckTest, DefaultsForZeroValues) {
  corral::config::backend::v1::HealthCheck backend_health_check;
  backend_health_check.set_path("/ping");

  ProtobufWkt::Struct health_check;
  CdsStruct::translateHealthCheck(backend_health_check, health_check);
  EXPECT_THAT(health_check, ProtoEq(TestUtility::jsonToStruct(R"EOF(
{
  "timeout": "2s",
  "interval": "10s",
  "unhealthy_threshold": 3,
  "healthy_threshold": 2,
  "http_health_check": {"path": "/ping", "host": "corral-envoy-healthcheck"}
}
)EOF")));
}

TEST(CdsStructLbPolicyTest, LbPolicy) {
  EXPECT_EQ("ROUND_ROBIN", CdsStruct::lbPolicy(""));
  EXPECT_EQ("ROUND_ROBIN", CdsStruct::lbPolicy("RoundRobin"));
  EXPECT_EQ("ROUND_ROBIN", CdsStruct::lbPolicy("Fastest"));
  EXPECT_EQ("LEAST_REQUEST", CdsStruct::lbPolicy("WeightedLeastRequest"));
  EXPECT_EQ("RANDOM", CdsStruct::lbPolicy("Random"));
  EXPECT_EQ("RING_HASH", CdsStruct::lbPolicy("RingHash"));
  EXPECT_EQ("MAGLEV", CdsStruct::lbPolicy("Maglev"));
}

TEST(CdsStructEdsServiceNameTest, EdsServiceName) {
  corral::config::backend::v1::BackendDescriptor backend;
  backend.set_namespace_("kube-system");
  backend.set_name("dns");
  EXPECT_EQ("kube-system/dns", CdsStruct::edsServiceName(backend));
  backend.set_port_name("dns-tcp");
  EXPECT_EQ("kube-system/dns/dns-tcp", CdsStruct::edsServiceName(backend));
}

} // namespace
} // namespace Config
} // namespace Corral

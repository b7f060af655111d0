#include "source/common/config/lds_struct.h"

#include "test/test_common/utility.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace Corral {
namespace Config {
namespace {

TEST(LdsStructTest, TlsInspector) {
  const auto filter = LdsStruct::tlsInspector();
  EXPECT_EQ("envoy.listener.tls_inspector", filter.name());
  EXPECT_TRUE(filter.has_config());
  EXPECT_EQ(0, filter.config().fields_size());
}

TEST(LdsStructTest, HttpConnectionManager) {
  const auto filter = LdsStruct::httpConnectionManager("ingress_http", "/dev/stdout");
  EXPECT_EQ("envoy.http_connection_manager", filter.name());
  EXPECT_THAT(filter.config(), ProtoEq(TestUtility::jsonToStruct(R"EOF(
{
  "stat_prefix": "ingress_http",
  "rds": {
    "route_config_name": "ingress_http",
    "config_source": {
      "api_config_source": {
        "api_type": "GRPC",
        "grpc_services": [{"envoy_grpc": {"cluster_name": "corral"}}]
      }
    }
  },
  "http_filters": [
    {"name": "envoy.gzip"},
    {"name": "envoy.grpc_web"},
    {"name": "envoy.router"}
  ],
  "use_remote_address": true,
  "access_log": [{"name": "envoy.file_access_log", "config": {"path": "/dev/stdout"}}]
}
)EOF")));
}

TEST(LdsStructTest, AccessLog) {
  const auto access_log = LdsStruct::accessLog("/var/log/envoy/access.log");
  ASSERT_TRUE(access_log.has_list_value());
  ASSERT_EQ(1, access_log.list_value().values_size());
  const auto& entry = access_log.list_value().values(0).struct_value();
  EXPECT_EQ("envoy.file_access_log", entry.fields().at("name").string_value());
  EXPECT_EQ("/var/log/envoy/access.log",
            entry.fields().at("config").struct_value().fields().at("path").string_value());
}

} // namespace
} // namespace Config
} // namespace Corral

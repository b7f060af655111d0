#include "source/common/config/lds_struct.h"

#include <string>

#include "source/common/config/utility.h"
#include "source/common/config/well_known_names.h"
#include "source/common/protobuf/utility.h"

namespace Corral {
namespace Config {

namespace {

ProtobufWkt::Value namedFilter(const std::string& name) {
  ProtobufWkt::Struct filter;
  (*filter.mutable_fields())["name"] = ValueUtil::stringValue(name);
  return ValueUtil::structValue(filter);
}

} // namespace

corral::config::listener::v1::ListenerFilter LdsStruct::tlsInspector() {
  corral::config::listener::v1::ListenerFilter filter;
  filter.set_name(ListenerFilterNames::get().TlsInspector);
  filter.mutable_config();
  return filter;
}

corral::config::listener::v1::Filter
LdsStruct::httpConnectionManager(absl::string_view route_name, absl::string_view access_log_path) {
  ProtobufWkt::Struct rds;
  (*rds.mutable_fields())["route_config_name"] = ValueUtil::stringValue(route_name);
  (*rds.mutable_fields())["config_source"] = ValueUtil::structValue(Utility::grpcConfigSource());

  corral::config::listener::v1::Filter filter;
  filter.set_name(NetworkFilterNames::get().HttpConnectionManager);
  auto& fields = *filter.mutable_config()->mutable_fields();
  fields["stat_prefix"] = ValueUtil::stringValue(route_name);
  fields["rds"] = ValueUtil::structValue(rds);
  fields["http_filters"] = ValueUtil::listValue({
      namedFilter(HttpFilterNames::get().Gzip),
      namedFilter(HttpFilterNames::get().GrpcWeb),
      namedFilter(HttpFilterNames::get().Router),
  });
  fields["use_remote_address"] = ValueUtil::boolValue(true);
  fields["access_log"] = accessLog(access_log_path);
  return filter;
}

ProtobufWkt::Value LdsStruct::accessLog(absl::string_view path) {
  ProtobufWkt::Struct config;
  (*config.mutable_fields())["path"] = ValueUtil::stringValue(path);

  ProtobufWkt::Struct access_log;
  (*access_log.mutable_fields())["name"] = ValueUtil::stringValue(AccessLogNames::get().File);
  (*access_log.mutable_fields())["config"] = ValueUtil::structValue(config);
  return ValueUtil::listValue({ValueUtil::structValue(access_log)});
}

} // namespace Config
} // namespace Corral

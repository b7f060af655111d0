#include "source/common/config/utility.h"

#include <string>

#include "source/common/config/well_known_names.h"
#include "source/common/protobuf/utility.h"

#include "absl/strings/str_cat.h"

namespace Corral {
namespace Config {

ProtobufWkt::Struct Utility::grpcConfigSource() {
  ProtobufWkt::Struct envoy_grpc;
  (*envoy_grpc.mutable_fields())["cluster_name"] =
      ValueUtil::stringValue(XdsNames::get().ManagementCluster);

  ProtobufWkt::Struct grpc_service;
  (*grpc_service.mutable_fields())["envoy_grpc"] = ValueUtil::structValue(envoy_grpc);

  ProtobufWkt::Struct api_config_source;
  (*api_config_source.mutable_fields())["api_type"] = ValueUtil::stringValue(XdsNames::get().Grpc);
  (*api_config_source.mutable_fields())["grpc_services"] =
      ValueUtil::listValue({ValueUtil::structValue(grpc_service)});

  ProtobufWkt::Struct config_source;
  (*config_source.mutable_fields())["api_config_source"] =
      ValueUtil::structValue(api_config_source);
  return config_source;
}

std::string Utility::durationString(uint32_t seconds) { return absl::StrCat(seconds, "s"); }

} // namespace Config
} // namespace Corral

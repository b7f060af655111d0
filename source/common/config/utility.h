#pragma once

#include <cstdint>
#include <string>

#include "source/common/protobuf/protobuf.h"

namespace Corral {
namespace Config {

class Utility {
public:
  /**
   * Builds a config_source tree that points at the management server over gRPC. Both EDS for
   * generated clusters and RDS for generated listeners are served this way.
   * @return the config_source tree.
   */
  static ProtobufWkt::Struct grpcConfigSource();

  /**
   * Renders a whole number of seconds in the JSON form of google.protobuf.Duration, e.g. "10s".
   */
  static std::string durationString(uint32_t seconds);
};

} // namespace Config
} // namespace Corral

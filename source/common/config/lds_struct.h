#pragma once

#include "corral/config/listener/v1/listener_components.pb.h"

#include "source/common/protobuf/protobuf.h"

#include "absl/strings/string_view.h"

namespace Corral {
namespace Config {

/**
 * Builders for the fixed listener components of the ingress listeners.
 */
class LdsStruct {
public:
  /**
   * @return a TLS inspector listener filter with an empty config.
   */
  static corral::config::listener::v1::ListenerFilter tlsInspector();

  /**
   * Creates an HTTP connection manager filter that fetches its routes over RDS and writes an
   * access log.
   * @param route_name supplies the RDS route configuration name, also used as the stat prefix.
   * @param access_log_path supplies the file the access log is written to.
   * @return the network filter.
   */
  static corral::config::listener::v1::Filter
  httpConnectionManager(absl::string_view route_name, absl::string_view access_log_path);

  /**
   * @return a one element access_log list writing to path.
   */
  static ProtobufWkt::Value accessLog(absl::string_view path);
};

} // namespace Config
} // namespace Corral

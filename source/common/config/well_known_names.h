#pragma once

#include <string>

#include "source/common/singleton/const_singleton.h"

namespace Corral {
namespace Config {

/**
 * Well-known listener filter names.
 */
class ListenerFilterNameValues {
public:
  // TLS inspector, which extracts SNI and ALPN before filter chain selection.
  const std::string TlsInspector = "envoy.listener.tls_inspector";
};

using ListenerFilterNames = ConstSingleton<ListenerFilterNameValues>;

/**
 * Well-known network filter names.
 */
class NetworkFilterNameValues {
public:
  // HTTP connection manager filter
  const std::string HttpConnectionManager = "envoy.http_connection_manager";
};

using NetworkFilterNames = ConstSingleton<NetworkFilterNameValues>;

/**
 * Well-known HTTP filter names, in the order the connection manager installs them.
 */
class HttpFilterNameValues {
public:
  // Gzip compression filter
  const std::string Gzip = "envoy.gzip";
  // gRPC-Web filter
  const std::string GrpcWeb = "envoy.grpc_web";
  // Router filter, always last.
  const std::string Router = "envoy.router";
};

using HttpFilterNames = ConstSingleton<HttpFilterNameValues>;

/**
 * Well-known access logger names.
 */
class AccessLogNameValues {
public:
  // File access log
  const std::string File = "envoy.file_access_log";
};

using AccessLogNames = ConstSingleton<AccessLogNameValues>;

/**
 * Names shared by the generated clusters and listeners.
 */
class XdsNameValues {
public:
  // Static cluster through which Envoy reaches the management server.
  const std::string ManagementCluster = "corral";
  // Host header sent with active HTTP health checks.
  const std::string HealthCheckHost = "corral-envoy-healthcheck";
  // ApiConfigSource api_type for gRPC.
  const std::string Grpc = "GRPC";
};

using XdsNames = ConstSingleton<XdsNameValues>;

} // namespace Config
} // namespace Corral

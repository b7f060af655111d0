#pragma once

#include <string>

#include "corral/common/pure.h"
#include "corral/config/backend/v1/backend.pb.h"

namespace Corral {
namespace Upstream {

/**
 * Derives the Envoy cluster name of a backend. Implementations must be pure: the same descriptor
 * always maps to byte-identical output, since xDS clients diff resources by name.
 */
class ClusterNamer {
public:
  virtual ~ClusterNamer() = default;

  /**
   * @param backend supplies the backend to name.
   * @return the cluster name to use as the resource's name field.
   */
  virtual std::string
  clusterName(const corral::config::backend::v1::BackendDescriptor& backend) const PURE;
};

} // namespace Upstream
} // namespace Corral

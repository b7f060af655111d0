#pragma once

#include "google/protobuf/message.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "google/protobuf/wrappers.pb.h"

// Namespace alias for protobuf, so the rest of the tree does not spell out the library's
// namespaces directly.
namespace Corral {
namespace Protobuf = google::protobuf;
} // namespace Corral

// Well-known types live in the same namespace as the runtime.
namespace ProtobufWkt = google::protobuf;

// Namespace alias for the protobuf utility library (JSON conversion).
namespace ProtobufUtil = google::protobuf::util;

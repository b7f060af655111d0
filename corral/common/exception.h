#pragma once

#include <stdexcept>
#include <string>

#include "source/common/common/assert.h"

#include "absl/status/status.h"

namespace Corral {

#ifdef CORRAL_DISABLE_EXCEPTIONS
#define throwCorralExceptionOrPanic(x) PANIC(x)
#else
#define throwCorralExceptionOrPanic(x) throw ::Corral::CorralException(x)
#endif

/**
 * Base class for all corral exceptions.
 */
class CorralException : public std::runtime_error {
public:
  CorralException(const std::string& message) : std::runtime_error(message) {}
};

#define THROW_IF_NOT_OK_REF(status)                                                                \
  do {                                                                                             \
    if (!(status).ok()) {                                                                          \
      throwCorralExceptionOrPanic(std::string((status).message()));                                \
    }                                                                                              \
  } while (0)

// Simple macro to handle bridging functions which return absl::StatusOr, and
// functions which throw errors.
#define THROW_IF_NOT_OK(status_fn)                                                                 \
  do {                                                                                             \
    const absl::Status status = (status_fn);                                                       \
    THROW_IF_NOT_OK_REF(status);                                                                   \
  } while (0)

} // namespace Corral

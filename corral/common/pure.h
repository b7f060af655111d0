#pragma once

namespace Corral {
/**
 * Friendly name for a pure virtual routine.
 */
#define PURE = 0
} // namespace Corral

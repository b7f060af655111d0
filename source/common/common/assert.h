#pragma once

#include <cstdlib>
#include <string>

#include "source/common/common/logger.h"

namespace Corral {
namespace Assert {

// CONDITION_STR is needed to prevent macros in condition from being expected, which obfuscates
// the logged failure, e.g., "EAGAIN" vs "11".
#define _ASSERT_IMPL(CONDITION, CONDITION_STR, ACTION, DETAILS)                                    \
  do {                                                                                             \
    if (!(CONDITION)) {                                                                            \
      const std::string& details = (DETAILS);                                                      \
      CORRAL_LOG_TO_LOGGER(Corral::Logger::Registry::getLog(Corral::Logger::Id::assert), critical, \
                           "assert failure: {}.{}{}", CONDITION_STR,                               \
                           details.empty() ? "" : " Details: ", details);                          \
      ACTION;                                                                                      \
    }                                                                                              \
  } while (false)

// This non-implementation ensures that its argument is a valid expression that can be statically
// casted to a bool, but the expression is never evaluated and will be compiled away.
#define _NULL_ASSERT_IMPL(X, ...)                                                                  \
  do {                                                                                             \
    constexpr bool __assert_dummy_variable = false && static_cast<bool>(X);                        \
    (void)__assert_dummy_variable;                                                                 \
  } while (false)

/**
 * assert macro that uses our builtin logging which gives us thread ID and can log to various
 * sinks.
 *
 * RELEASE_ASSERT(foo == bar, "reason foo should actually be bar");
 * new uses of RELEASE_ASSERT should supply a verbose explanation of what went wrong.
 */
#define RELEASE_ASSERT(X, DETAILS) _ASSERT_IMPL(X, #X, ::abort(), DETAILS)

#define _ASSERT_ORIGINAL(X) _ASSERT_IMPL(X, #X, ::abort(), "")
#define _ASSERT_VERBOSE(X, Y) _ASSERT_IMPL(X, #X, ::abort(), Y)
#define _ASSERT_SELECTOR(_1, _2, ASSERT_MACRO, ...) ASSERT_MACRO

// This is a workaround for fact that MSVC expands __VA_ARGS__ after passing them into a macro,
// rather than before passing them into a macro.
#define EXPAND(X) X

#if !defined(NDEBUG)
// If ASSERT is called with one argument, the ASSERT_SELECTOR will return
// _ASSERT_ORIGINAL and this will call _ASSERT_ORIGINAL(__VA_ARGS__).
// If ASSERT is called with two arguments, ASSERT_SELECTOR will return
// _ASSERT_VERBOSE, and this will call _ASSERT_VERBOSE,(__VA_ARGS__)
#define ASSERT(...)                                                                                \
  EXPAND(_ASSERT_SELECTOR(__VA_ARGS__, _ASSERT_VERBOSE, _ASSERT_ORIGINAL)(__VA_ARGS__))
#else
#define ASSERT _NULL_ASSERT_IMPL
#endif // !defined(NDEBUG)

/**
 * Indicate a panic situation and exit.
 */
#define PANIC(X)                                                                                   \
  do {                                                                                             \
    CORRAL_LOG_TO_LOGGER(Corral::Logger::Registry::getLog(Corral::Logger::Id::assert), critical,   \
                         "panic: {}", X);                                                          \
    ::abort();                                                                                     \
  } while (false)

} // namespace Assert
} // namespace Corral

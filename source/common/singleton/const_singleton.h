#pragma once

#include "source/common/common/macros.h"

namespace Corral {

/**
 * ConstSingleton allows easy global cross-thread access to a const object.
 *
 * Used for tables of well-known names and other data that is built on first use and never
 * changed afterwards.
 */
template <class T> class ConstSingleton {
public:
  /**
   * Obtain an instance of the singleton for class T.
   * @return const T& a reference to the singleton for class T.
   */
  static const T& get() { CONSTRUCT_ON_FIRST_USE(T); }
};

} // namespace Corral

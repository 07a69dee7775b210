/// \file include/enum_types.h
/// \brief Enumerated types shared across soltran.

#ifndef ENUM_TYPES_H_
#define ENUM_TYPES_H_

#if defined(__INTEL_COMPILER)
#define BETTER_ENUMS_NO_CONSTEXPR
#endif

#define BETTER_ENUMS_DEFAULT_CONSTRUCTOR(Enum) \
  public:                                      \
    Enum() = default;

#include <enum.h>
#include "soltran/string_utils.h"

namespace soltran {


/// \brief Returns a better-enum object as a string.
template <typename T>
std::string enumToString(T e) {
  return stringutils::underscoreToSpace(e._to_string());
}


/// \enum transientPhase
/// \brief States of the transient state machine.
BETTER_ENUM(transientPhase, char,

  /**< Baseline solver run and t = 0 record */
  Initializing,

  /**< Fresh solution is added and the grid is rebuilt every tick */
  AccumulationPhase,

  /**< The grid is mutated in place by thermal expansion */
  ExpansionPhase,

  /**< The exit predicate of the last phase was met */
  Terminated,

  /**< A fatal error or a cancellation stopped the run */
  Aborted
)


/// \enum settingsFormat
/// \brief Formats of settings files.
BETTER_ENUM(settingsFormat, char,
  TOML,
  XML
)


} // namespace soltran

#endif  // ENUM_TYPES_H_

#pragma once

#define PASTEKEEP_VERSION_MAJOR 0
#define PASTEKEEP_VERSION_MINOR 1
#define PASTEKEEP_VERSION_PATCH 0

#define PASTEKEEP_VERSION_STRING "0.1.0"

// For compile-time version checks
#define PASTEKEEP_VERSION \
  (PASTEKEEP_VERSION_MAJOR * 10000 + PASTEKEEP_VERSION_MINOR * 100 + PASTEKEEP_VERSION_PATCH)

namespace pastekeep {

inline const char* Version() { return PASTEKEEP_VERSION_STRING; }

}  // namespace pastekeep

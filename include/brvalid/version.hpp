#pragma once

#define BRVALID_VERSION_MAJOR 0
#define BRVALID_VERSION_MINOR 2
#define BRVALID_VERSION_PATCH 0

#define BRVALID_VERSION_STRING "0.2.0"

// For compile-time version checks
#define BRVALID_VERSION \
  (BRVALID_VERSION_MAJOR * 10000 + BRVALID_VERSION_MINOR * 100 + BRVALID_VERSION_PATCH)

namespace brvalid {

inline const char* Version() { return BRVALID_VERSION_STRING; }

}  // namespace brvalid

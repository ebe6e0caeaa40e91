#pragma once

#define RULEMERGE_VERSION_MAJOR 0
#define RULEMERGE_VERSION_MINOR 1
#define RULEMERGE_VERSION_PATCH 0

#define RULEMERGE_VERSION_STRING "0.1.0"

// For compile-time version checks
#define RULEMERGE_VERSION \
  (RULEMERGE_VERSION_MAJOR * 10000 + RULEMERGE_VERSION_MINOR * 100 + RULEMERGE_VERSION_PATCH)

namespace rulemerge {

inline const char* Version() { return RULEMERGE_VERSION_STRING; }

}  // namespace rulemerge

#include "argus.hpp"

/*------------------------------------------------------------------------*/

// The version is usually given by the build system.

#ifndef ARGUS_VERSION
#define ARGUS_VERSION "1.0.0"
#endif

/*------------------------------------------------------------------------*/

namespace Argus {

const char *Solver::version () { return ARGUS_VERSION; }

const char *Solver::signature () { return "argus-" ARGUS_VERSION; }

} // namespace Argus

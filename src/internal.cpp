#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

Internal::Internal (const Framework &f)
    : framework (f), max_arg (f.size ()), semantics (COMPLETE),
      propagated (0), level (0), terminator (0), termination_forced (false),
      terminated (false), termination_check (0), error_code (NO_ERROR),
      prefix ("c "), opts (this), internal (this) {
  control.push_back (Level (-1, 0, 0));
  LOG ("new solver for %d arguments and %zu attacks", max_arg,
       f.attacks ());
}

Internal::~Internal () { LOG ("deleting solver"); }

} // namespace Argus

#include "internal.hpp"

namespace Argus {

// The assignment stack can only be (partially) reset through 'backtrack'
// which is the only function using 'unassign' (inlined and thus local to
// this file).

inline void Internal::unassign (int arg) {
  assert (val (arg));
  LOG (arg, "unassign");
  vals[arg] = UNASSIGNED;
}

/*------------------------------------------------------------------------*/

void Internal::backtrack (int new_level) {
  assert (new_level >= 0);
  assert (new_level <= level);
  if (new_level == level)
    return;

  stats.backtracks++;

  const size_t assigned = control[new_level + 1].trail;

  LOG ("backtracking to decision level %d with decision %d and trail %zu",
       new_level, control[new_level].decision, assigned);

  while (trail.size () > assigned) {
    unassign (trail.back ());
    trail.pop_back ();
  }

  propagated = trail.size ();
  control.resize (new_level + 1);
  level = new_level;
}

} // namespace Argus

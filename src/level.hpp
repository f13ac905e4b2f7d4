#ifndef _level_hpp_INCLUDED
#define _level_hpp_INCLUDED

namespace Argus {

// For each new decision we increase the decision level and push a 'Level'
// on the 'control' stack.  Backtracking to a level pops all assignments
// above 'trail' of the next level.

struct Level {
  int decision;         // decision argument of level ('-1' on root level)
  int label;            // label assigned to the decision argument
  size_t trail;         // trail height before the decision

  Level (int d, int l, size_t t) : decision (d), label (l), trail (t) {}
  Level () {}
};

} // namespace Argus

#endif

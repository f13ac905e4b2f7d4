#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

// Reset the search state for a new search under the given semantics.  The
// allowed labels are the only difference between complete and stable
// search.  Queries may restrict them further before 'traverse'.

void Internal::init_search (Semantics new_semantics) {
  semantics = new_semantics;
  const int mask = (semantics == STABLE) ? (IN | OUT) : ANY_LABEL;
  vals.assign (max_arg, UNASSIGNED);
  allowed.assign (max_arg, mask);
  trail.clear ();
  propagated = 0;
  control.clear ();
  control.push_back (Level (-1, 0, 0));
  level = 0;
  terminated = false;
  termination_check = opts.terminateint;
}

void Internal::restrict_labels (int arg, int mask) {
  assert (!level);
  assert (!val (arg));
  allowed[arg] &= mask;
  LOG (arg, "restricted allowed labels to %d", (int) allowed[arg]);
}

/*------------------------------------------------------------------------*/

// A forced termination is consumed by the search it aborts.  The connected
// terminator is polled every 'terminateint' decisions.

bool Internal::terminating () {
  if (terminated)
    return true;
  if (termination_forced) {
    termination_forced = false;
    LOG ("termination forced");
    terminated = true;
  } else if (terminator && termination_check-- <= 0) {
    termination_check = opts.terminateint;
    if (terminator->terminate ()) {
      LOG ("connected terminator forces termination");
      terminated = true;
    }
  }
  if (terminated)
    stats.terminated++;
  return terminated;
}

/*------------------------------------------------------------------------*/

// All arguments are assigned and propagation succeeded.  Then the labelling
// is complete by construction, which 'check' makes sure of.

bool Internal::leaf (LabellingIterator &it) {
  assert (trail.size () == (size_t) max_arg);
  if (opts.check) {
    if (!is_complete_labelling (framework, vals))
      FATAL ("search produced labelling which is not complete");
    if (semantics == STABLE && !is_stable_labelling (framework, vals))
      FATAL ("search produced labelling which is not stable");
  }
  stats.labellings++;
  LOG ("found labelling %" PRId64, stats.labellings);
  return it.labelling (vals);
}

// Depth first search over the remaining unassigned arguments.  Returns
// 'false' if the iterator or termination stopped the search.

bool Internal::search (size_t position, LabellingIterator &it) {
  if (terminating ())
    return false;
  const int arg = next_decision_argument (position);
  if (arg < 0)
    return leaf (it);
  const int before = level;
  for (const auto &label : branches) {
    if (!is_allowed (arg, label))
      continue;
    decide (arg, label);
    bool res = true;
    if (propagate ())
      res = search (position, it);
    backtrack (before);
    if (!res)
      return false;
  }
  return true;
}

bool Internal::traverse (LabellingIterator &it) {
  stats.searches++;
  PHASE ("search", stats.searches, "%s labellings of %d arguments",
         semantics == STABLE ? "stable" : "complete", max_arg);
  init_order ();
  bool res = true;
  if (root_propagate ())
    res = search (0, it);
  else
    LOG ("root level conflict");
  if (terminated)
    VERBOSE (1, "search %" PRId64 " terminated", stats.searches);
  return res;
}

/*------------------------------------------------------------------------*/

// The least complete labelling is reached by root level propagation
// without any decision.  Remaining unassigned arguments are 'UNDEC'.

void Internal::grounded (Labelling &res) {
  init_search (COMPLETE);
  if (!root_propagate ())
    FATAL ("root level conflict while computing grounded labelling");
  res.resize (max_arg);
  for (int arg = 0; arg < max_arg; arg++) {
    const int tmp = val (arg);
    res[arg] = tmp ? tmp : UNDEC;
  }
  PHASE ("grounded", "labelling assigns %zu of %d arguments",
         trail.size (), max_arg);
}

} // namespace Argus

#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

// Assignments are pushed on the trail and propagated later.  A label which
// is not allowed for the argument anymore yields a conflict instead.

bool Internal::assign (int arg, int label) {
  assert (is_label (label));
  assert (!val (arg));
  if (!is_allowed (arg, label)) {
    LOG (arg, "label %s not allowed for", label_name (label));
    stats.conflicts++;
    return false;
  }
  vals[arg] = label;
  trail.push_back (arg);
  LOG (arg, "assign");
  return true;
}

bool Internal::conflict (int arg, const char *reason) {
  LOG (arg, "conflict (%s)", reason);
  stats.conflicts++;
  return false;
}

/*------------------------------------------------------------------------*/

// The local consistency rules of complete labellings.  Counting the labels
// of the attackers of 'arg' determines what is forced for 'arg' itself (if
// unassigned) or for its unassigned attackers (if 'arg' is assigned).  All
// these implications hold in every complete labelling extending the
// current partial labelling.  Self attacks need no special treatment.

bool Internal::examine (int arg) {
  stats.examined++;

  int in = 0, undec = 0, unassigned = 0, last = -1;
  for (const auto &attacker : framework.attackers (arg)) {
    const int tmp = val (attacker);
    if (tmp == IN)
      in++;
    else if (tmp == UNDEC)
      undec++;
    else if (!tmp)
      unassigned++, last = attacker;
  }

  const int label = val (arg);

  if (!label) {
    const int forced = forced_label (framework, vals, arg);
    if (forced)
      return assign (arg, forced);
    if (unassigned)
      return true;
    assert (undec);
    return assign (arg, UNDEC);
  }

  if (label == IN) {
    if (in)
      return conflict (arg, "attacked by 'in'");
    if (undec)
      return conflict (arg, "attacked by 'undec'");
    if (!unassigned)
      return true;
    for (const auto &attacker : framework.attackers (arg))
      if (!val (attacker) && !assign (attacker, OUT))
        return false;
    return true;
  }

  if (label == OUT) {
    if (in)
      return true;
    if (!unassigned)
      return conflict (arg, "no 'in' attacker");
    if (unassigned > 1)
      return true;
    return assign (last, IN);
  }

  assert (label == UNDEC);
  if (in)
    return conflict (arg, "attacked by 'in'");
  if (unassigned) {
    if (unassigned > 1 || undec)
      return true;
    return assign (last, UNDEC);
  }
  if (!undec)
    return conflict (arg, "all attackers 'out'");
  return true;
}

/*------------------------------------------------------------------------*/

// An assigned argument changes the attacker counts of the arguments it
// attacks, and its own label has to be consistent with its attackers.

bool Internal::propagate () {
  while (propagated < trail.size ()) {
    const int arg = trail[propagated++];
    stats.propagations++;
    if (!examine (arg))
      return false;
    for (const auto &target : framework.attacked (arg))
      if (!examine (target))
        return false;
  }
  return true;
}

// Without branching all arguments have to be examined once, which forces
// unattacked arguments to 'IN' and starts the fixed point computation of
// the grounded labelling.

bool Internal::root_propagate () {
  assert (!level);
  for (int arg = 0; arg < max_arg; arg++)
    if (!examine (arg))
      return false;
  return propagate ();
}

} // namespace Argus

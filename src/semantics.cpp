#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

// Mark the members of a candidate set, thus also removing duplicates.

static void mark_set (const Framework &framework, const vector<int> &set,
                      vector<signed char> &marked) {
  marked.assign (framework.size (), 0);
  for (const auto &arg : set) {
    assert (0 <= arg), assert (arg < framework.size ());
    marked[arg] = 1;
  }
}

// Mark the arguments attacked by the members of the set.

static void mark_attacked (const Framework &framework,
                           const vector<signed char> &marked,
                           vector<signed char> &attacked) {
  attacked.assign (framework.size (), 0);
  for (int arg = 0; arg < framework.size (); arg++) {
    if (!marked[arg])
      continue;
    for (const auto &target : framework.attacked (arg))
      attacked[target] = 1;
  }
}

/*------------------------------------------------------------------------*/

bool is_defended (const Framework &framework,
                  const vector<signed char> &marked, int arg) {
  for (const auto &attacker : framework.attackers (arg)) {
    bool defended = false;
    for (const auto &defender : framework.attackers (attacker))
      if (marked[defender]) {
        defended = true;
        break;
      }
    if (!defended)
      return false;
  }
  return true;
}

static bool conflict_free (const Framework &framework,
                           const vector<signed char> &marked) {
  for (int arg = 0; arg < framework.size (); arg++) {
    if (!marked[arg])
      continue;
    for (const auto &target : framework.attacked (arg))
      if (marked[target])
        return false;
  }
  return true;
}

static bool admissible (const Framework &framework,
                        const vector<signed char> &marked) {
  if (!conflict_free (framework, marked))
    return false;
  for (int arg = 0; arg < framework.size (); arg++)
    if (marked[arg] && !is_defended (framework, marked, arg))
      return false;
  return true;
}

/*------------------------------------------------------------------------*/

bool is_conflict_free (const Framework &framework, const vector<int> &set) {
  vector<signed char> marked;
  mark_set (framework, set, marked);
  return conflict_free (framework, marked);
}

bool is_admissible (const Framework &framework, const vector<int> &set) {
  vector<signed char> marked;
  mark_set (framework, set, marked);
  return admissible (framework, marked);
}

// Admissible and containing every argument it defends.

bool is_complete (const Framework &framework, const vector<int> &set) {
  vector<signed char> marked;
  mark_set (framework, set, marked);
  if (!admissible (framework, marked))
    return false;
  for (int arg = 0; arg < framework.size (); arg++)
    if (!marked[arg] && is_defended (framework, marked, arg))
      return false;
  return true;
}

// Conflict free and attacking every argument outside of the set.

bool is_stable (const Framework &framework, const vector<int> &set) {
  vector<signed char> marked, attacked;
  mark_set (framework, set, marked);
  if (!conflict_free (framework, marked))
    return false;
  mark_attacked (framework, marked, attacked);
  for (int arg = 0; arg < framework.size (); arg++)
    if (!marked[arg] && !attacked[arg])
      return false;
  return true;
}

/*------------------------------------------------------------------------*/

bool is_complete_labelling (const Framework &framework,
                            const vector<signed char> &labels) {
  if ((int) labels.size () != framework.size ())
    return false;
  for (int arg = 0; arg < framework.size (); arg++) {
    bool all_out = true, some_in = false;
    for (const auto &attacker : framework.attackers (arg)) {
      const int tmp = labels[attacker];
      if (tmp == IN)
        some_in = true;
      if (tmp != OUT)
        all_out = false;
    }
    const int expected = all_out ? IN : some_in ? OUT : UNDEC;
    if (labels[arg] != expected)
      return false;
  }
  return true;
}

bool is_stable_labelling (const Framework &framework,
                          const vector<signed char> &labels) {
  if (!is_complete_labelling (framework, labels))
    return false;
  for (const auto &label : labels)
    if (label == UNDEC)
      return false;
  return true;
}

/*------------------------------------------------------------------------*/

bool can_be_in (const Framework &framework,
                const vector<signed char> &labels, int arg) {
  for (const auto &attacker : framework.attackers (arg))
    if (labels[attacker] != OUT)
      return false;
  return true;
}

bool must_be_out (const Framework &framework,
                  const vector<signed char> &labels, int arg) {
  for (const auto &attacker : framework.attackers (arg))
    if (labels[attacker] == IN)
      return true;
  return false;
}

int forced_label (const Framework &framework,
                  const vector<signed char> &labels, int arg) {
  if (must_be_out (framework, labels, arg))
    return OUT;
  if (can_be_in (framework, labels, arg))
    return IN;
  return UNASSIGNED;
}

} // namespace Argus

#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

// Any fixed order is sound and only changes the performance.  With
// 'order=2' arguments involved in many attacks are decided first, which
// tends to trigger more propagation.  Ties keep the input order.

void Internal::init_order () {
  order.resize (max_arg);
  for (int arg = 0; arg < max_arg; arg++)
    order[arg] = arg;
  if (opts.order == 1)
    reverse (order.begin (), order.end ());
  else if (opts.order == 2) {
    const Framework &f = framework;
    stable_sort (order.begin (), order.end (), [&f] (int a, int b) {
      return f.attackers (a).size () + f.attacked (a).size () >
             f.attackers (b).size () + f.attacked (b).size ();
    });
  }
}

// Arguments before 'position' in the order are assigned on this and all
// deeper levels, thus the search for the next one continues from there.

int Internal::next_decision_argument (size_t &position) {
  while (position < order.size () && val (order[position]))
    position++;
  if (position == order.size ())
    return -1;
  const int res = order[position];
  LOG (res, "next decision argument at position %zu", position);
  return res;
}

/*------------------------------------------------------------------------*/

void Internal::new_level (int arg, int label) {
  level++;
  control.push_back (Level (arg, label, trail.size ()));
}

void Internal::decide (int arg, int label) {
  assert (propagated == trail.size ());
  assert (!val (arg));
  assert (is_allowed (arg, label));
  stats.decisions++;
  new_level (arg, label);
  LOG (arg, "decide %s", label_name (label));
  const bool ok = assign (arg, label);
  assert (ok);
  (void) ok;
}

} // namespace Argus

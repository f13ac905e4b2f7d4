#include "../../src/argus.hpp"
#include "../../src/semantics.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

using namespace std;
using namespace Argus;

// Compare search based answers against brute force enumeration of all
// labellings and all candidate extensions on small random frameworks.

static uint64_t state = 42;

static unsigned pick (unsigned n) {
  state = state * 6364136223846793005ull + 1442695040888963407ull;
  return (unsigned) (state >> 33) % n;
}

struct Collector : LabellingIterator {
  vector<Labelling> found;
  bool labelling (const Labelling &labels) {
    found.push_back (labels);
    return true;
  }
};

static void enumerate (const Framework &f, Labelling &labels, int arg,
                       vector<Labelling> &complete) {
  if (arg == f.size ()) {
    if (is_complete_labelling (f, labels))
      complete.push_back (labels);
    return;
  }
  const int labels_to_try[] = {IN, OUT, UNDEC};
  for (const auto &label : labels_to_try) {
    labels[arg] = label;
    enumerate (f, labels, arg + 1, complete);
  }
}

static bool is_stable_one (const Labelling &labels) {
  return find (labels.begin (), labels.end (), (signed char) UNDEC) ==
         labels.end ();
}

static vector<int> members (const Labelling &labels) {
  vector<int> res;
  for (size_t arg = 0; arg < labels.size (); arg++)
    if (labels[arg] == IN)
      res.push_back ((int) arg);
  return res;
}

static void check (const Framework &f, int order, int prune) {
  const int n = f.size ();

  vector<Labelling> complete, stable;
  Labelling labels (n, 0);
  enumerate (f, labels, 0, complete);
  for (const auto &l : complete)
    if (is_stable_one (l))
      stable.push_back (l);

  // A complete labelling always exists.
  //
  assert (!complete.empty ());

  Solver solver (f);
  solver.set ("order", order);
  solver.set ("prune", prune);

  // Search finds exactly the complete and stable labellings.
  //
  Collector co, st;
  assert (solver.traverse (COMPLETE, co));
  assert (solver.traverse (STABLE, st));
  sort (co.found.begin (), co.found.end ());
  sort (st.found.begin (), st.found.end ());
  sort (complete.begin (), complete.end ());
  sort (stable.begin (), stable.end ());
  assert (co.found == complete);
  assert (st.found == stable);

  // Every stable labelling is complete.
  //
  for (const auto &l : stable)
    assert (is_complete_labelling (f, l));

  // The grounded labelling is the complete one with the least 'IN' set.
  //
  Labelling grounded;
  solver.grounded (grounded);
  assert (find (complete.begin (), complete.end (), grounded) !=
          complete.end ());
  for (const auto &l : complete)
    for (int arg = 0; arg < n; arg++)
      if (grounded[arg] == IN)
        assert (l[arg] == IN);

  // Extension predicates agree with the labellings on all subsets.
  //
  for (unsigned mask = 0; mask < (1u << n); mask++) {
    vector<int> set;
    vector<string> names;
    for (int arg = 0; arg < n; arg++)
      if (mask & (1u << arg))
        set.push_back (arg), names.push_back (f.name (arg));
    bool is_co = false, is_st = false;
    for (const auto &l : complete)
      if (members (l) == set)
        is_co = true, is_st = is_stable_one (l);
    assert (is_complete (f, set) == is_co);
    assert (is_stable (f, set) == is_st);
    assert (solver.evaluate (VE_CO, names) == (is_co ? YES : NO));
    assert (solver.evaluate (VE_ST, names) == (is_st ? YES : NO));
  }

  // Acceptance problems.
  //
  for (int arg = 0; arg < n; arg++) {
    bool dc_co = false, ds_co = true, dc_st = false, ds_st = true;
    for (const auto &l : complete)
      if (l[arg] == IN)
        dc_co = true;
      else
        ds_co = false;
    for (const auto &l : stable)
      if (l[arg] == IN)
        dc_st = true;
      else
        ds_st = false;

    const vector<string> target = {f.name (arg)};
    assert (solver.evaluate (DC_CO, target) == (dc_co ? YES : NO));
    assert (solver.evaluate (DS_CO, target) == (ds_co ? YES : NO));
    assert (solver.evaluate (DC_ST, target) == (dc_st ? YES : NO));
    assert (solver.evaluate (DS_ST, target) == (ds_st ? YES : NO));

    solver.set ("vacuous", 0);
    const bool strict = ds_st && !stable.empty ();
    assert (solver.evaluate (DS_ST, target) == (strict ? YES : NO));
    solver.set ("vacuous", 1);

    solver.set ("grounded", 1);
    assert (solver.evaluate (DS_CO, target) == (ds_co ? YES : NO));
    solver.set ("grounded", 0);

    // Skeptical acceptance implies credulous acceptance.
    //
    if (ds_co)
      assert (dc_co);
    if (ds_st && !stable.empty ())
      assert (dc_st);
  }
}

int main () {
  const int rounds = 300;
  size_t total = 0;
  for (int round = 0; round < rounds; round++) {
    const int n = pick (7);
    const unsigned density = 1 + pick (4);
    vector<string> arguments;
    for (int arg = 0; arg < n; arg++)
      arguments.push_back (string ("a") + to_string (arg));
    vector<Attack> attacks;
    for (int i = 0; i < n; i++)
      for (int j = 0; j < n; j++)
        if (pick (8) < density)
          attacks.push_back (Attack (arguments[i], arguments[j]));
    Framework f;
    assert (f.build (arguments, attacks) == NO_ERROR);
    check (f, pick (3), pick (2));
    total += f.size ();
  }
  printf ("checked %d random frameworks with %zu arguments\n", rounds,
          total);
  return 0;
}

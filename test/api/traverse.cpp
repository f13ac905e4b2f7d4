#include "../../src/argus.hpp"
#include "../../src/semantics.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using namespace Argus;

// Collects labellings and optionally stops after a limit.

struct Collector : LabellingIterator {
  const Framework &framework;
  Semantics semantics;
  size_t limit;
  vector<Labelling> found;

  Collector (const Framework &f, Semantics s, size_t l = 0)
      : framework (f), semantics (s), limit (l) {}

  bool labelling (const Labelling &labels) {
    assert (is_complete_labelling (framework, labels));
    if (semantics == STABLE)
      assert (is_stable_labelling (framework, labels));
    for (const auto &label : labels)
      cout << (label == IN ? 'i' : label == OUT ? 'o' : 'u');
    cout << endl;
    found.push_back (labels);
    return !limit || found.size () < limit;
  }
};

static Labelling make (const char *str) {
  Labelling res;
  for (const char *p = str; *p; p++)
    res.push_back (*p == 'i' ? IN : *p == 'o' ? OUT : UNDEC);
  return res;
}

int main () {

  Framework cycle;
  cycle.build ({"a", "b"}, {{"a", "b"}, {"b", "a"}});

  // Branching order is 'UNDEC', 'IN', 'OUT' over arguments in input order.
  {
    Solver solver (cycle);
    assert (&solver.framework () == &cycle);
    Collector collector (cycle, COMPLETE);
    assert (solver.traverse (COMPLETE, collector));
    assert (collector.found.size () == 3);
    assert (collector.found[0] == make ("uu"));
    assert (collector.found[1] == make ("io"));
    assert (collector.found[2] == make ("oi"));
  }

  // Same with reversed order.
  {
    Solver solver (cycle);
    solver.set ("order", 1);
    Collector collector (cycle, COMPLETE);
    assert (solver.traverse (COMPLETE, collector));
    assert (collector.found.size () == 3);
    assert (collector.found[0] == make ("uu"));
    assert (collector.found[1] == make ("oi"));
    assert (collector.found[2] == make ("io"));
  }

  // Stable labellings skip 'UNDEC'.
  {
    Solver solver (cycle);
    Collector collector (cycle, STABLE);
    assert (solver.traverse (STABLE, collector));
    assert (collector.found.size () == 2);
    assert (collector.found[0] == make ("io"));
    assert (collector.found[1] == make ("oi"));
  }

  // The iterator stops the enumeration.
  {
    Solver solver (cycle);
    Collector collector (cycle, COMPLETE, 2);
    assert (!solver.traverse (COMPLETE, collector));
    assert (collector.found.size () == 2);
  }

  // Reinstatement 'a <-> b -> c -> d' with isolated 'e'.  All orders give
  // the same labellings and repeated traversals the same sequence.
  {
    Framework f;
    f.build ({"a", "b", "c", "d", "e"},
             {{"a", "b"}, {"b", "a"}, {"b", "c"}, {"c", "d"}});
    vector<Labelling> first;
    for (int order = 0; order <= 2; order++) {
      Solver solver (f);
      solver.set ("order", order);
      Collector complete (f, COMPLETE);
      assert (solver.traverse (COMPLETE, complete));
      assert (complete.found.size () == 3);
      Collector again (f, COMPLETE);
      assert (solver.traverse (COMPLETE, again));
      assert (again.found == complete.found);
      sort (complete.found.begin (), complete.found.end ());
      if (first.empty ())
        first = complete.found;
      else
        assert (first == complete.found);
      Collector stable (f, STABLE);
      assert (solver.traverse (STABLE, stable));
      assert (stable.found.size () == 2);
    }
    assert (find (first.begin (), first.end (), make ("uuuui")) !=
            first.end ());
    assert (find (first.begin (), first.end (), make ("ioioi")) !=
            first.end ());
    assert (find (first.begin (), first.end (), make ("oioii")) !=
            first.end ());
  }

  // Odd cycle without stable labelling.
  {
    Framework f;
    f.build ({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"c", "a"}});
    Solver solver (f);
    Collector stable (f, STABLE);
    assert (solver.traverse (STABLE, stable));
    assert (stable.found.empty ());
    Collector complete (f, COMPLETE);
    assert (solver.traverse (COMPLETE, complete));
    assert (complete.found.size () == 1);
    assert (complete.found[0] == make ("uuu"));
  }

  return 0;
}

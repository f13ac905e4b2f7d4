#include "../../src/argus.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace Argus;

// Terminates after a given number of polls.

struct Counter : Terminator {
  int polls, limit;
  Counter (int l) : polls (0), limit (l) {}
  bool terminate () { return ++polls > limit; }
};

int main () {

  // Chain of two-cycles has many complete labellings but none of them
  // accepts the self attacking argument 'z' thus the search is exhaustive.
  //
  const int n = 12;
  vector<string> arguments;
  vector<Attack> attacks;
  for (int i = 0; i < n; i++) {
    const string a = "a" + to_string (i), b = "b" + to_string (i);
    arguments.push_back (a);
    arguments.push_back (b);
    attacks.push_back (Attack (a, b));
    attacks.push_back (Attack (b, a));
  }
  arguments.push_back ("z");
  attacks.push_back (Attack ("z", "z"));

  Framework f;
  assert (f.build (arguments, attacks) == NO_ERROR);

  {
    Solver solver (f);
    solver.set ("terminateint", 0);
    Counter counter (100);
    solver.connect_terminator (&counter);
    assert (solver.evaluate (DC_CO, {"z"}) == UNKNOWN);
    assert (counter.polls == 101);
    assert (solver.error () == NO_ERROR);

    // Verification does not search.
    //
    assert (solver.evaluate (VE_CO, {}) == YES);

    solver.disconnect_terminator ();
    assert (solver.evaluate (DC_CO, {"z"}) == NO);
  }

  // Forced termination aborts the next search only.
  {
    Solver solver (f);
    solver.terminate ();
    assert (solver.evaluate (DC_ST, {"a0"}) == UNKNOWN);
    assert (solver.evaluate (DC_ST, {"a0"}) == NO);
    assert (solver.evaluate (DC_CO, {"a0"}) == YES);
  }

  // A terminator never asking to stop changes nothing.
  {
    Solver solver (f);
    Counter counter (1 << 30);
    solver.connect_terminator (&counter);
    assert (solver.evaluate (DS_CO, {"b3"}) == NO);
    assert (solver.evaluate (DC_CO, {"z"}) == NO);
    assert (counter.polls > 0);
  }

  return 0;
}

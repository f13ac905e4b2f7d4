#include "../../src/argus.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <string>
#include <thread>
#include <vector>

using namespace std;
using namespace Argus;

// One framework shared by solvers in different threads.  Each thread runs
// all queries and has to produce the same answers as a single solver.

static const Problem problems[] = {DC_CO, DS_CO, DC_ST, DS_ST};

static void run (const Framework *f, int order, vector<int> *answers) {
  Solver solver (*f);
  solver.set ("order", order);
  for (const auto &problem : problems)
    for (int arg = 0; arg < f->size (); arg++)
      answers->push_back (solver.evaluate (problem, {f->name (arg)}));
}

int main () {

  const int n = 14;
  vector<string> arguments;
  vector<Attack> attacks;
  for (int i = 0; i < n; i++)
    arguments.push_back ("x" + to_string (i));
  for (int i = 0; i < n; i++) {
    attacks.push_back (Attack (arguments[i], arguments[(i + 1) % n]));
    if (i % 3 == 0)
      attacks.push_back (Attack (arguments[(i + 5) % n], arguments[i]));
    if (i % 4 == 1)
      attacks.push_back (Attack (arguments[i], arguments[i]));
  }

  Framework f;
  assert (f.build (arguments, attacks) == NO_ERROR);

  vector<int> expected;
  run (&f, 0, &expected);

  const int threads = 8;
  vector<vector<int>> answers (threads);
  vector<thread> workers;
  for (int i = 0; i < threads; i++)
    workers.push_back (thread (run, &f, i % 3, &answers[i]));
  for (auto &worker : workers)
    worker.join ();

  for (const auto &a : answers)
    assert (a == expected);

  return 0;
}

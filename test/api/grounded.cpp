#include "../../src/argus.hpp"
#include "../../src/semantics.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace Argus;

static void expect (const vector<string> &arguments,
                    const vector<Attack> &attacks, const char *expected) {
  Framework f;
  assert (f.build (arguments, attacks) == NO_ERROR);
  Solver solver (f);
  Labelling labels;
  solver.grounded (labels);
  assert ((int) labels.size () == f.size ());
  assert (is_complete_labelling (f, labels));
  for (int arg = 0; arg < f.size (); arg++) {
    const char ch = expected[arg];
    const int label = ch == 'i' ? IN : ch == 'o' ? OUT : UNDEC;
    assert (labels[arg] == label);
  }
  assert (!expected[f.size ()]);

  // Skeptical complete acceptance is membership in the grounded extension
  // with and without the shortcut.
  //
  for (int arg = 0; arg < f.size (); arg++) {
    const Result expected = labels[arg] == IN ? YES : NO;
    solver.set ("grounded", 0);
    assert (solver.evaluate (DS_CO, {f.name (arg)}) == expected);
    solver.set ("grounded", 1);
    assert (solver.evaluate (DS_CO, {f.name (arg)}) == expected);
  }
}

int main () {
  expect ({}, {}, "");
  expect ({"a"}, {}, "i");
  expect ({"a"}, {{"a", "a"}}, "u");
  expect ({"a", "b"}, {{"a", "b"}, {"b", "a"}}, "uu");
  expect ({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}}, "ioi");
  expect ({"a", "b", "c", "d"}, {{"a", "b"}, {"b", "c"}, {"c", "d"}},
          "ioio");
  expect ({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"c", "a"}}, "uuu");

  // Reinstatement through an unattacked argument 'd' defending 'c'.
  //
  expect ({"a", "b", "c", "d"},
          {{"a", "b"}, {"b", "a"}, {"b", "c"}, {"d", "b"}}, "ioii");

  // An undecided cycle only partially blocks propagation.
  //
  expect ({"a", "b", "c", "d", "e"},
          {{"a", "b"}, {"b", "a"}, {"b", "c"}, {"d", "e"}}, "uuuio");

  // Self attacking attacker of an otherwise unattacked argument.
  //
  expect ({"a", "b", "c"}, {{"a", "a"}, {"a", "b"}, {"c", "a"}}, "oii");

  return 0;
}

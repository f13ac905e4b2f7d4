#include "../../src/argus.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>
#include <cstring>

using namespace Argus;

int main () {

  Framework f;
  f.build ({"a", "b"}, {{"a", "b"}});
  Solver solver (f);

  assert (solver.error () == NO_ERROR);
  assert (!solver.error_message ());

  // Acceptance problems need exactly one target argument.
  //
  const Problem acceptance[] = {DC_CO, DS_CO, DC_ST, DS_ST};
  for (const auto &problem : acceptance) {
    assert (solver.evaluate (problem, {}) == FAILED);
    assert (solver.error () == ARITY);
    assert (strstr (solver.error_message (), Solver::problem_name (problem)));
    assert (solver.evaluate (problem, {"a", "b"}) == FAILED);
    assert (solver.error () == ARITY);
    assert (solver.evaluate (problem, {"z"}) == FAILED);
    assert (solver.error () == UNKNOWN_ARGUMENT);
    assert (strstr (solver.error_message (), "'z'"));

    // Errors only affect the failing query.
    //
    assert (solver.evaluate (problem, {"a"}) == YES);
    assert (solver.error () == NO_ERROR);
    assert (!solver.error_message ());
  }

  // Verification problems accept any number of arguments but all of them
  // have to be in the framework.
  //
  assert (solver.evaluate (VE_CO, {"a", "x"}) == FAILED);
  assert (solver.error () == UNKNOWN_ARGUMENT);
  assert (strstr (solver.error_message (), "'x'"));
  assert (solver.evaluate (VE_ST, {"A"}) == FAILED);
  assert (solver.error () == UNKNOWN_ARGUMENT);
  assert (solver.evaluate (VE_ST, {"a"}) == YES);
  assert (solver.evaluate (VE_ST, {"a", "a"}) == YES);
  assert (solver.evaluate (VE_CO, {"b"}) == NO);
  assert (solver.error () == NO_ERROR);

  // Targets are sets, so a repeated name is a single target argument and
  // unknown names are reported before the arity.
  //
  {
    Framework g;
    g.build ({"a", "b"}, {{"a", "b"}, {"b", "a"}});
    Solver other (g);
    assert (other.evaluate (DC_CO, {"a", "a"}) == YES);
    assert (other.error () == NO_ERROR);
    assert (other.evaluate (DS_ST, {"b", "b"}) == NO);
    assert (other.evaluate (DC_CO, {"a", "a", "b"}) == FAILED);
    assert (other.error () == ARITY);
    assert (other.evaluate (DS_CO, {"z", "a"}) == FAILED);
    assert (other.error () == UNKNOWN_ARGUMENT);
  }

  // Problem names.
  //
  Problem problem;
  assert (Solver::problem ("DS-ST", problem));
  assert (problem == DS_ST);
  assert (Solver::problem ("VE-CO", problem));
  assert (problem == VE_CO);
  assert (!Solver::problem ("DS-PR", problem));
  assert (!Solver::problem ("ds-st", problem));
  assert (!strcmp (Solver::problem_name (DC_ST), "DC-ST"));

  return 0;
}

#include "../../src/argus.hpp"

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <cassert>

int main () {

  Argus::Framework framework;

  Argus::Error err =
      framework.build ({"a", "b", "c"}, {{"a", "b"}, {"b", "a"}, {"b", "c"}});
  assert (err == Argus::NO_ERROR);
  assert (framework.built ());

  Argus::Solver solver (framework);

  int res = solver.evaluate (Argus::DC_ST, {"c"});
  assert (res == Argus::YES); // '{a,c}' is stable.

  res = solver.evaluate (Argus::DS_ST, {"c"});
  assert (res == Argus::NO); // '{b}' is stable too.

  res = solver.evaluate (Argus::VE_CO, {});
  assert (res == Argus::YES); // Grounded extension is empty.

  res = solver.evaluate (Argus::DC_CO, {"a", "c"});
  assert (res == Argus::FAILED); // Exactly one argument required.
  assert (solver.error () == Argus::ARITY);

  return 0;
}

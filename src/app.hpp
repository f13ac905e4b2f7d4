#ifndef _app_hpp_INCLUDED
#define _app_hpp_INCLUDED

#include "argus.hpp"
#include "signal.hpp"

#include <string>
#include <vector>

namespace Argus {

class Solver;
class Framework;

// A wrapper app which makes up the Argus stand alone solver.  It in
// essence only consists of the 'App::main' function.  So this class
// contains code, which is not required if only the library interface in
// 'argus.hpp' is used.  It uses the static signal handling of 'Signal' and
// is thus not reentrant.  If you want to use multiple instances of the
// solver use the 'Solver' interface directly.

class App : public Handler {

  Framework *framework;
  Solver *solver;

  // Options collected before the solver exists.
  //
  std::vector<const char *> long_options;
  int verbosity;
  bool quiet, logging;
  int time_limit;
  volatile bool timed_out;

  // Printing.

  static void usage ();
  static void error (const char *, ...) ARGUS_ATTRIBUTE_FORMAT (1, 2);
  void banner ();

  bool configure ();
  bool read_framework (const char *path);

public:
  App ();
  ~App ();

  int main (int arg, char **argv);

  // Interrupts print statistics.  The alarm terminates the search.
  //
  void catch_signal (int sig);
  void catch_alarm ();
};

} // namespace Argus

#endif

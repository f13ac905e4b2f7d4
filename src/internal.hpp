#ifndef _internal_hpp_INCLUDED
#define _internal_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// Common 'C' headers.

#include <cassert>
#include <cctype>
#include <cinttypes>
#include <climits>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

/*------------------------------------------------------------------------*/

// Common 'C++' headers.

#include <algorithm>
#include <string>
#include <vector>

/*------------------------------------------------------------------------*/

// All internal headers are included here.  This gives a nice overview on
// what is needed altogether.  The 'Internal' class needs almost all the
// headers anyhow and most implementation files need to see its definition
// too.  The other benefit of having all header files here is that '.cpp'
// files then only need to include this.

#include "argus.hpp"
#include "contract.hpp"
#include "format.hpp"
#include "label.hpp"
#include "level.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "options.hpp"
#include "resources.hpp"
#include "semantics.hpp"
#include "stats.hpp"
#include "util.hpp"

/*------------------------------------------------------------------------*/

namespace Argus {

using namespace std;

struct Internal {

  /*----------------------------------------------------------------------*/

  // The actual internal data of the solver for one framework.  All of it
  // is search state of the current query except for options, statistics
  // and the terminator.

  const Framework &framework; // read-only and shared among solvers
  int max_arg;                // number of arguments
  Semantics semantics;        // of the current search
  Labelling vals;             // current partial labelling
  vector<unsigned char> allowed; // labels still allowed per argument
  vector<int> order;          // decision order of arguments
  vector<int> trail;          // assigned arguments
  size_t propagated;          // next trail position to propagate
  vector<Level> control;      // 'level + 1 == control.size ()'
  int level;                  // decision level

  Terminator *terminator;         // connected terminator if non zero
  volatile bool termination_forced; // asynchronous termination flag
  bool terminated;            // current search was terminated
  int64_t termination_check;  // remaining decisions until next check

  Error error_code;           // kind of last query failure
  Format error_message;       // provide persistent error message
  string prefix;              // verbose messages prefix

  Options opts;               // run-time options
  Stats stats;                // statistics

  Internal *internal;         // proxy to 'this' in macros

  /*----------------------------------------------------------------------*/

  Internal (const Framework &);
  ~Internal ();

  int val (int arg) const {
    assert (0 <= arg), assert (arg < max_arg);
    return vals[arg];
  }

  bool is_allowed (int arg, int label) const {
    return allowed[arg] & label;
  }

  // Assigning an argument fails if the label is not allowed anymore.  This
  // is how stable semantics and query goals prune the search space.
  //
  bool assign (int arg, int label);
  void unassign (int arg);
  bool conflict (int arg, const char *reason);

  // Local consistency of one argument with respect to its attackers.  It
  // either forces labels on the argument or its attackers, or detects a
  // conflict, in which case 'false' is returned.
  //
  bool examine (int arg);

  // Propagation to fixed point of all unpropagated trail entries.  The root
  // version first examines all arguments once.
  //
  bool propagate ();
  bool root_propagate ();

  // Decisions in 'decide.cpp'.
  //
  void init_order ();
  int next_decision_argument (size_t &position);
  void new_level (int arg, int label);
  void decide (int arg, int label);

  void backtrack (int new_level);

  // Search in 'search.cpp'.
  //
  void init_search (Semantics);
  void restrict_labels (int arg, int mask);
  bool terminating ();
  bool leaf (LabellingIterator &);
  bool search (size_t position, LabellingIterator &);
  bool traverse (LabellingIterator &);
  void grounded (Labelling &);

  // Query engine in 'query.cpp'.
  //
  Result fail (Error, const char *fmt, ...);
  bool find_targets (const vector<string> &, vector<int> &);
  Result verify (Semantics, const vector<int> &);
  Result decide_acceptance (Semantics, int target, bool credulous);
  bool exists (Semantics);
  Result evaluate (Problem, const vector<string> &);

  /*----------------------------------------------------------------------*/

  double process_time (); // since solver was initialized
  double real_time ();    // since solver was initialized

  void print_statistics () { stats.print (this); }

  /*----------------------------------------------------------------------*/

#ifndef QUIET

  void print_prefix ();

  // Non-verbose messages, i.e., always printed unless 'quiet' is set,
  // which disables messages at run-time, or even 'QUIET' is defined which
  // disables such messages completely at compile-time.
  //
  void vmessage (const char *, va_list &);
  void message (const char *, ...) ARGUS_ATTRIBUTE_FORMAT (2, 3);
  void message (); // empty line

  // Verbose messages with explicit verbose 'level' controlled by
  // 'opts.verbose' (verbose level '0' gives the same as 'message').
  //
  void vverbose (int level, const char *fmt, va_list &);
  void verbose (int level, const char *fmt, ...)
      ARGUS_ATTRIBUTE_FORMAT (3, 4);

  // This is for printing section headers in the form
  //
  //  c ---- [ <title> ] ---------------------
  //
  // nicely aligned (and of course is ignored if 'quiet' is set).
  //
  void section (const char *title);

  // Print verbose message about phases if 'opts.verbose > 1' (but not if
  // 'quiet' is set).  The 'phase' argument is used to print a prefix
  //
  //  c [<phase>] ...
  //
  void phase (const char *phase, const char *, ...)
      ARGUS_ATTRIBUTE_FORMAT (3, 4);

  // Same as the last 'phase' above except that the prefix gets a count:
  //
  //  c [<phase>-<count>] ...
  //
  void phase (const char *phase, int64_t count, const char *, ...)
      ARGUS_ATTRIBUTE_FORMAT (4, 5);
#endif

  // Print error messages which are really always printed (even if 'quiet'
  // is set).  In contrast to 'fatal' they do not abort.
  //
  void error_message_start ();
  void verror (const char *, va_list &);

private:
  Internal (const Internal &);
  Internal &operator= (const Internal &);
};

// Fatal internal error which leads to abort.
//
void fatal (const char *, ...) ARGUS_ATTRIBUTE_FORMAT (1, 2);

} // namespace Argus

#endif

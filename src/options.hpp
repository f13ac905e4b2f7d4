#ifndef _options_hpp_INCLUDED
#define _options_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// In order to add a new option, simply add a new line below. Make sure that
// options are sorted correctly (with '!}sort -k 2' in 'vi').  Otherwise
// initializing the options will trigger an internal error.

#define OPTIONS \
\
/*      NAME         DEFAULT, LO, HI, USAGE */ \
\
OPTION( check,             1,  0,  1, "check labellings before reporting") \
OPTION( grounded,          0,  0,  1, "skeptical complete by grounded") \
LOGOPT( log,               0,  0,  1, "enable logging") \
OPTION( order,             0,  0,  2, "0=input, 1=reverse, 2=degree") \
OPTION( prune,             1,  0,  1, "prune branches against query goal") \
QUTOPT( quiet,             0,  0,  1, "disable all messages") \
OPTION( terminateint,     10,  0,1e4, "termination check interval") \
OPTION( vacuous,           1,  0,  1, "skeptical stable holds if none") \
QUTOPT( verbose,           0,  0,  3, "more verbose messages") \

// Note, keep an empty line right before this line because of the last '\'!
// Also keep those single spaces after 'OPTION(' for proper sorting.

/*------------------------------------------------------------------------*/

// Some of the 'OPTION' macros above should only be included if certain
// compile time options are enabled.  This has the effect, that for instance
// if 'LOGGING' is defined, and thus logging code is included, then also the
// 'log' option is defined.  Otherwise the 'log' option is not included.

#ifdef LOGGING
#define LOGOPT OPTION
#else
#define LOGOPT(...) /**/
#endif

#ifdef QUIET
#define QUTOPT(...) /**/
#else
#define QUTOPT OPTION
#endif

/*------------------------------------------------------------------------*/

#include <cassert>
#include <cstddef>
#include <string>

namespace Argus {

struct Internal;

/*------------------------------------------------------------------------*/

class Options;

struct Option {
  const char *name;
  int def, lo, hi;
  const char *description;
  int &val (Options *);
};

/*------------------------------------------------------------------------*/

// Produce a compile time constant for the number of options.

static const size_t number_of_options =
#define OPTION(N, V, L, H, D) 1 +
    OPTIONS
#undef OPTION
    + 0;

/*------------------------------------------------------------------------*/

class Options {

  Internal *internal;

  void set (Option *, int val); // Force to [lo,hi] interval.

  friend struct Option;
  static Option table[];

  static void initialize_from_environment (int &val, const char *name,
                                           const int L, const int H);

public:
  Options (Internal *);

  // Makes options directly accessible, e.g., for instance declares the
  // member 'int prune' here.  This will give fast access to option values
  // internally in the solver and thus can also be used in tight loops.
  //
private:
  int __start_of_options__; // Used by 'val' below.
public:
#define OPTION(N, V, L, H, D) \
  int N; // Access option values by name.
  OPTIONS
#undef OPTION

  // This construction relies on '__start_of_options__' and that the
  // following options are really allocated directly after it.
  //
  inline int &val (size_t idx) {
    assert (idx < number_of_options);
    return (&__start_of_options__ + 1)[idx];
  }

  // Binary search over the sorted option 'table'.  This static data is
  // shared among different instances of the solver.  The actual current
  // option values are here in the 'Options' class.
  //
  static Option *has (const char *name);

  bool set (const char *name, int); // Explicit version.
  int get (const char *name);       // Get current value.

  void print ();        // Print current values in command line form
  static void usage (); // Print usage message for all options.

  // Parse option value string.  Only '<int>', '<int>e<int>', 'true' and
  // 'false' are supported.
  //
  static bool parse_option_value (const char *, int &);

  // Parse long option argument
  //
  //   --<name>
  //   --<name>=<val>
  //   --no-<name>
  //
  // where '<val>' is as in 'parse_option_value'.  If parsing succeeds,
  // 'true' is returned and the string will be set to the name of the
  // option.  Additionally the parsed value is set (last argument).
  //
  static bool parse_long_option (const char *, std::string &, int &);

  // Iterating options.

  typedef Option *iterator;
  typedef const Option *const_iterator;

  static iterator begin () { return table; }
  static iterator end () { return table + number_of_options; }
};

inline int &Option::val (Options *opts) {
  assert (Options::table <= this &&
          this < Options::table + number_of_options);
  return opts->val (this - Options::table);
}

} // namespace Argus

#endif

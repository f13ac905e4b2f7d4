#ifndef _argus_hpp_INCLUDED
#define _argus_hpp_INCLUDED

#include <cstdint>
#include <cstdio>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/*------------------------------------------------------------------------*/

// Check 'printf' style format strings of message functions.

#if defined(__GNUC__) || defined(__clang__)
#define ARGUS_ATTRIBUTE_FORMAT(FORMAT_POSITION, VARIADIC_ARGUMENT_POSITION) \
  __attribute__ ((format (printf, FORMAT_POSITION, VARIADIC_ARGUMENT_POSITION)))
#else
#define ARGUS_ATTRIBUTE_FORMAT(FORMAT_POSITION, VARIADIC_ARGUMENT_POSITION) /**/
#endif

/*------------------------------------------------------------------------*/

namespace Argus {

/*========================================================================*/

// This provides the actual API of the Argus argumentation solver.  There
// are two classes.  A 'Framework' holds the arguments and the attack
// relation and is immutable after 'build'.  A 'Solver' answers queries
// against one framework and owns all the mutable search state.  Thus a
// framework can be shared among solvers running in different threads.

/*========================================================================*/

// [Example]
//
// Consider the following code (from 'test/api/example.cpp'):
//
//   Argus::Framework framework;
//
//   framework.build ({ "a", "b", "c" },
//                    { { "a", "b" }, { "b", "a" }, { "b", "c" } });
//
//   Argus::Solver solver (framework);
//
//   int res = solver.evaluate (Argus::DC_ST, { "c" });
//   assert (res == Argus::YES);    // '{a,c}' is stable.
//
//   res = solver.evaluate (Argus::DS_ST, { "c" });
//   assert (res == Argus::NO);     // '{b}' is stable too.
//
//   res = solver.evaluate (Argus::VE_CO, { });
//   assert (res == Argus::YES);    // Grounded extension is empty.
//
//   res = solver.evaluate (Argus::DC_CO, { "a", "c" });
//   assert (res == Argus::FAILED); // Exactly one argument required.
//   assert (solver.error () == Argus::ARITY);

/*========================================================================*/

// Labels of a labelling.  They are bits so that a set of labels still
// allowed for an argument fits into one byte.  Zero means unassigned.

enum Label {
  IN = 1,
  OUT = 2,
  UNDEC = 4,
};

enum Semantics {
  COMPLETE = 1,
  STABLE = 2,
};

enum Problem {
  VE_CO = 0,            // verify complete extension
  DC_CO = 1,            // credulous acceptance under complete semantics
  DS_CO = 2,            // skeptical acceptance under complete semantics
  VE_ST = 3,            // verify stable extension
  DC_ST = 4,            // credulous acceptance under stable semantics
  DS_ST = 5,            // skeptical acceptance under stable semantics
};

// The answer of 'evaluate'.  Similar to the SAT competition exit codes we
// use '10' for the affirmative and '20' for the negative answer.

enum Result {
  UNKNOWN = 0,          // search terminated early
  YES = 10,
  NO = 20,
  FAILED = 30,          // query rejected, see 'error ()'
};

enum Error {
  NO_ERROR = 0,
  MALFORMED_FRAMEWORK = 1,      // attack references undeclared argument
  UNKNOWN_ARGUMENT = 2,         // query names argument not in framework
  ARITY = 3,                    // acceptance query without single target
};

typedef std::pair<std::string, std::string> Attack;

typedef std::vector<signed char> Labelling;

/*------------------------------------------------------------------------*/

struct Internal;

class Terminator;
class LabellingIterator;

/*------------------------------------------------------------------------*/

class Framework {

public:

  Framework ();
  ~Framework ();

  // Declare all arguments and attacks at once.  Duplicates are ignored.
  // Returns 'MALFORMED_FRAMEWORK' if an attack mentions an argument not in
  // 'arguments' and leaves the framework unbuilt in that case.  The
  // failure is described by 'error_message ()'.
  //
  //   require (!built ())
  //   ensure (res || built ())
  //
  Error build (const std::vector<std::string> & arguments,
               const std::vector<Attack> & attacks);

  bool built () const { return _built; }

  const char * error_message () const;

  //------------------------------------------------------------------------
  // Structural queries, all require 'built ()'.  Arguments are numbered
  // from zero in the order of their first declaration.

  int size () const;                         // number of arguments
  size_t attacks () const;                   // number of attacks

  bool contains (const std::string &) const;
  int index (const std::string &) const;     // '-1' if not contained
  const std::string & name (int idx) const;

  const std::vector<int> & attackers (int idx) const;
  const std::vector<int> & attacked (int idx) const;

  const std::vector<int> & attackers (const std::string &) const;
  const std::vector<int> & attacked (const std::string &) const;

  // Returns the names of the 'IN' arguments of the given labelling.
  //
  std::vector<std::string> extension (const Labelling &) const;

private:

  bool _built;
  std::vector<std::string> names;
  std::vector<std::vector<int>> attackers_of;
  std::vector<std::vector<int>> attacked_by;
  std::unordered_map<std::string, int> indices;
  size_t num_attacks;
  std::string failure;

  // Not copyable (solvers keep a reference).
  //
  Framework (const Framework &);
  Framework & operator= (const Framework &);
};

/*------------------------------------------------------------------------*/

class Solver {

public:

  // The framework has to be built already and has to outlive the solver.
  //
  Solver (const Framework &);
  ~Solver ();

  // Map problem codes such as 'DC-ST' to 'Problem'.
  //
  static bool problem (const char * name, Problem & res);
  static const char * problem_name (Problem);

  // Main query function.  For 'VE_*' problems the target is the candidate
  // extension (possibly empty), otherwise it has to contain exactly one
  // argument.  Returns 'YES', 'NO', 'FAILED' or 'UNKNOWN' if the search
  // was terminated through 'terminate' or the connected terminator.
  //
  Result evaluate (Problem, const std::vector<std::string> & target);

  // Kind and description of the failure of the last 'evaluate' call.
  //
  Error error () const;
  const char * error_message () const;

  // The grounded labelling which is computed without any branching.
  //
  void grounded (Labelling &);

  // Enumerate complete or stable labellings in deterministic order until
  // the iterator returns 'false'.  Returns 'false' if the enumeration was
  // aborted by the iterator or by termination.
  //
  bool traverse (Semantics, LabellingIterator &);

  /*----------------------------------------------------------------------*/

  // Forcing termination asynchronously, e.g., from another thread.
  //
  void terminate ();

  // Alternatively poll a terminator every 'terminateint' decisions.
  //
  void connect_terminator (Terminator *);
  void disconnect_terminator ();

  /*----------------------------------------------------------------------*/

  // Options are explicitly named in 'options.hpp'.  Values outside of the
  // range of an option are clipped.  Returns 'false' if the option does
  // not exist.
  //
  bool set (const char * name, int val);
  int get (const char * name);

  // Same but for long command line options '--<name>=<val>', '--<name>'
  // and '--no-<name>'.
  //
  bool set_long_option (const char * arg);

  static bool is_valid_option (const char * name);
  static bool is_valid_long_option (const char * arg);

  void options ();          // print current option values
  static void usage ();     // print option usage

  /*----------------------------------------------------------------------*/

  static const char * signature ();     // name and version
  static const char * version ();

  void statistics ();       // print statistics
  void section (const char * title);
  void message (const char * fmt, ...) ARGUS_ATTRIBUTE_FORMAT (2, 3);
  void verbose (int level, const char * fmt, ...)
      ARGUS_ATTRIBUTE_FORMAT (3, 4);
  void error (const char * fmt, ...) ARGUS_ATTRIBUTE_FORMAT (2, 3);

  const Framework & framework () const;

private:

  Internal * internal;

  Solver (const Solver &);
  Solver & operator= (const Solver &);
};

/*========================================================================*/

// Connected terminators are checked for termination regularly.  If the
// 'terminate' function of the terminator returns true the search is
// aborted and 'evaluate' returns 'UNKNOWN'.

class Terminator {
public:
  virtual ~Terminator () {}
  virtual bool terminate () = 0;
};

// Receives the complete (or stable) labellings found by the search.  If
// 'labelling' returns false the search stops.

class LabellingIterator {
public:
  virtual ~LabellingIterator () {}
  virtual bool labelling (const Labelling &) = 0;
};

} // namespace Argus

#endif

#ifndef _stats_hpp_INCLUDED
#define _stats_hpp_INCLUDED

#include <cstdint>

namespace Argus {

struct Internal;

struct Stats {

  int64_t queries;      // number of 'evaluate' calls
  int64_t failed;       // rejected queries (unknown argument or arity)
  int64_t verified;     // answered by extension predicates only
  int64_t searches;     // labelling searches started

  int64_t decisions;    // number of decisions in 'decide'
  int64_t propagations; // propagated trail entries
  int64_t examined;     // local consistency checks of arguments
  int64_t conflicts;    // conflicts found in 'propagate'
  int64_t backtracks;   // number of backtracks

  int64_t labellings;   // complete (or stable) labellings found
  int64_t terminated;   // searches aborted by termination

  int64_t sections;     // printed sections

  struct {
    double process, real;
  } time;

  Stats ();

  void print (Internal *);
};

} // namespace Argus

#endif

#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

// The six problems only differ in the semantics and in the kind of query.
// Verification problems take a candidate extension (possibly empty) as
// target while acceptance problems require exactly one argument.

enum Kind {
  VERIFY = 0,
  CREDULOUS = 1,
  SKEPTICAL = 2,
};

struct ProblemInfo {
  const char *name;
  Semantics semantics;
  Kind kind;
};

static const ProblemInfo problems[] = {
    {"VE-CO", COMPLETE, VERIFY},   {"DC-CO", COMPLETE, CREDULOUS},
    {"DS-CO", COMPLETE, SKEPTICAL}, {"VE-ST", STABLE, VERIFY},
    {"DC-ST", STABLE, CREDULOUS},  {"DS-ST", STABLE, SKEPTICAL},
};

static const int number_of_problems = sizeof problems / sizeof *problems;

bool Solver::problem (const char *name, Problem &res) {
  for (int i = 0; i < number_of_problems; i++) {
    if (strcmp (problems[i].name, name))
      continue;
    res = (Problem) i;
    return true;
  }
  return false;
}

const char *Solver::problem_name (Problem problem) {
  REQUIRE (0 <= (int) problem && (int) problem < number_of_problems,
           "invalid problem '%d'", (int) problem);
  return problems[problem].name;
}

/*------------------------------------------------------------------------*/

Result Internal::fail (Error error, const char *fmt, ...) {
  assert (error != NO_ERROR);
  stats.failed++;
  error_code = error;
  va_list ap;
  va_start (ap, fmt);
  error_message.vinit (fmt, ap);
  va_end (ap);
  VERBOSE (1, "query failed: %s", (const char *) error_message);
  return FAILED;
}

// Map target names to indices.  Duplicated names collapse.

bool Internal::find_targets (const vector<string> &names,
                             vector<int> &res) {
  for (const auto &name : names) {
    const int idx = framework.index (name);
    if (idx < 0) {
      fail (UNKNOWN_ARGUMENT, "argument '%s' not in framework",
            name.c_str ());
      return false;
    }
    if (find (res.begin (), res.end (), idx) == res.end ())
      res.push_back (idx);
  }
  return true;
}

Result Internal::verify (Semantics semantics, const vector<int> &set) {
  stats.verified++;
  const bool res = (semantics == STABLE) ? is_stable (framework, set)
                                         : is_complete (framework, set);
  return res ? YES : NO;
}

/*------------------------------------------------------------------------*/

// Credulous queries look for a labelling with the target 'IN' while
// skeptical ones look for a counter example with the target not 'IN'.
// Both stop at the first labelling found.

class Acceptance : public LabellingIterator {
  const int target;
  const bool credulous;

public:
  bool found;

  Acceptance (int t, bool c) : target (t), credulous (c), found (false) {}

  bool labelling (const Labelling &labels) {
    if ((labels[target] == IN) != credulous)
      return true;
    found = true;
    return false;
  }
};

class Existence : public LabellingIterator {
public:
  bool found;
  Existence () : found (false) {}
  bool labelling (const Labelling &) {
    found = true;
    return false;
  }
};

bool Internal::exists (Semantics semantics) {
  init_search (semantics);
  Existence existence;
  traverse (existence);
  return existence.found;
}

Result Internal::decide_acceptance (Semantics semantics, int target,
                                    bool credulous) {

  // A complete labelling always exists and the grounded one is the least
  // complete labelling.  Thus skeptical acceptance is membership in the
  // grounded extension.
  //
  if (!credulous && semantics == COMPLETE && opts.grounded) {
    stats.verified++;
    Labelling labels;
    grounded (labels);
    return labels[target] == IN ? YES : NO;
  }

  init_search (semantics);
  if (opts.prune)
    restrict_labels (target, credulous ? IN : (OUT | UNDEC));

  Acceptance acceptance (target, credulous);
  traverse (acceptance);
  if (terminated)
    return UNKNOWN;

  if (credulous)
    return acceptance.found ? YES : NO;
  if (acceptance.found)
    return NO;

  // Without any stable extension every argument is skeptically accepted,
  // unless 'vacuous' is disabled.
  //
  if (semantics == STABLE && !opts.vacuous) {
    const bool res = exists (STABLE);
    if (terminated)
      return UNKNOWN;
    if (!res) {
      VERBOSE (1, "no stable labelling thus not skeptically accepted");
      return NO;
    }
  }

  return YES;
}

/*------------------------------------------------------------------------*/

Result Internal::evaluate (Problem problem, const vector<string> &target) {
  stats.queries++;
  error_code = NO_ERROR;
  error_message.clear ();

  const ProblemInfo &info = problems[problem];
  VERBOSE (1, "evaluating '%s' query %" PRId64 " with %zu target arguments",
           info.name, stats.queries, target.size ());

  vector<int> targets;
  if (!find_targets (target, targets))
    return FAILED;

  // Targets are sets, thus duplicated names count once.
  //
  if (info.kind != VERIFY && targets.size () != 1)
    return fail (ARITY, "'%s' expects exactly one argument but got %d",
                 info.name, (int) targets.size ());

  Result res;
  if (info.kind == VERIFY)
    res = verify (info.semantics, targets);
  else
    res = decide_acceptance (info.semantics, targets[0],
                             info.kind == CREDULOUS);

  VERBOSE (1, "'%s' query %" PRId64 " answered %s", info.name,
           stats.queries,
           res == YES ? "YES" : res == NO ? "NO" : "UNKNOWN");
  return res;
}

} // namespace Argus

#ifndef _semantics_hpp_INCLUDED
#define _semantics_hpp_INCLUDED

#include <vector>

namespace Argus {

class Framework;

// Extension predicates over a candidate set of argument indices.  They are
// used for the verification problems directly and do not need any search.
// Duplicated indices in the set are ignored.  The empty set is conflict
// free and admissible.

bool is_conflict_free (const Framework &, const std::vector<int> &set);
bool is_admissible (const Framework &, const std::vector<int> &set);
bool is_complete (const Framework &, const std::vector<int> &set);
bool is_stable (const Framework &, const std::vector<int> &set);

// Whether 'arg' is defended by the set, i.e., every attacker of 'arg' is
// attacked by some member of the set.  The set is given as marks.
//
bool is_defended (const Framework &, const std::vector<signed char> &marked,
                  int arg);

// Labelling predicates for total labellings.  A labelling is complete if
// it is a fixed point of the characteristic update rule:
//
//   'IN'    iff all attackers are 'OUT'
//   'OUT'   iff some attacker is 'IN'
//   'UNDEC' otherwise
//
// and stable if in addition no argument is 'UNDEC'.
//
bool is_complete_labelling (const Framework &,
                            const std::vector<signed char> &);
bool is_stable_labelling (const Framework &,
                          const std::vector<signed char> &);

// Local status of an argument under a partial labelling (zero entries are
// unassigned).  The 'forced_label' is 'IN' if all attackers are 'OUT',
// 'OUT' if some attacker is 'IN' and zero otherwise.
//
bool can_be_in (const Framework &, const std::vector<signed char> &, int arg);
bool must_be_out (const Framework &, const std::vector<signed char> &,
                  int arg);
int forced_label (const Framework &, const std::vector<signed char> &,
                  int arg);

} // namespace Argus

#endif

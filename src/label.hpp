#ifndef _label_hpp_INCLUDED
#define _label_hpp_INCLUDED

namespace Argus {

// Labels are bits (see 'argus.hpp').  The search keeps for each argument a
// mask of the labels it may still receive.  Under stable semantics 'UNDEC'
// is never allowed and the query goal may remove further labels.

const int UNASSIGNED = 0;
const int ANY_LABEL = IN | OUT | UNDEC;

inline bool is_label (int label) {
  return label == IN || label == OUT || label == UNDEC;
}

inline const char * label_name (int label) {
  switch (label) {
  case IN:
    return "in";
  case OUT:
    return "out";
  case UNDEC:
    return "undec";
  default:
    return "unassigned";
  }
}

// The order in which 'decide' tries labels of a decision argument.

const int branches[] = {UNDEC, IN, OUT};

} // namespace Argus

#endif

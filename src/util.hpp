#ifndef _util_hpp_INCLUDED
#define _util_hpp_INCLUDED

#include <string>
#include <vector>

namespace Argus {

using namespace std;

// Common simple utility functions independent from 'Internal'.

/*------------------------------------------------------------------------*/

inline double relative (double a, double b) { return b ? a / b : 0; }
inline double percent (double a, double b) { return relative (100 * a, b); }

/*------------------------------------------------------------------------*/

bool is_int_str (const char *str);

// Argument names are non-empty sequences of letters, digits and '_' but
// the keywords 'arg' and 'att' of the APX format are reserved.
//
bool is_argument_name_char (int ch);
bool is_argument_name (const char *str);

// Split a comma separated list, e.g., the '-a' argument of the
// application.  Empty strings give an empty list.
//
vector<string> split_list (const char *str, char sep = ',');

/*------------------------------------------------------------------------*/

} // namespace Argus

#endif

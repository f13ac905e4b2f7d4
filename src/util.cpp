#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

bool is_int_str (const char *str) {
  const char *p = str;
  if (!*p)
    return false;
  if (*p == '-')
    p++;
  if (!isdigit ((unsigned char) *p++))
    return false;
  while (isdigit ((unsigned char) *p))
    p++;
  return !*p;
}

/*------------------------------------------------------------------------*/

bool is_argument_name_char (int ch) { return isalnum (ch) || ch == '_'; }

bool is_argument_name (const char *str) {
  if (!*str)
    return false;
  for (const char *p = str; *p; p++)
    if (!is_argument_name_char ((unsigned char) *p))
      return false;
  if (!strcmp (str, "arg"))
    return false;
  if (!strcmp (str, "att"))
    return false;
  return true;
}

/*------------------------------------------------------------------------*/

vector<string> split_list (const char *str, char sep) {
  vector<string> res;
  if (!str || !*str)
    return res;
  string current;
  for (const char *p = str; *p; p++)
    if (*p == sep)
      res.push_back (current), current.clear ();
    else
      current.push_back (*p);
  res.push_back (current);
  return res;
}

} // namespace Argus

#ifndef _parse_hpp_INCLUDED
#define _parse_hpp_INCLUDED

#include "argus.hpp"
#include "format.hpp"

#include <string>
#include <vector>

namespace Argus {

// Parser for frameworks in APX format as used by the application.  Each
// non-empty line is one statement of the form
//
//   arg(<name>).
//   att(<name>,<name>).
//
// where '<name>' is a sequence of letters, digits and '_' except for the
// reserved names 'arg' and 'att'.  Checking that attacks only mention
// declared arguments is left to 'Framework::build'.

class File;

class Parser {

  File *file;
  Format error_message;
  uint64_t lineno; // of the current statement

  std::vector<std::string> &arguments;
  std::vector<Attack> &attacks;

  int parse_char ();
  const char *unexpected (int ch, const char *expected);
  const char *parse_string (const char *str);
  const char *parse_name (int &ch, std::string &name);
  const char *parse_end_of_line ();
  const char *parse_statement (int ch);

public:
  Parser (File *f, std::vector<std::string> &a, std::vector<Attack> &b)
      : file (f), lineno (0), arguments (a), attacks (b) {}

  // Parse the whole file and add the arguments and attacks found.  Return
  // zero if successful.  Otherwise a parse error message is returned
  // which stays valid as long as the parser.
  //
  const char *parse_apx ();
};

} // namespace Argus

#endif

#include "parse.hpp"
#include "file.hpp"
#include "util.hpp"

#include <cstring>

/*------------------------------------------------------------------------*/

namespace Argus {

/*------------------------------------------------------------------------*/

// Parse error.

#define PER(...) \
  do { \
    error_message.init ("%s:%d: parse error: ", file->name (), \
                        (int) lineno); \
    return error_message.append (__VA_ARGS__); \
  } while (0)

/*------------------------------------------------------------------------*/

// Parsing utilities.

inline int Parser::parse_char () { return file->get (); }

const char *Parser::unexpected (int ch, const char *expected) {
  if (ch == EOF)
    PER ("unexpected end-of-file (expected %s)", expected);
  if (ch == '\n' || ch == '\r')
    PER ("unexpected end-of-line (expected %s)", expected);
  error_message.init ("%s:%d: parse error: ", file->name (), (int) lineno);
  return error_message.append ("unexpected character '%c' (expected %s)",
                               (char) ch, expected);
}

inline const char *Parser::parse_string (const char *str) {
  for (const char *p = str; *p; p++) {
    const int ch = parse_char ();
    if (ch == *p)
      continue;
    char expected[4] = {'\'', *p, '\'', 0};
    return unexpected (ch, expected);
  }
  return 0;
}

// Reads the name and the character following it into 'ch'.

inline const char *Parser::parse_name (int &ch, std::string &name) {
  name.clear ();
  while (is_argument_name_char (ch = parse_char ()))
    name.push_back ((char) ch);
  if (name.empty ())
    return unexpected (ch, "argument name");
  if (!is_argument_name (name.c_str ()))
    PER ("reserved name '%s' used as argument", name.c_str ());
  return 0;
}

inline const char *Parser::parse_end_of_line () {
  int ch = parse_char ();
  if (ch == '\r')
    ch = parse_char ();
  if (ch == '\n' || ch == EOF)
    return 0;
  return unexpected (ch, "end-of-line");
}

/*------------------------------------------------------------------------*/

const char *Parser::parse_statement (int ch) {
  if (ch != 'a')
    return unexpected (ch, "'arg' or 'att'");
  const char *err;
  std::string first, second;
  ch = parse_char ();
  if (ch == 'r') {
    if ((err = parse_string ("g(")))
      return err;
    if ((err = parse_name (ch, first)))
      return err;
    if (ch != ')')
      return unexpected (ch, "')'");
    arguments.push_back (first);
  } else if (ch == 't') {
    if ((err = parse_string ("t(")))
      return err;
    if ((err = parse_name (ch, first)))
      return err;
    if (ch != ',')
      return unexpected (ch, "','");
    if ((err = parse_name (ch, second)))
      return err;
    if (ch != ')')
      return unexpected (ch, "')'");
    attacks.push_back (Attack (first, second));
  } else
    return unexpected (ch, "'arg' or 'att'");
  if ((err = parse_string (".")))
    return err;
  return parse_end_of_line ();
}

const char *Parser::parse_apx () {
  for (;;) {
    lineno = file->lineno ();
    int ch = parse_char ();
    if (ch == EOF)
      return 0;
    if (ch == '\r')
      ch = parse_char ();
    if (ch == '\n')
      continue;
    const char *err = parse_statement (ch);
    if (err)
      return err;
  }
}

} // namespace Argus

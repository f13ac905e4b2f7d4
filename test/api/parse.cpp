#ifdef NDEBUG
#undef NDEBUG
#endif

#include "../../src/argus.hpp"
#include "../../src/file.hpp"
#include "../../src/parse.hpp"
#include "../../src/util.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace std;
using namespace Argus;

static string path (const char *name) {
  const char *prefix = getenv ("ARGUSAPX");
  string res = prefix ? prefix : "test/apx";
  res += "/";
  res += name;
  return res;
}

// Parse the given text and return the error message (empty if none).

static string parse (const char *text, vector<string> &arguments,
                     vector<Attack> &attacks) {
  FILE *tmp = tmpfile ();
  assert (tmp);
  fputs (text, tmp);
  rewind (tmp);
  File *file = File::read (tmp, "<text>");
  Parser parser (file, arguments, attacks);
  const char *err = parser.parse_apx ();
  string res = err ? err : "";
  delete file;
  fclose (tmp);
  return res;
}

static void ok (const char *text, size_t num_arguments, size_t num_attacks) {
  vector<string> arguments;
  vector<Attack> attacks;
  string err = parse (text, arguments, attacks);
  if (!err.empty ())
    printf ("unexpected error: %s\n", err.c_str ());
  assert (err.empty ());
  assert (arguments.size () == num_arguments);
  assert (attacks.size () == num_attacks);
}

static void error (const char *text, const char *expected) {
  vector<string> arguments;
  vector<Attack> attacks;
  string err = parse (text, arguments, attacks);
  printf ("%s\n", err.c_str ());
  assert (!err.empty ());
  assert (strstr (err.c_str (), expected));
}

int main () {

  ok ("", 0, 0);
  ok ("\n\n", 0, 0);
  ok ("arg(a).\n", 1, 0);
  ok ("arg(a).", 1, 0);
  ok ("arg(a).\r\narg(b).\r\natt(a,b).\r\n", 2, 1);
  ok ("arg(Arg_1).\narg(att0).\natt(Arg_1,att0).\n", 2, 1);
  ok ("att(a,b).\narg(a).\narg(b).\n\narg(a).\n", 3, 1);

  error ("arg(a)\n", "<text>:1: parse error: unexpected end-of-line");
  error ("arg(a).\nargs(b).\n", "<text>:2: parse error");
  error ("arg(a).\narg(b).\n\nat(a,b).\n", "<text>:4: parse error");
  error ("arg(a,b).\n", "expected ')'");
  error ("arg().\n", "expected argument name");
  error ("arg(arg).\n", "reserved name 'arg'");
  error ("att(a,att).\n", "reserved name 'att'");
  error ("att(a;b).\n", "unexpected character ';'");
  error ("arg( a).\n", "unexpected character ' '");
  error ("arg(a). \n", "expected end-of-line");
  error ("arg(a", "unexpected end-of-file");
  error ("% comment\n", "expected 'arg' or 'att'");

  // Parse fixtures and build their frameworks.
  {
    string name = path ("reinstatement.apx");
    File *file = File::read (name.c_str ());
    assert (file);
    vector<string> arguments;
    vector<Attack> attacks;
    Parser parser (file, arguments, attacks);
    assert (!parser.parse_apx ());
    delete file;
    assert (arguments.size () == 5);
    assert (attacks.size () == 4);
    Framework f;
    assert (f.build (arguments, attacks) == NO_ERROR);
    assert (f.attackers ("d").size () == 1);
  }
  {
    string name = path ("malformed.apx");
    assert (File::exists (name.c_str ()));
    File *file = File::read (name.c_str ());
    assert (file);
    vector<string> arguments;
    vector<Attack> attacks;
    Parser parser (file, arguments, attacks);
    assert (!parser.parse_apx ());
    delete file;
    Framework f;
    assert (f.build (arguments, attacks) == MALFORMED_FRAMEWORK);
  }

  // Command line values.
  //
  assert (is_int_str ("42"));
  assert (is_int_str ("-1"));
  assert (!is_int_str (""));
  assert (!is_int_str ("-"));
  assert (!is_int_str ("4x"));
  assert (!is_int_str ("\xe9"));
  assert (!is_int_str ("1\xe9"));
  assert (is_argument_name ("a_1"));
  assert (!is_argument_name (""));
  assert (!is_argument_name ("arg"));
  assert (!is_argument_name ("\xe9"));
  assert (split_list ("").empty ());
  assert (split_list ("a,,b").size () == 3);

  assert (!File::exists (path ("missing.apx").c_str ()));
  assert (!File::read (path ("missing.apx").c_str ()));

  return 0;
}

/*------------------------------------------------------------------------*/

// The application does not need 'internal.hpp' but only the library
// facade and the parser.

#include "app.hpp"
#include "argus.hpp"
#include "file.hpp"
#include "parse.hpp"
#include "signal.hpp"
#include "util.hpp"

/*------------------------------------------------------------------------*/

// The only common other 'C' headers needed.

#include <climits>
#include <cstdarg>
#include <cstdlib>
#include <cstring>

/*------------------------------------------------------------------------*/

namespace Argus {

App::App ()
    : framework (0), solver (0), verbosity (0), quiet (false),
      logging (false), time_limit (-1), timed_out (false) {}

App::~App () {
  delete solver;
  delete framework;
}

/*------------------------------------------------------------------------*/

void App::usage () {
  // clang-format off
  fputs (
"usage: argus [ <option> ... ] -f <file> -p <problem> [ -a <arguments> ]\n"
"\n"
"where '<problem>' is one of\n"
"\n"
"  VE-CO      verify that '<arguments>' is a complete extension\n"
"  DC-CO      credulous acceptance of '<arguments>' under complete\n"
"  DS-CO      skeptical acceptance of '<arguments>' under complete\n"
"  VE-ST      verify that '<arguments>' is a stable extension\n"
"  DC-ST      credulous acceptance of '<arguments>' under stable\n"
"  DS-ST      skeptical acceptance of '<arguments>' under stable\n"
"\n"
"and '<arguments>' is a comma separated list of argument names, which\n"
"has to consist of exactly one argument for acceptance problems and\n"
"might be empty (or omitted) for verification problems.\n"
"\n"
"The '<option>' is one of the following short options\n"
"\n"
"  -h         print this command line option summary\n"
"  --version  print version\n"
#ifndef QUIET
"  -v         increase verbose level (see also '--verbose')\n"
"  -q         quiet (same as '--quiet')\n"
#endif
#ifdef LOGGING
"  -l         enable logging messages (same as '--log')\n"
#endif
"  -t <sec>   set time limit\n"
"\n"
"or '<option>' can be one of the following long options\n"
"\n",
  stdout);
  Solver::usage ();
  fputs (
"\n"
"The long options have their default value printed in brackets\n"
"after their description.  They can also be used in the form\n"
"'--<name>' which is equivalent to '--<name>=1' and in the form\n"
"'--no-<name>' which is equivalent to '--<name>=0'.\n"
"\n"
"The framework file '<file>' is in APX format with one statement\n"
"'arg(<name>).' or 'att(<name>,<name>).' per line.  The answer 'YES'\n"
"or 'NO' is printed on '<stdout>' and the exit code is zero.  Errors\n"
"give exit code one and reaching the time limit exit code two.\n",
  stdout);
  // clang-format on
}

void App::error (const char *fmt, ...) {
  fflush (stdout);
  fputs ("*** 'Argus' error: ", stderr);
  va_list ap;
  va_start (ap, fmt);
  vfprintf (stderr, fmt, ap);
  va_end (ap);
  fputc ('\n', stderr);
  fflush (stderr);
}

void App::banner () {
  solver->section ("banner");
  solver->message ("Argus Argumentation Framework Solver");
  solver->message ("Version %s", Solver::version ());
}

/*------------------------------------------------------------------------*/

// Messages are only printed with '-v' since the answer is the only
// expected output on '<stdout>'.  Explicit long options given on the
// command line are applied afterwards and thus take precedence.

bool App::configure () {
  if (!verbosity && !logging && Solver::is_valid_option ("quiet"))
    solver->set ("quiet", 1);
  if (quiet)
    solver->set ("quiet", 1);
  if (verbosity)
    solver->set ("verbose", verbosity);
  if (logging)
    solver->set ("log", 1);
  for (const auto &arg : long_options)
    if (!solver->set_long_option (arg)) {
      error ("invalid option '%s'", arg);
      return false;
    }
  return true;
}

bool App::read_framework (const char *path) {
  File *file = File::read (path);
  if (!file) {
    error ("can not open framework file '%s'", path);
    return false;
  }
  std::vector<std::string> arguments;
  std::vector<Attack> attacks;
  Parser *parser = new Parser (file, arguments, attacks);
  const char *err = parser->parse_apx ();
  if (err)
    error ("%s", err);
  delete parser;
  delete file;
  if (err)
    return false;
  framework = new Framework ();
  if (framework->build (arguments, attacks)) {
    error ("%s: %s", path, framework->error_message ());
    return false;
  }
  return true;
}

/*------------------------------------------------------------------------*/

void App::catch_signal (int sig) {
  if (!solver)
    return;
  solver->message ("caught signal %d (%s)", sig, Signal::name (sig));
  solver->statistics ();
}

void App::catch_alarm () {
  timed_out = true;
  if (solver)
    solver->terminate ();
}

/*------------------------------------------------------------------------*/

// Short-cut for errors to avoid a hard 'exit'.

#define ERROR(...) \
  do { \
    error (__VA_ARGS__); \
    res = 1; \
    goto DONE; \
  } while (0)

/*------------------------------------------------------------------------*/

int App::main (int argc, char **argv) {
  const char *framework_path = 0, *problem_name = 0, *target_str = 0;
  bool target_specified = false;
  std::vector<std::string> target;
  Problem problem = VE_CO;
  Result result;
  int i, res = 0;
  for (i = 1; i < argc; i++) {
    if (!strcmp (argv[i], "-h")) {
      usage ();
      return 0;
    } else if (!strcmp (argv[i], "--version")) {
      printf ("%s\n", Solver::version ());
      return 0;
    } else if (!strcmp (argv[i], "-f")) {
      if (++i == argc)
        ERROR ("argument to '-f' missing");
      else if (framework_path)
        ERROR ("multiple framework files '%s' and '%s'", framework_path,
               argv[i]);
      else
        framework_path = argv[i];
    } else if (!strcmp (argv[i], "-p")) {
      if (++i == argc)
        ERROR ("argument to '-p' missing");
      else if (problem_name)
        ERROR ("multiple problems '%s' and '%s'", problem_name, argv[i]);
      else
        problem_name = argv[i];
    } else if (!strcmp (argv[i], "-a")) {
      if (target_specified)
        ERROR ("multiple '-a' options");
      target_specified = true;
      if (i + 1 < argc && argv[i + 1][0] != '-')
        target_str = argv[++i];
    } else if (!strcmp (argv[i], "-t")) {
      if (++i == argc)
        ERROR ("argument to '-t' missing");
      else if (time_limit >= 0)
        ERROR ("multiple time limits");
      else {
        const long seconds = is_int_str (argv[i]) ? strtol (argv[i], 0, 10) : 0;
        if (seconds <= 0 || seconds > INT_MAX)
          ERROR ("invalid argument in '-t %s'", argv[i]);
        time_limit = (int) seconds;
      }
    }
#ifndef QUIET
    else if (!strcmp (argv[i], "-q"))
      quiet = true;
    else if (!strcmp (argv[i], "-v"))
      verbosity++;
#endif
#ifdef LOGGING
    else if (!strcmp (argv[i], "-l"))
      logging = true;
#endif
    else if (Solver::is_valid_long_option (argv[i]))
      long_options.push_back (argv[i]);
    else if (argv[i][0] == '-')
      ERROR ("invalid option '%s'", argv[i]);
    else
      ERROR ("unexpected argument '%s' (try '-h')", argv[i]);
  }

  if (!framework_path)
    ERROR ("no framework file specified (try '-h')");
  if (!File::exists (framework_path))
    ERROR ("framework file '%s' does not exist", framework_path);
  if (!problem_name)
    ERROR ("no problem specified (try '-h')");
  if (!Solver::problem (problem_name, problem))
    ERROR ("unknown problem '%s' (expected 'VE-CO', 'DC-CO', 'DS-CO', "
           "'VE-ST', 'DC-ST' or 'DS-ST')",
           problem_name);

  if (target_str && !*target_str)
    ERROR ("invalid empty argument name in '-a'");
  if (target_str)
    target = split_list (target_str);
  for (const auto &name : target)
    if (!is_argument_name (name.c_str ()))
      ERROR ("invalid argument name '%s'", name.c_str ());

  if (!read_framework (framework_path)) {
    res = 1;
    goto DONE;
  }

  solver = new Solver (*framework);
  if (!configure ()) {
    res = 1;
    goto DONE;
  }

  Signal::set (this);
  if (time_limit > 0)
    Signal::alarm (time_limit);

  banner ();
  solver->section ("framework");
  solver->message ("read %d arguments and %zu attacks from '%s'",
                   framework->size (), framework->attacks (),
                   framework_path);
  solver->section ("options");
  solver->options ();
  solver->section ("solving");
  solver->message ("evaluating '%s' with %zu target arguments",
                   Solver::problem_name (problem), target.size ());

  result = solver->evaluate (problem, target);

  solver->section ("result");
  if (result == YES)
    printf ("YES\n");
  else if (result == NO)
    printf ("NO\n");
  else if (result == FAILED) {
    solver->error ("%s", solver->error_message ());
    res = 1;
  } else {
    printf ("c UNKNOWN\n");
    if (timed_out)
      solver->message ("time limit of %d seconds reached", time_limit);
    res = 2;
  }
  fflush (stdout);

  solver->statistics ();
  solver->message ("exit %d", res);

DONE:
  Signal::reset ();
  return res;
}

} // namespace Argus

/*------------------------------------------------------------------------*/

int main (int argc, char **argv) {
  Argus::App app;
  return app.main (argc, argv);
}

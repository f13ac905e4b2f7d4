#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

// Library interface.  Only API contracts are checked here.  The actual
// work is done by 'Internal'.

Solver::Solver (const Framework &framework) : internal (0) {
  REQUIRE (framework.built (), "framework not built");
  internal = new Internal (framework);
}

Solver::~Solver () {
  REQUIRE_INITIALIZED ();
  delete internal;
}

const Framework &Solver::framework () const {
  REQUIRE_INITIALIZED ();
  return internal->framework;
}

/*------------------------------------------------------------------------*/

Result Solver::evaluate (Problem problem, const std::vector<std::string> &target) {
  REQUIRE_INITIALIZED ();
  REQUIRE (0 <= (int) problem && (int) problem <= (int) DS_ST,
           "invalid problem '%d'", (int) problem);
  return internal->evaluate (problem, target);
}

Error Solver::error () const {
  REQUIRE_INITIALIZED ();
  return internal->error_code;
}

const char *Solver::error_message () const {
  REQUIRE_INITIALIZED ();
  return internal->error_message;
}

void Solver::grounded (Labelling &labels) {
  REQUIRE_INITIALIZED ();
  internal->grounded (labels);
}

bool Solver::traverse (Semantics semantics, LabellingIterator &it) {
  REQUIRE_INITIALIZED ();
  REQUIRE (semantics == COMPLETE || semantics == STABLE,
           "invalid semantics '%d'", (int) semantics);
  internal->init_search (semantics);
  return internal->traverse (it);
}

/*------------------------------------------------------------------------*/

void Solver::terminate () {
  REQUIRE_INITIALIZED ();
  internal->termination_forced = true;
}

void Solver::connect_terminator (Terminator *terminator) {
  REQUIRE_INITIALIZED ();
  REQUIRE (terminator, "can not connect zero terminator");
  internal->terminator = terminator;
}

void Solver::disconnect_terminator () {
  REQUIRE_INITIALIZED ();
  internal->terminator = 0;
}

/*------------------------------------------------------------------------*/

bool Solver::is_valid_option (const char *name) {
  return Options::has (name);
}

bool Solver::is_valid_long_option (const char *arg) {
  std::string name;
  int tmp;
  return Options::parse_long_option (arg, name, tmp);
}

bool Solver::set (const char *name, int val) {
  REQUIRE_INITIALIZED ();
  return internal->opts.set (name, val);
}

int Solver::get (const char *name) {
  REQUIRE_INITIALIZED ();
  return internal->opts.get (name);
}

bool Solver::set_long_option (const char *arg) {
  REQUIRE_INITIALIZED ();
  std::string name;
  int val;
  if (!Options::parse_long_option (arg, name, val))
    return false;
  return internal->opts.set (name.c_str (), val);
}

void Solver::options () {
  REQUIRE_INITIALIZED ();
  internal->opts.print ();
}

void Solver::usage () { Options::usage (); }

/*------------------------------------------------------------------------*/

void Solver::statistics () {
  REQUIRE_INITIALIZED ();
  internal->print_statistics ();
}

void Solver::section (const char *title) {
  REQUIRE_INITIALIZED ();
#ifdef QUIET
  (void) title;
#else
  internal->section (title);
#endif
}

void Solver::message (const char *fmt, ...) {
  REQUIRE_INITIALIZED ();
#ifdef QUIET
  (void) fmt;
#else
  va_list ap;
  va_start (ap, fmt);
  internal->vmessage (fmt, ap);
  va_end (ap);
#endif
}

void Solver::verbose (int level, const char *fmt, ...) {
  REQUIRE_INITIALIZED ();
#ifdef QUIET
  (void) level, (void) fmt;
#else
  va_list ap;
  va_start (ap, fmt);
  internal->vverbose (level, fmt, ap);
  va_end (ap);
#endif
}

void Solver::error (const char *fmt, ...) {
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->verror (fmt, ap);
  va_end (ap);
}

} // namespace Argus

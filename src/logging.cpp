#ifdef LOGGING

#include "internal.hpp"

namespace Argus {

void Logger::print_log_prefix (Internal *internal) {
  internal->print_prefix ();
  printf ("LOG %d ", internal->level);
}

void Logger::log (Internal *internal, const char *fmt, ...) {
  print_log_prefix (internal);
  va_list ap;
  va_start (ap, fmt);
  vprintf (fmt, ap);
  va_end (ap);
  fputc ('\n', stdout);
  fflush (stdout);
}

// Same as above but followed by the argument, its index and its label.

void Logger::log (Internal *internal, int arg, const char *fmt, ...) {
  print_log_prefix (internal);
  va_list ap;
  va_start (ap, fmt);
  vprintf (fmt, ap);
  va_end (ap);
  assert (0 <= arg), assert (arg < internal->max_arg);
  printf (" '%s' [%d] %s", internal->framework.name (arg).c_str (), arg,
          label_name (internal->val (arg)));
  fputc ('\n', stdout);
  fflush (stdout);
}

} // namespace Argus

#endif

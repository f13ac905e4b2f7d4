#include "resources.hpp"
#include "signal.hpp"

/*------------------------------------------------------------------------*/

#include <cassert>
#include <csignal>

/*------------------------------------------------------------------------*/

extern "C" {
#include <unistd.h>
}

/*------------------------------------------------------------------------*/

// The application has one global handler.  Interrupts print statistics
// before the signal is raised again with the original handler in place.
// The alarm implements the time limit and only asks the handler to stop
// the search, thus the program continues normally afterwards.

namespace Argus {

static volatile bool caught_signal = false;
static volatile bool alarm_set = false;
static double alarm_time = -1;
static Handler *signal_handler;

void Handler::catch_alarm () { catch_signal (SIGALRM); }

#define SIGNALS \
  SIGNAL (SIGABRT) \
  SIGNAL (SIGINT) \
  SIGNAL (SIGSEGV) \
  SIGNAL (SIGTERM)

#define SIGNAL(SIG) static void (*SIG##_handler) (int);
SIGNALS
#undef SIGNAL
static void (*SIGALRM_handler) (int);

const char *Signal::name (int sig) {
#define SIGNAL(SIG) \
  if (sig == SIG) \
    return #SIG;
  SIGNALS
#undef SIGNAL
  if (sig == SIGALRM)
    return "SIGALRM";
  return "UNKNOWN";
}

/*------------------------------------------------------------------------*/

void Signal::reset_alarm () {
  if (!alarm_set)
    return;
  (void) signal (SIGALRM, SIGALRM_handler);
  SIGALRM_handler = 0;
  alarm_set = false;
  alarm_time = -1;
}

void Signal::reset () {
#define SIGNAL(SIG) \
  (void) signal (SIG, SIG##_handler); \
  SIG##_handler = 0;
  SIGNALS
#undef SIGNAL
  reset_alarm ();
  signal_handler = 0;
  caught_signal = false;
}

/*------------------------------------------------------------------------*/

static void catch_alarm (int) {
  if (!alarm_set || absolute_real_time () < alarm_time)
    return;
  Handler *handler = signal_handler;
  Signal::reset_alarm ();
  if (handler)
    handler->catch_alarm ();
}

static void catch_signal (int sig) {
  if (!caught_signal) {
    caught_signal = true;
    if (signal_handler)
      signal_handler->catch_signal (sig);
  }
  Signal::reset ();
  ::raise (sig);
}

void Signal::set (Handler *h) {
  signal_handler = h;
#define SIGNAL(SIG) SIG##_handler = signal (SIG, catch_signal);
  SIGNALS
#undef SIGNAL
}

void Signal::alarm (int seconds) {
  assert (seconds > 0);
  assert (!alarm_set);
  SIGALRM_handler = signal (SIGALRM, catch_alarm);
  alarm_set = true;
  alarm_time = absolute_real_time () + seconds;
  ::alarm (seconds);
}

} // namespace Argus

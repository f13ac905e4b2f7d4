// vim: set tw=300: set VIM text width to 300 characters for this file.

#include "internal.hpp"

namespace Argus {

/*------------------------------------------------------------------------*/

Stats::Stats () {
  memset (this, 0, sizeof *this);
  time.real = absolute_real_time ();
  time.process = absolute_process_time ();
}

/*------------------------------------------------------------------------*/

#define PRT(FMT, ...) \
  do { \
    if (FMT[0] == ' ' && !all) \
      break; \
    MSG (FMT, __VA_ARGS__); \
  } while (0)

/*------------------------------------------------------------------------*/

void Stats::print (Internal *internal) {

#ifdef QUIET
  (void) internal;
#else

  Stats &stats = internal->stats;

  int all = internal->opts.verbose > 0;
#ifdef LOGGING
  if (internal->opts.log)
    all = true;
#endif // ifdef LOGGING

  const double t = internal->process_time ();

  SECTION ("statistics");

  PRT ("queries:         %15" PRId64 "   %10.2f    per second", stats.queries, relative (stats.queries, t));
  PRT ("  failed:        %15" PRId64 "   %10.2f %%  of queries", stats.failed, percent (stats.failed, stats.queries));
  PRT ("  verified:      %15" PRId64 "   %10.2f %%  of queries", stats.verified, percent (stats.verified, stats.queries));
  PRT ("  searches:      %15" PRId64 "   %10.2f %%  of queries", stats.searches, percent (stats.searches, stats.queries));
  PRT ("  terminated:    %15" PRId64 "   %10.2f %%  of searches", stats.terminated, percent (stats.terminated, stats.searches));
  PRT ("decisions:       %15" PRId64 "   %10.2f    per second", stats.decisions, relative (stats.decisions, t));
  PRT ("propagations:    %15" PRId64 "   %10.2f    per decision", stats.propagations, relative (stats.propagations, stats.decisions));
  PRT ("  examined:      %15" PRId64 "   %10.2f    per propagation", stats.examined, relative (stats.examined, stats.propagations));
  PRT ("conflicts:       %15" PRId64 "   %10.2f %%  of decisions", stats.conflicts, percent (stats.conflicts, stats.decisions));
  PRT ("backtracks:      %15" PRId64 "   %10.2f %%  of decisions", stats.backtracks, percent (stats.backtracks, stats.decisions));
  PRT ("labellings:      %15" PRId64 "   %10.2f    per search", stats.labellings, relative (stats.labellings, stats.searches));

  internal->message ();
  MSG ("total process time since initialization: %12.2f    seconds", t);
  MSG ("total real time since initialization:    %12.2f    seconds", internal->real_time ());
  MSG ("maximum resident set size of process:    %12.2f    MB", maximum_resident_set_size () / (double) (1 << 20));

#endif // ifdef QUIET
}

} // namespace Argus

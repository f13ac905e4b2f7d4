#include "internal.hpp"

/*------------------------------------------------------------------------*/

// Time and memory usage reported in the statistics.  Relies on POSIX
// 'getrusage' and 'gettimeofday'.

extern "C" {
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
}

namespace Argus {

double absolute_real_time () {
  struct timeval tv;
  if (gettimeofday (&tv, 0))
    return 0;
  return 1e-6 * tv.tv_usec + tv.tv_sec;
}

double Internal::real_time () {
  return absolute_real_time () - stats.time.real;
}

/*------------------------------------------------------------------------*/

// Process time is user plus system time of the solver process.

double absolute_process_time () {
  struct rusage u;
  double res;
  if (getrusage (RUSAGE_SELF, &u))
    return 0;
  res = u.ru_utime.tv_sec + 1e-6 * u.ru_utime.tv_usec;  // user time
  res += u.ru_stime.tv_sec + 1e-6 * u.ru_stime.tv_usec; // + system time
  return res;
}

double Internal::process_time () {
  return absolute_process_time () - stats.time.process;
}

/*------------------------------------------------------------------------*/

// The 'ru_maxrss' field is in kilobytes on Linux.

uint64_t maximum_resident_set_size () {
  struct rusage u;
  if (getrusage (RUSAGE_SELF, &u))
    return 0;
  return ((uint64_t) u.ru_maxrss) << 10;
}

} // namespace Argus

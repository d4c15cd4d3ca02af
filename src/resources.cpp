#include "internal.hpp"

extern "C" {
#include <sys/resource.h>
#include <sys/time.h>
}

namespace Dipple {

double absolute_real_time () {
  struct timeval now;
  if (gettimeofday (&now, 0)) return 0;
  return now.tv_sec + 1e-6 * now.tv_usec;
}

static double seconds (const struct timeval & t) {
  return t.tv_sec + 1e-6 * t.tv_usec;
}

double absolute_process_time () {
  struct rusage usage;
  if (getrusage (RUSAGE_SELF, &usage)) return 0;
  return seconds (usage.ru_utime) + seconds (usage.ru_stime);
}

// Linux reports 'ru_maxrss' in kilobytes.

uint64_t maximum_resident_set_size () {
  struct rusage usage;
  if (getrusage (RUSAGE_SELF, &usage)) return 0;
  return (uint64_t) usage.ru_maxrss << 10;
}

double Internal::process_time () {
  return absolute_process_time () - stats.time.process;
}

double Internal::real_time () {
  return absolute_real_time () - stats.time.real;
}

}

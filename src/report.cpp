#include "internal.hpp"

namespace Dipple {

// Progress lines while solving.  The first character is '*' at the start
// of 'solve', 'd' at a decision limit, and '1' or '0' for the result.  A
// header is repeated every twenty lines.

#ifndef QUIET

void Internal::report (char type) {
  if (!opts.report || !printing (0)) return;
  if (!(stats.reports++ % 20)) {
    message ();
    MSG ("  %8s %6s %5s %8s %10s %10s %12s %8s",
      "seconds", "MB", "level", "maxlevel",
      "decisions", "conflicts", "propagations", "pures");
    message ();
  }
  MSG ("%c %8.2f %6.0f %5d %8" PRId64 " %10" PRId64 " %10" PRId64
    " %12" PRId64 " %8" PRId64,
    type, process_time (),
    maximum_resident_set_size () / (double) (1 << 20),
    level, stats.maxlevel,
    stats.decisions, stats.conflicts, stats.propagations, stats.pures);
}

#else

void Internal::report (char) { }

#endif

}

#include "internal.hpp"

namespace Dipple {

Stats::Stats () {
  memset (this, 0, sizeof *this);
  time.real = absolute_real_time ();
  time.process = absolute_process_time ();
}

// Lines starting with a space are details only shown if verbose.

#define PRT(FMT,...) \
do { \
  if (FMT[0] != ' ' || details) MSG (FMT, __VA_ARGS__); \
} while (0)

void Stats::print (Internal * internal) {
#ifdef QUIET
  (void) internal;
#else
  const Stats & s = internal->stats;
  const bool details = internal->opts.verbose > 0;
  const double t = internal->process_time ();

  SECTION ("statistics");
  PRT ("searches:      %12" PRId64 "  %10.2f per second",
    s.searches, relative (s.searches, t));
  PRT ("decisions:     %12" PRId64 "  %10.2f per search",
    s.decisions, relative (s.decisions, s.searches));
  PRT ("conflicts:     %12" PRId64 "  %10.2f per decision",
    s.conflicts, relative (s.conflicts, s.decisions));
  PRT ("  backtracks:  %12" PRId64 "  %10.2f %% of decisions",
    s.backtracks, percent (s.backtracks, s.decisions));
  PRT ("propagations:  %12" PRId64 "  %10.2f per second",
    s.propagations, relative (s.propagations, t));
  PRT ("pures:         %12" PRId64 "  %10.2f per decision",
    s.pures, relative (s.pures, s.decisions));
  PRT ("rounds:        %12" PRId64 "  %10.2f per search",
    s.rounds, relative (s.rounds, s.searches));
  PRT ("  rewritten:   %12" PRId64 "  %10.2f per round",
    s.rewritten, relative (s.rewritten, s.rounds));
  PRT ("  satisfied:   %12" PRId64 "  %10.2f per round",
    s.satisfied, relative (s.satisfied, s.rounds));
  PRT ("maxlevel:      %12" PRId64 "  %10.2f %% of decisions",
    s.maxlevel, percent (s.maxlevel, s.decisions));

  SECTION ("resources");
  MSG ("process time:  %12.2f seconds", t);
  MSG ("real time:     %12.2f seconds", internal->real_time ());
  MSG ("memory:        %12.2f MB",
    maximum_resident_set_size () / (double) (1 << 20));
#endif
}

void Internal::print_statistics () { stats.print (this); }

}

#ifndef _resources_hpp_INCLUDED
#define _resources_hpp_INCLUDED

#include <cstdint>

namespace Dipple {

// Seconds since the epoch and of user plus system time, and bytes of the
// maximum resident set size of this process.

double absolute_real_time ();
double absolute_process_time ();
uint64_t maximum_resident_set_size ();

}

#endif

#ifndef _random_hpp_INCLUDED
#define _random_hpp_INCLUDED

#include <cassert>
#include <cstdint>

namespace Dipple {

// Seeded 'xorshift64*' generator for reproducible random formulas in the
// tests.  The solver itself is deterministic and does not use it.

class Random {

  uint64_t state;

public:

  explicit Random (uint64_t seed) : state (seed ? seed : 1) { }

  uint64_t next () {
    state ^= state >> 12;
    state ^= state << 25;
    state ^= state >> 27;
    return state * 2685821657736338717ull;
  }

  bool generate_bool () { return next () >> 63; }

  int pick_int (int l, int r) {
    assert (l <= r);
    const uint64_t range = (uint64_t) ((int64_t) r - l) + 1;
    return (int) (l + (int64_t) (next () % range));
  }
};

}

#endif

#ifndef _stats_hpp_INCLUDED
#define _stats_hpp_INCLUDED

#include <cstdint>

namespace Dipple {

struct Internal;

struct Stats {

  int64_t searches;     // number of 'solve' calls
  int64_t decisions;    // number of branching literals in 'decide'
  int64_t conflicts;    // falsified clauses and clashing assignments
  int64_t backtracks;   // failed first branches
  int64_t propagations; // unit clauses assigned in 'propagate'
  int64_t pures;        // pure literals assigned
  int64_t rounds;       // simplification rounds
  int64_t rewritten;    // clauses shortened by 'assign_literal'
  int64_t satisfied;    // clauses removed by 'assign_literal'
  int64_t maxlevel;     // maximum search depth

  int64_t reports, sections;

  struct { double process, real; } time;

  Stats ();

  void print (Internal *);
};

}

#endif

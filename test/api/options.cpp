#include "../../src/dipple.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>
#include <cstdlib>

using namespace Dipple;

int main () {

  assert (Solver::is_valid_option ("pure"));
  assert (Solver::is_valid_option ("check"));
  assert (Solver::is_valid_option ("reportint"));
  assert (!Solver::is_valid_option ("restart"));

  assert (Solver::is_valid_long_option ("--pure"));
  assert (Solver::is_valid_long_option ("--no-pure"));
  assert (Solver::is_valid_long_option ("--pure=false"));
  assert (Solver::is_valid_long_option ("--reportint=1e4"));
  assert (!Solver::is_valid_long_option ("--no-pure=1"));
  assert (!Solver::is_valid_long_option ("--pure=maybe"));
  assert (!Solver::is_valid_long_option ("-pure"));
  assert (!Solver::is_valid_long_option ("--unknown"));

  Solver solver;
  assert (solver.state () == CONFIGURING);
  assert (solver.get ("pure") == 1);
  assert (solver.get ("check") == 1);
  assert (solver.get ("report") == 0);
  assert (solver.get ("reportint") == 1000);
  assert (solver.get ("unknown") == 0);

  assert (solver.set ("pure", 0));
  assert (solver.get ("pure") == 0);
  assert (solver.set_long_option ("--pure"));
  assert (solver.get ("pure") == 1);
  assert (solver.set_long_option ("--no-pure"));
  assert (solver.get ("pure") == 0);
  assert (solver.set_long_option ("--reportint=2e3"));
  assert (solver.get ("reportint") == 2000);
  assert (!solver.set_long_option ("pure"));
  assert (!solver.set ("unknown", 1));

  // Values out of range are clipped.

  assert (solver.set ("reportint", 0));
  assert (solver.get ("reportint") == 1);
  assert (solver.set ("check", 7));
  assert (solver.get ("check") == 1);

  solver.prefix ("c [options] ");
  solver.options ();

  assert (solver.solve (make_formula ({ {1, 2}, {-1} })) == 10);
  assert (solver.val (2) > 0);

  // Environment variables override defaults in new solvers.

  setenv ("DIPPLE_PURE", "false", 1);
  setenv ("DIPPLE_REPORTINT", "1e12", 1);
  Solver other;
  assert (other.get ("pure") == 0);
  assert (other.get ("reportint") == 2000000000);
  unsetenv ("DIPPLE_PURE");
  unsetenv ("DIPPLE_REPORTINT");

  // Reports and verbose messages do not change results.

  Solver verbose;
  verbose.set ("verbose", 3);
  verbose.set ("report", 1);
  verbose.set ("reportint", 1);
  Formula formula = make_formula ({
    {1, 2, 3}, {-1, -2}, {-1, -3}, {-2, -3}, {1, -2, 3}, {-1, 2, -3}
  });
  const int expected = is_satisfiable (formula) ? 10 : 20;
  assert (verbose.solve (formula) == expected);
  verbose.statistics ();

  return 0;
}

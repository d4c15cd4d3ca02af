#include "../../src/dipple.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>
#include <climits>

using namespace Dipple;

// Variable indices up to 'INT_MAX' are fine and the memory used only
// depends on how many variables are assigned.

int main () {

  Model model;
  assert (model.assign (INT_MAX, true));
  assert (model.assign (INT_MAX - 1, false));
  assert (model.assign (0, true));
  assert (model.size () == 3);
  assert (model.max_var () == INT_MAX);
  assert (model.val (INT_MAX) == 1);
  assert (model.val (INT_MAX - 1) == -1);
  assert (!model.val (INT_MAX - 2));
  assert (!model.assign (INT_MAX, false));
  assert (model.literals ().back () == Literal (INT_MAX));

  // Pure literal on the largest variable.

  Solver solver;
  std::vector<Formula> formulas;
  assert (!solver.parse_instances ("2147483647\n", formulas));
  assert (formulas.size () == 1);
  assert (solver.solve (formulas[0]) == 10);
  assert (solver.val (INT_MAX) > 0);
  assert (solver.model ().size () == 1);

  // Branching on large variables.

  assert (!solver.parse_instances (
    "300000000 300000001\n"
    "-300000000 -300000001\n"
    "\n"
    "-2147483647 2147483646\n"
    "2147483647\n"
    "-2147483646\n", formulas));
  assert (formulas.size () == 2);

  assert (solver.solve (formulas[0]) == 10);
  assert (solver.model ().size () == 2);
  assert (solver.val (300000000) == -solver.val (300000001));
  assert (evaluate (formulas[0], solver.model ()));

  assert (solver.solve (formulas[1]) == 20);

  // Partial models with large variables.

  Model partial;
  partial.assign (INT_MAX, true);
  Model result;
  assert (solve (formulas[0], partial, result) == 10);
  assert (result.val (INT_MAX) > 0);
  assert (result.size () == 3);

  Formula unit ({ Clause ({ Literal (INT_MAX, true) }) });
  assert (solve (unit, partial, result) == 20);

  return 0;
}

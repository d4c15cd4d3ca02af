#include "../../src/dipple.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using namespace Dipple;

// Solve and check the exact model, which is determined by the fixed
// branching order (smallest clause first, true before false).

static void sat (const Formula & formula,
                 const std::vector<Literal> & expected) {
  Model model;
  int res = solve (formula, model);
  assert (res == 10);
  assert (evaluate (formula, model));
  assert (model.literals () == expected);
  assert (is_satisfiable (formula));
}

static void unsat (const Formula & formula) {
  Model model;
  model.assign (42, true);
  int res = solve (formula, model);
  assert (res == 20);
  assert (model.val (42) == 1);         // untouched
  assert (!is_satisfiable (formula));
}

int main () {

  // Empty formula is satisfiable with the empty model.

  sat (Formula (), {});

  // Any empty clause makes the formula unsatisfiable.

  unsat (Formula ({ Clause () }));
  unsat (Formula ({ make_clause ({1}), Clause () }));
  unsat (Formula ({ make_clause ({1, 2}), Clause (), make_clause ({3}) }));

  unsat (make_formula ({ {1}, {-1} }));
  unsat (make_formula ({ {1, 2}, {-1, 2}, {1, -2}, {-1, -2} }));

  // Both literals are pure.

  sat (make_formula ({ {1, -2} }), { Literal (1), Literal (2, true) });

  // The unit '-0' forces variable '0' to false and then '1' to true.

  Formula f ({
    Clause ({ Literal (0), Literal (1) }),
    Clause ({ Literal (0, true) })
  });
  sat (f, { Literal (0, true), Literal (1) });

  // Decision on '0' (true first) and then propagation of '-1'.

  Formula g ({
    Clause ({ Literal (0), Literal (1) }),
    Clause ({ Literal (0, true), Literal (1, true) })
  });
  sat (g, { Literal (0), Literal (1, true) });

  // Decision on '-1' which is the smallest literal of the first clause.

  sat (make_formula ({ {-1, -2}, {1, 2}, {-1, 2} }),
       { Literal (1, true), Literal (2) });

  // The first decision '0' fails and requires backtracking.

  Formula h ({
    Clause ({ Literal (0), Literal (1) }),
    Clause ({ Literal (0, true), Literal (2) }),
    Clause ({ Literal (0, true), Literal (2, true) }),
    Clause ({ Literal (1, true), Literal (2) })
  });
  sat (h, { Literal (0, true), Literal (1), Literal (2) });

  // Same formula through the solver object and 'val'.

  Solver solver;
  int res = solver.solve (h);
  assert (res == 10);
  assert (solver.state () == SATISFIED);
  assert (solver.val (0) < 0);
  assert (solver.val (1) > 0);
  assert (solver.val (2) > 0);
  assert (solver.val (3) == 0);
  res = solver.solve (make_formula ({ {1}, {-1} }));
  assert (res == 20);
  assert (solver.state () == UNSATISFIED);
  res = solver.solve (h);
  assert (res == 10);

  return 0;
}

#include "../../src/dipple.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

// This is the example from the header file

int main () {

  Dipple::Solver * solver = new Dipple::Solver;

  // ------------------------------------------------------------------
  // Encode problem.  Variable '0' is a proper variable, thus its
  // negation has to be given as explicit literal.

  enum { TIE = 0, SHIRT = 1 };

  std::vector<Dipple::Clause> clauses;
  clauses.push_back (Dipple::Clause ({
    Dipple::Literal (TIE, true), Dipple::Literal (SHIRT) }));
  clauses.push_back (Dipple::Clause ({
    Dipple::Literal (TIE), Dipple::Literal (SHIRT) }));
  clauses.push_back (Dipple::Clause ({
    Dipple::Literal (TIE, true), Dipple::Literal (SHIRT, true) }));

  Dipple::Formula formula (clauses);

  int res = solver->solve (formula);    // Solve instance.
  assert (res == 10);                   // Check it is 'SATISFIABLE'.

  res = solver->val (TIE);              // Obtain assignment of 'TIE'.
  assert (res < 0);                     // Check 'TIE' assigned to 'false'.

  res = solver->val (SHIRT);            // Obtain assignment of 'SHIRT'.
  assert (res > 0);                     // Check 'SHIRT' assigned to 'true'.

  assert (Dipple::evaluate (formula, solver->model ()));

  // ------------------------------------------------------------------
  // Solve again with 'TIE' forced to true by a partial model.

  Dipple::Model partial;
  partial.assign (TIE, true);

  res = solver->solve (formula, partial);
  assert (res == 20);                   // Check it is 'UNSATISFIABLE'.

  // ------------------------------------------------------------------

  delete solver;

  return 0;
}

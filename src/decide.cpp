#include "internal.hpp"

namespace Dipple {

// Branch on the smallest clause with an unassigned variable (the first in
// formula order on ties) and pick its smallest unassigned literal.  Since
// literals in clauses are sorted this is the first unassigned literal.

Literal Internal::decide (const Formula & formula, const Model & model) {
  assert (!formula.empty ());
  const Clause * candidate = 0;
  for (const auto & c : formula) {
    if (candidate && c.size () >= candidate->size ()) continue;
    for (const auto & lit : c) {
      if (model.assigned (lit.var ())) continue;
      candidate = &c;
      break;
    }
  }
  if (candidate) {
    for (const auto & lit : *candidate)
      if (!model.assigned (lit.var ()))
        return lit;
  }

  // Only reached if all variables in the formula are assigned, which does
  // not happen after rewriting, but keeps this function total.
  //
  const Clause * smallest = 0;
  for (const auto & c : formula)
    if (!smallest || c.size () < smallest->size ())
      smallest = &c;
  assert (smallest);
  assert (!smallest->empty ());
  return (*smallest)[0];
}

}

#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/

// Rewrite the formula under the assumption that 'lit' is true.  Clauses
// containing 'lit' are satisfied and dropped.  The complement of 'lit' is
// removed from all other clauses.  If this produces an empty clause we
// have a conflict and return 'false' without touching 'res'.

bool Internal::assign_literal (const Formula & formula,
                               const Literal & lit, Formula & res) {
  const Literal not_lit = -lit;
  vector<Clause> clauses;
  clauses.reserve (formula.size ());
  vector<Literal> literals;
  for (const auto & c : formula) {
    if (c.contains (lit)) { stats.satisfied++; continue; }
    if (!c.contains (not_lit)) { clauses.push_back (c); continue; }
    literals.clear ();
    for (const auto & other : c)
      if (other != not_lit)
        literals.push_back (other);
    if (literals.empty ()) {
      LOG (c, "assigning %s falsifies", LOGLIT (lit));
      stats.conflicts++;
      return false;
    }
    stats.rewritten++;
    clauses.push_back (Clause (literals));
  }
  res = Formula (clauses);
  return true;
}

/*------------------------------------------------------------------------*/

// The first unit clause in formula order.

bool Internal::find_unit (const Formula & formula, Literal & unit) {
  for (const auto & c : formula) {
    if (c.size () != 1) continue;
    unit = c[0];
    return true;
  }
  return false;
}

// Unit propagation to a fixed point.  Returns 'false' on conflict, either
// because the unit clashes with the model or because assigning it empties
// another clause.

bool Internal::propagate (Formula & formula, Model & model) {
  Literal unit;
  while (find_unit (formula, unit)) {
    stats.propagations++;
    LOG ("propagating unit %s", LOGLIT (unit));
    if (!model.assign (unit)) {
      LOG ("unit %s clashes with model", LOGLIT (unit));
      stats.conflicts++;
      return false;
    }
    Formula reduced;
    if (!assign_literal (formula, unit, reduced)) return false;
    formula = reduced;
  }
  return true;
}

}

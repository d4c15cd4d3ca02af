#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/

// A literal is pure if its variable only occurs with this sign in the
// remaining formula.  Making it true keeps the formula satisfiable.
//
// Occurring literals of unassigned variables are sorted, thus both signs
// of a variable end up next to each other and pure literals are found in
// increasing variable order.

void Internal::find_pure_literals (const Formula & formula,
                                   const Model & model,
                                   vector<Literal> & pures) {
  assert (pures.empty ());
  vector<Literal> occurring;
  for (const auto & c : formula)
    for (const auto & lit : c)
      if (!model.assigned (lit.var ()))
        occurring.push_back (lit);
  sort (occurring.begin (), occurring.end ());
  occurring.erase (unique (occurring.begin (), occurring.end ()),
                   occurring.end ());
  const size_t size = occurring.size ();
  for (size_t i = 0; i < size; i++) {
    const Literal & lit = occurring[i];
    if (i + 1 < size && occurring[i + 1].var () == lit.var ()) i++;
    else pures.push_back (lit);
  }
}

// All pure literals of one pass are assigned before the next pass.

bool Internal::eliminate_pure_literals (Formula & formula, Model & model) {
  vector<Literal> pures;
  for (;;) {
    find_pure_literals (formula, model, pures);
    if (pures.empty ()) return true;
    VERBOSE (3, "found %zu pure literals", pures.size ());
    for (const auto & lit : pures) {
      stats.pures++;
      LOG ("pure literal %s", LOGLIT (lit));
      if (!model.assign (lit)) {
        stats.conflicts++;
        return false;
      }
      Formula reduced;
      if (!assign_literal (formula, lit, reduced)) return false;
      formula = reduced;
    }
    pures.clear ();
  }
}

}

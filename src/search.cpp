#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/

// Interleave unit propagation and pure literal elimination until a full
// round does not assign anything new or the formula becomes empty.

bool Internal::simplify (Formula & formula, Model & model) {
  for (;;) {
    stats.rounds++;
    const int64_t before = stats.propagations + stats.pures;
    if (!propagate (formula, model)) return false;
    if (opts.pure && !eliminate_pure_literals (formula, model)) return false;
    if (formula.empty ()) return true;
    if (stats.propagations + stats.pures == before) return true;
  }
}

// The partial model is applied upfront by rewriting the formula with each
// of its assignments (in increasing variable order).

bool Internal::apply_partial_model (Formula & formula, const Model & partial)
{
  for (const auto & lit : partial.literals ()) {
    LOG ("applying partial model literal %s", LOGLIT (lit));
    Formula reduced;
    if (!assign_literal (formula, lit, reduced)) return false;
    formula = reduced;
  }
  return true;
}

/*------------------------------------------------------------------------*/

// Recursive depth-first search.  Each level owns its reduced formula and
// model copy.  On success the satisfying model is copied back to 'model'.
// The first branch assigns the decision literal to true, the second one
// to false.

bool Internal::search (const Formula & formula, Model & model) {

  if (formula.empty ()) return true;
  if (formula.has_empty_clause ()) {
    LOG ("formula has empty clause");
    stats.conflicts++;
    return false;
  }

  Formula simplified = formula;
  if (!simplify (simplified, model)) return false;
  if (simplified.empty ()) return true;

  const Literal decision = decide (simplified, model);
  stats.decisions++;
  if (stats.decisions >= lim.report) {
    report ('d');
    lim.delta *= 2;
    lim.report = stats.decisions + lim.delta;
  }

  for (int branch = 0; branch < 2; branch++) {
    const Literal lit = branch ? -decision : decision;
    if (branch) stats.backtracks++;
    LOG ("deciding %s", LOGLIT (lit));
    Model extended = model;
    if (!extended.assign (lit)) { stats.conflicts++; continue; }
    Formula reduced;
    if (!assign_literal (simplified, lit, reduced)) continue;
    if (++level > stats.maxlevel) stats.maxlevel = level;
    const bool satisfied = search (reduced, extended);
    level--;
    if (!satisfied) continue;
    model = extended;
    return true;
  }

  LOG ("both branches on %s failed", LOGLIT (decision));
  return false;
}

/*------------------------------------------------------------------------*/

int Internal::solve (const Formula & formula, const Model * partial) {

  stats.searches++;
  level = 0;
  model = partial ? *partial : Model ();
  lim.delta = opts.reportint;
  lim.report = stats.decisions + lim.delta;

  VERBOSE (1, "solving formula with %zu clauses and maximum variable %d",
    formula.size (), formula.max_var ());
  if (partial)
    VERBOSE (1, "starting with partial model of %zu assigned variables",
      partial->size ());

  report ('*');

  int res = 20;
  Formula reduced = formula;
  if (!apply_partial_model (reduced, model))
    VERBOSE (1, "partial model falsifies formula");
  else if (search (reduced, model))
    res = 10;

  report (res == 10 ? '1' : '0');

  if (res == 20) model = Model ();

  return res;
}

}

#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/

bool evaluate (const Formula & formula, const Model & model) {
  for (const auto & c : formula) {
    bool satisfied = false;
    for (const auto & lit : c)
      if ((satisfied = model.satisfies (lit)))
        break;
    if (!satisfied) return false;
  }
  return true;
}

/*------------------------------------------------------------------------*/

// Check that the found model satisfies the original formula and extends
// the partial model.  A failure is an internal error.

void Internal::check_model (const Formula & formula, const Model * partial)
{
  VERBOSE (2, "checking model of %zu variables", model.size ());
  for (const auto & c : formula) {
    bool satisfied = false;
    for (const auto & lit : c)
      if ((satisfied = model.satisfies (lit)))
        break;
    if (satisfied) continue;
    fatal_message_start ();
    fputs ("model does not satisfy formula:", stderr);
    for (const auto & lit : c)
      fprintf (stderr, " %s", lit.str ().c_str ());
    fatal_message_end ();
  }
  if (!partial) return;
  for (const auto & lit : partial->literals ())
    if (!model.satisfies (lit))
      FATAL ("model does not extend partial model on variable %d",
        lit.var ());
}

}

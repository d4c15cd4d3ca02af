#include "internal.hpp"

namespace Dipple {

static bool smaller_var (const Literal & lit, int var) {
  return lit.var () < var;
}

int Model::val (int var) const {
  auto it = lower_bound (lits.begin (), lits.end (), var, smaller_var);
  if (it == lits.end () || it->var () != var) return 0;
  return it->negated () ? -1 : 1;
}

bool Model::assign (int var, bool value) {
  REQUIRE_VALID_VAR (var);
  auto it = lower_bound (lits.begin (), lits.end (), var, smaller_var);
  if (it != lits.end () && it->var () == var)
    return it->negated () != value;
  lits.insert (it, Literal (var, !value));
  return true;
}

}

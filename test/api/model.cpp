#include "../../src/dipple.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

using namespace Dipple;

int main () {

  Model model;
  assert (model.empty ());
  assert (model.max_var () == -1);
  assert (!model.val (0));
  assert (!model.val (100));

  assert (model.assign (3, true));
  assert (model.assign (Literal (0, true)));
  assert (model.size () == 2);
  assert (model.max_var () == 3);
  assert (model.val (3) == 1);
  assert (model.val (0) == -1);
  assert (!model.assigned (1));
  assert (model.satisfies (Literal (3)));
  assert (model.satisfies (Literal (0, true)));
  assert (!model.satisfies (Literal (0)));
  assert (!model.satisfies (Literal (1)));
  assert (!model.satisfies (Literal (1, true)));

  // Reassigning the same value is fine, the opposite value is not.

  assert (model.assign (3, true));
  assert (!model.assign (3, false));
  assert (model.val (3) == 1);
  assert (model.size () == 2);

  std::vector<Literal> lits = model.literals ();
  assert (lits.size () == 2);
  assert (lits[0] == Literal (0, true));
  assert (lits[1] == Literal (3));

  // Equal models assign the same variables to the same values.

  Model other;
  other.assign (0, false);
  assert (other != model);
  other.assign (3, true);
  assert (other == model);
  other.assign (7, false);
  assert (other != model);

  return 0;
}

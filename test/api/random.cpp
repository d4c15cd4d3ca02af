#include "../../src/dipple.hpp"
#include "../../src/random.hpp"
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <algorithm>
#include <cassert>

using namespace Dipple;

// Randomized tests against brute force enumeration of all assignments.

static const int max_vars = 10;

static Formula random_formula (Random & random) {
  const int vars = random.pick_int (1, max_vars);
  const int size = random.pick_int (0, 4 * vars);
  std::vector<Clause> clauses;
  for (int i = 0; i < size; i++) {
    const int length = random.pick_int (0, 19) ? random.pick_int (1, 4) : 0;
    std::vector<Literal> literals;
    for (int j = 0; j < length; j++)
      literals.push_back (Literal (random.pick_int (0, vars - 1),
                                   random.generate_bool ()));
    clauses.push_back (Clause (literals));
  }
  return Formula (clauses);
}

static bool brute_force (const Formula & formula) {
  const int vars = formula.max_var () + 1;
  for (unsigned bits = 0; bits < (1u << vars); bits++) {
    Model model;
    for (int idx = 0; idx < vars; idx++)
      model.assign (idx, (bits >> idx) & 1);
    if (evaluate (formula, model)) return true;
  }
  return false;
}

static Formula shuffle_clauses (const Formula & formula, Random & random) {
  std::vector<Clause> clauses (formula.begin (), formula.end ());
  for (size_t i = clauses.size (); i > 1; i--)
    std::swap (clauses[i - 1], clauses[random.pick_int (0, i - 1)]);
  return Formula (clauses);
}

// Literals are reversed and duplicated, which gives the same clauses.

static Formula reverse_literals (const Formula & formula) {
  std::vector<Clause> clauses;
  for (const auto & c : formula) {
    std::vector<Literal> literals (c.begin (), c.end ());
    std::reverse (literals.begin (), literals.end ());
    if (!literals.empty ()) literals.push_back (literals[0]);
    clauses.push_back (Clause (literals));
  }
  return Formula (clauses);
}

// Satisfiable by construction, since every clause contains a literal
// satisfied by a hidden model.

static Formula planted_formula (Random & random, Model & hidden) {
  const int vars = random.pick_int (3, 12);
  for (int idx = 0; idx < vars; idx++)
    hidden.assign (idx, random.generate_bool ());
  std::vector<Clause> clauses;
  const int size = random.pick_int (1, 4 * vars);
  for (int i = 0; i < size; i++) {
    const int planted = random.pick_int (0, vars - 1);
    std::vector<Literal> literals;
    literals.push_back (Literal (planted, hidden.val (planted) < 0));
    const int length = random.pick_int (0, 2);
    for (int j = 0; j < length; j++)
      literals.push_back (Literal (random.pick_int (0, vars - 1),
                                   random.generate_bool ()));
    clauses.push_back (Clause (literals));
  }
  return Formula (clauses);
}

// Unsatisfiable by construction, since all '2^k' full clauses over the
// first 'k' variables are added to random clauses.

static Formula complete_formula (Random & random) {
  const int k = random.pick_int (1, 4);
  std::vector<Clause> clauses;
  for (unsigned bits = 0; bits < (1u << k); bits++) {
    std::vector<Literal> literals;
    for (int idx = 0; idx < k; idx++)
      literals.push_back (Literal (idx, (bits >> idx) & 1));
    clauses.push_back (Clause (literals));
  }
  const int extra = random.pick_int (0, 5);
  for (int i = 0; i < extra; i++)
    clauses.push_back (Clause ({
      Literal (random.pick_int (0, 7), random.generate_bool ()),
      Literal (random.pick_int (0, 7), random.generate_bool ()) }));
  return shuffle_clauses (Formula (clauses), random);
}

int main () {

  Random random (42);

  for (int i = 0; i < 200; i++) {

    const Formula formula = random_formula (random);
    const bool expected = brute_force (formula);

    Model model;
    const int res = solve (formula, model);
    assert (res == (expected ? 10 : 20));
    if (res == 10) assert (evaluate (formula, model));

    // Deterministic.

    Model again;
    assert (solve (formula, again) == res);
    if (res == 10) assert (again == model);

    // Invariant under clause reordering and literal order.

    Model shuffled;
    assert (solve (shuffle_clauses (formula, random), shuffled) == res);
    if (res == 10) assert (evaluate (formula, shuffled));

    Model reversed;
    assert (solve (reverse_literals (formula), reversed) == res);
    if (res == 10) assert (reversed == model);

    // Without pure literal elimination.

    Solver solver;
    solver.set ("pure", 0);
    assert (solver.solve (formula) == res);
    if (res == 10) assert (evaluate (formula, solver.model ()));
  }

  for (int i = 0; i < 50; i++) {
    Model hidden, model;
    const Formula formula = planted_formula (random, hidden);
    assert (evaluate (formula, hidden));
    assert (solve (formula, model) == 10);
    assert (evaluate (formula, model));
  }

  for (int i = 0; i < 50; i++)
    assert (!is_satisfiable (complete_formula (random)));

  return 0;
}

#ifndef _dipple_hpp_INCLUDED
#define _dipple_hpp_INCLUDED

#include <cstdio>
#include <string>
#include <vector>

namespace Dipple {

/*========================================================================*/

// Library interface of Dipple, a deterministic DPLL solver for formulas in
// conjunctive normal form.  Formulas are built from the value types
// 'Literal', 'Clause' and 'Formula' and are solved by a 'Solver', which
// hands out a satisfying 'Model'.  The free functions 'solve',
// 'is_satisfiable' and 'evaluate' cover the common cases without an
// explicit solver object.

/*========================================================================*/

// [Example]
//
// The following code is taken from 'test/api/example.cpp'.  Variable '0'
// is a proper variable, thus negation is always explicit.
//
//   enum { TIE = 0, SHIRT = 1 };
//
//   std::vector<Dipple::Clause> clauses;
//   clauses.push_back (Dipple::Clause ({
//     Dipple::Literal (TIE, true), Dipple::Literal (SHIRT) }));
//   clauses.push_back (Dipple::Clause ({
//     Dipple::Literal (TIE), Dipple::Literal (SHIRT) }));
//   clauses.push_back (Dipple::Clause ({
//     Dipple::Literal (TIE, true), Dipple::Literal (SHIRT, true) }));
//
//   Dipple::Formula formula (clauses);
//   Dipple::Solver * solver = new Dipple::Solver;
//
//   int res = solver->solve (formula);  // 10 = satisfiable
//   assert (res == 10);
//   assert (solver->val (TIE) < 0);     // 'TIE' is false
//   assert (solver->val (SHIRT) > 0);   // 'SHIRT' is true
//
//   delete solver;

/*========================================================================*/

// [States and Transitions]
//
// A solver is configured once and then solves any number of formulas.
// Each call to 'solve' gets a complete formula.
//
//   new     INITIALIZING  --> CONFIGURING
//   set     CONFIGURING   --> CONFIGURING
//   solve   READY         --> SOLVING --> SATISFIED | UNSATISFIED
//   val     SATISFIED     --> SATISFIED
//   delete  VALID         --> DELETING
//
// Calling a function outside of its states is an API contract violation,
// which prints an error message and aborts.

enum State
{
  INITIALIZING = 1,
  CONFIGURING  = 2,             // options can be set
  UNKNOWN      = 4,
  SOLVING      = 8,
  SATISFIED    = 16,            // model available
  UNSATISFIED  = 32,
  DELETING     = 64,

  READY   = CONFIGURING  | UNKNOWN | SATISFIED | UNSATISFIED,
  VALID   = READY,
  INVALID = INITIALIZING | DELETING
};

enum
{
  SATISFIABLE   = 10,
  UNSATISFIABLE = 20
};

/*------------------------------------------------------------------------*/

class File;
struct Internal;

/*------------------------------------------------------------------------*/

// Literals are pairs of a non-negative variable and a sign, so that '0'
// and '-0' are different literals.  The order is by variable and then
// positive before negative.

class Literal {

  int _var;
  bool _negated;

public:

  Literal () : _var (0), _negated (false) { }
  explicit Literal (int var, bool negated = false);   // require 'var >= 0'

  int var () const { return _var; }
  bool negated () const { return _negated; }

  Literal operator - () const {
    Literal res (*this);
    res._negated = !_negated;
    return res;
  }

  bool operator == (const Literal & other) const {
    return _var == other._var && _negated == other._negated;
  }

  bool operator != (const Literal & other) const {
    return !(*this == other);
  }

  bool operator < (const Literal & other) const {
    if (_var != other._var) return _var < other._var;
    return !_negated && other._negated;
  }

  std::string str () const;             // "3", "-3", "0" or "-0"
};

// From a signed integer, thus without '-0'.
//
Literal make_literal (int lit);

// Parses '[-]<digits>' ignoring surrounding white space and returns an
// error message on failure and zero otherwise.
//
const char * parse_literal (const char * token, Literal & lit);

/*------------------------------------------------------------------------*/

// Set of literals kept sorted without duplicates.

class Clause {

  std::vector<Literal> literals;

public:

  typedef std::vector<Literal>::const_iterator const_iterator;

  Clause () { }
  Clause (const std::vector<Literal> &);

  const_iterator begin () const { return literals.begin (); }
  const_iterator end () const { return literals.end (); }

  size_t size () const { return literals.size (); }
  bool empty () const { return literals.empty (); }

  const Literal & operator [] (size_t i) const { return literals[i]; }

  bool contains (const Literal &) const;
};

Clause make_clause (const std::vector<int> & lits);

const char * parse_clause (const char * line, Clause &);

/*------------------------------------------------------------------------*/

// Immutable sequence of clauses.  Clause order and repeated clauses are
// kept as given.

class Formula {

  std::vector<Clause> clauses;

public:

  typedef std::vector<Clause>::const_iterator const_iterator;

  Formula () { }
  Formula (const std::vector<Clause> &);

  const_iterator begin () const { return clauses.begin (); }
  const_iterator end () const { return clauses.end (); }

  size_t size () const { return clauses.size (); }
  bool empty () const { return clauses.empty (); }

  const Clause & operator [] (size_t i) const { return clauses[i]; }

  bool has_empty_clause () const;
  int max_var () const;                 // '-1' without literals
};

Formula make_formula (const std::vector< std::vector<int> > & clauses);

/*------------------------------------------------------------------------*/

// Partial assignment stored as the literals it makes true, sorted by
// variable.  Its size only depends on the number of assigned variables,
// not on how large their indices are.

class Model {

  std::vector<Literal> lits;

public:

  Model () { }

  int val (int var) const;              // '1', '-1' or '0' if unassigned

  bool assigned (int var) const { return val (var) != 0; }

  bool satisfies (const Literal & lit) const {
    return val (lit.var ()) == (lit.negated () ? -1 : 1);
  }

  // Returns 'false' (and keeps the old value) on a conflicting value.
  //
  bool assign (int var, bool value);
  bool assign (const Literal & lit) {
    return assign (lit.var (), !lit.negated ());
  }

  size_t size () const { return lits.size (); }
  bool empty () const { return lits.empty (); }
  int max_var () const { return lits.empty () ? -1 : lits.back ().var (); }

  const std::vector<Literal> & literals () const { return lits; }

  bool operator == (const Model & other) const { return lits == other.lits; }
  bool operator != (const Model & other) const { return lits != other.lits; }
};

/*------------------------------------------------------------------------*/

class Solver {

public:

  Solver ();
  ~Solver ();

  static const char * signature ();
  static const char * version ();

  // Returns 10 (SATISFIABLE) or 20 (UNSATISFIABLE).  A partial model is
  // applied first and a satisfying model extends it.
  //
  //   require (READY)
  //   ensure (SATISFIED | UNSATISFIED)
  //
  int solve (const Formula &);
  int solve (const Formula &, const Model & partial);

  //   require (SATISFIED)
  //
  int val (int var);
  const Model & model () const;

  const State & state () const { return _state; }

  /*----------------------------------------------------------------------*/

  static bool is_valid_option (const char * name);

  // Accepts '--<name>', '--no-<name>' and '--<name>=<val>' where '<val>'
  // is 'true', 'false' or '[-]<digits>[e<digits>]'.
  //
  static bool is_valid_long_option (const char * arg);

  int get (const char * name);          // zero for invalid options

  void prefix (const char * verbose_message_prefix);   // default "c "

  // Values are clipped to the range of the option.
  //
  //   require (CONFIGURING)
  //
  bool set (const char * name, int val);
  bool set_long_option (const char * arg);

  /*----------------------------------------------------------------------*/

  // Instances are lines of white space separated literals, one clause per
  // line, and blank lines between formulas.  These return zero on success
  // and otherwise a parse error message valid until the next error.
  //
  const char * read_instances (const char * path, std::vector<Formula> &);
  const char * read_instances (FILE * file, const char * name,
                               std::vector<Formula> &);
  const char * parse_instances (const char * text, std::vector<Formula> &);

  /*----------------------------------------------------------------------*/

  static void usage ();         // long options with ranges
  void statistics ();
  void options ();              // current option values

private:

  State _state;
  Internal * internal;

  friend class App;
  friend class Parser;

  void section (const char *);
  void message (const char *, ...);
  void message ();
  void error (const char *, ...);       // prints and exits with '1'

  const char * read_instances (File *, std::vector<Formula> &);

  int call_internal_solve_and_check_results (const Formula &,
                                             const Model * partial);
};

/*------------------------------------------------------------------------*/

// These use a solver with default options.  The model is only written
// for satisfiable formulas.

int solve (const Formula &, Model &);
int solve (const Formula &, const Model & partial, Model &);
bool is_satisfiable (const Formula &);

// True if every clause has a literal made true by the model.
//
bool evaluate (const Formula &, const Model &);

}

#endif

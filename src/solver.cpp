#include "internal.hpp"

/*------------------------------------------------------------------------*/

namespace Dipple {

/*------------------------------------------------------------------------*/

// Implements the 'Solver' class of 'dipple.hpp'.  The application with
// 'main' is in 'dipple.cpp'.

/*------------------------------------------------------------------------*/

// Used for debugging state transitions.

#ifdef LOGGING
static const char * state_name (State s) {
  switch (s) {
    case INITIALIZING: return "INITIALIZING";
    case CONFIGURING:  return "CONFIGURING";
    case UNKNOWN:      return "UNKNOWN";
    case SOLVING:      return "SOLVING";
    case SATISFIED:    return "SATISFIED";
    case UNSATISFIED:  return "UNSATISFIED";
    case DELETING:     return "DELETING";
    default:           return "INVALID";
  }
}

#define STATE(S) \
do { \
  if (_state != S) \
    LOG ("API leaves state %s and enters state %s", \
      state_name (_state), state_name (S)); \
  _state = S; \
} while (0)
#else
#define STATE(S) \
do { \
  _state = S; \
} while (0)
#endif

/*------------------------------------------------------------------------*/

Solver::Solver () {
  _state = INITIALIZING;
  internal = new Internal ();
  LOG ("new solver %p", (void *) this);
  STATE (CONFIGURING);
}

Solver::~Solver () {
  REQUIRE_VALID_STATE ();
  STATE (DELETING);
  LOG ("delete solver %p", (void *) this);
  delete internal;
}

const char * Solver::signature () { return Dipple::signature (); }

const char * Solver::version () { return Dipple::version (); }

/*------------------------------------------------------------------------*/

bool Solver::is_valid_option (const char * name) {
  return Options::has (name);
}

bool Solver::is_valid_long_option (const char * arg) {
  string name;
  int tmp;
  return Options::parse_long_option (arg, name, tmp);
}

int Solver::get (const char * arg) {
  REQUIRE_VALID_STATE ();
  return internal->opts.get (arg);
}

bool Solver::set (const char * arg, int val) {
  REQUIRE_VALID_STATE ();
  REQUIRE (state () == CONFIGURING,
    "can only set option 'set (\"%s\", %d)' right after initialization",
    arg, val);
  return internal->opts.set (arg, val);
}

bool Solver::set_long_option (const char * arg) {
  REQUIRE_VALID_STATE ();
  REQUIRE (state () == CONFIGURING,
    "can only set option '%s' right after initialization", arg);
  bool res;
  if (arg[0] != '-' || arg[1] != '-') res = false;
  else {
    int val;
    string name;
    res = Options::parse_long_option (arg, name, val);
    if (res) set (name.c_str (), val);
  }
  return res;
}

void Solver::prefix (const char * str) {
  REQUIRE_VALID_STATE ();
  REQUIRE (str, "zero prefix");
  internal->prefix = str;
}

/*------------------------------------------------------------------------*/

int Solver::call_internal_solve_and_check_results (const Formula & formula,
                                                   const Model * partial)
{
  REQUIRE_VALID_STATE ();
  REQUIRE (state () & READY, "solver not in ready state");
  STATE (SOLVING);
  const int res = internal->solve (formula, partial);
  if (res == 10) {
    if (internal->opts.check) internal->check_model (formula, partial);
    STATE (SATISFIED);
  } else {
    assert (res == 20);
    STATE (UNSATISFIED);
  }
  return res;
}

int Solver::solve (const Formula & formula) {
  LOG ("solve formula with %zu clauses", formula.size ());
  return call_internal_solve_and_check_results (formula, 0);
}

int Solver::solve (const Formula & formula, const Model & partial) {
  LOG ("solve formula with %zu clauses under partial model of size %zu",
    formula.size (), partial.size ());
  return call_internal_solve_and_check_results (formula, &partial);
}

int Solver::val (int var) {
  REQUIRE_VALID_STATE ();
  REQUIRE_VALID_VAR (var);
  REQUIRE (state () == SATISFIED,
    "can only get value in satisfied state");
  return internal->model.val (var);
}

const Model & Solver::model () const {
  REQUIRE_VALID_STATE ();
  REQUIRE (state () == SATISFIED,
    "can only get model in satisfied state");
  return internal->model;
}

/*------------------------------------------------------------------------*/

const char * Solver::read_instances (File * file,
                                     vector<Formula> & formulas) {
  REQUIRE_VALID_STATE ();
  Parser * parser = new Parser (this, file);
  const char * err = parser->parse_instances (formulas);
  delete parser;
  return err;
}

const char * Solver::read_instances (FILE * external_file,
                                     const char * name,
                                     vector<Formula> & formulas) {
  REQUIRE_VALID_STATE ();
  REQUIRE (external_file, "zero file");
  REQUIRE (name, "zero name");
  File * file = File::read (internal, external_file, name);
  assert (file);
  const char * err = read_instances (file, formulas);
  delete file;
  return err;
}

const char * Solver::read_instances (const char * path,
                                     vector<Formula> & formulas) {
  REQUIRE_VALID_STATE ();
  REQUIRE (path, "zero path");
  File * file = File::read (internal, path);
  if (!file)
    return internal->format_error (
             "failed to read instance file '%s'", path);
  const char * err = read_instances (file, formulas);
  delete file;
  return err;
}

// Text is read through a memory stream, thus sharing the file parser.

const char * Solver::parse_instances (const char * text,
                                      vector<Formula> & formulas) {
  REQUIRE_VALID_STATE ();
  REQUIRE (text, "zero text");
  const size_t len = strlen (text);
  if (!len) { formulas.clear (); return 0; }
  FILE * file = fmemopen ((void *) text, len, "r");
  if (!file)
    return internal->format_error ("failed to open instance text");
  const char * err = read_instances (file, "<text>", formulas);
  fclose (file);
  return err;
}

/*------------------------------------------------------------------------*/

void Solver::usage () { Options::usage (); }

void Solver::statistics () {
  if (state () == DELETING) return;
  REQUIRE_INITIALIZED ();
  internal->print_statistics ();
}

void Solver::options () {
  REQUIRE_VALID_STATE ();
  internal->opts.print ();
}

/*------------------------------------------------------------------------*/

void Solver::section (const char * title) {
  if (state () == DELETING) return;
#ifdef QUIET
  (void) title;
#endif
  REQUIRE_INITIALIZED ();
  SECTION (title);
}

void Solver::message (const char * fmt, ...) {
  if (state () == DELETING) return;
#ifdef QUIET
  (void) fmt;
#else
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->vverbose (0, fmt, ap);
  va_end (ap);
#endif
}

void Solver::message () {
  if (state () == DELETING) return;
  REQUIRE_INITIALIZED ();
#ifndef QUIET
  internal->message ();
#endif
}

void Solver::error (const char * fmt, ...) {
  REQUIRE_INITIALIZED ();
  va_list ap;
  va_start (ap, fmt);
  internal->verror (fmt, ap);
  va_end (ap);
}

/*------------------------------------------------------------------------*/

// Convenience functions which use a default configured solver.

int solve (const Formula & formula, Model & model) {
  Solver solver;
  const int res = solver.solve (formula);
  if (res == 10) model = solver.model ();
  return res;
}

int solve (const Formula & formula, const Model & partial, Model & model) {
  Solver solver;
  const int res = solver.solve (formula, partial);
  if (res == 10) model = solver.model ();
  return res;
}

bool is_satisfiable (const Formula & formula) {
  Solver solver;
  return solver.solve (formula) == 10;
}

}

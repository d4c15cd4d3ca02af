#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/

// Stand alone solver.  Reads every formula of one instance file, solves
// them in file order and prints a status line per formula followed by the
// model for satisfiable ones.

class App {

  Solver * solver;
  bool witness;

  void print_usage (bool all);
  void print_witness (const Model &);

  int solve_all (const vector<Formula> &);

public:

  App () : solver (0), witness (true) { }
  ~App () { delete solver; }

  int main (int argc, char ** argv);
};

/*------------------------------------------------------------------------*/

void App::print_usage (bool all) {
  printf (
"usage: dipple [ <option> ... ] [ <input> ]\n"
"\n"
"  -h             print this list of common options\n"
"  --help         also print all solver options\n"
"  --version      print version and exit\n"
"  --copyright    print copyright and exit\n"
"\n"
"  -n             do not print the model ('--no-witness')\n"
#ifndef QUIET
"  -q             no messages ('--quiet')\n"
"  -v             more messages (can be repeated)\n"
#endif
#ifdef LOGGING
"  -l             print logging messages\n"
#endif
"\n"
"The input is an instance file with one clause per line and blank lines\n"
"between formulas.  Without '<input>' or with '-' it is read from\n"
"'<stdin>'.  The exit code is '10' if all formulas are satisfiable, '20'\n"
"if one of them is unsatisfiable and '0' if there is no formula.\n");
  if (!all) return;
  printf ("\nSolver options are given as '--<name>=<val>':\n\n");
  Solver::usage ();
}

// Literals in increasing variable order on 'v' lines shorter than 78
// characters.  There is no terminating '0' since '0' is a variable.

void App::print_witness (const Model & model) {
  fputc ('v', stdout);
  int c = 1;
  for (const auto & lit : model.literals ()) {
    const string str = lit.str ();
    const int l = 1 + (int) str.size ();
    if (c + l > 78) {
      fputs ("\nv", stdout);
      c = 1;
    }
    printf (" %s", str.c_str ());
    c += l;
  }
  fputc ('\n', stdout);
}

int App::solve_all (const vector<Formula> & formulas) {
  int res = formulas.empty () ? 0 : SATISFIABLE;
  if (formulas.empty ()) solver->message ("no formula to solve");
  for (size_t i = 0; i < formulas.size (); i++) {
    if (formulas.size () > 1) printf ("c formula %zu\n", i + 1);
    fflush (stdout);
    const int tmp = solver->solve (formulas[i]);
    if (tmp == SATISFIABLE) {
      printf ("s SATISFIABLE\n");
      if (witness) print_witness (solver->model ());
    } else {
      printf ("s UNSATISFIABLE\n");
      res = UNSATISFIABLE;
    }
    fflush (stdout);
  }
  return res;
}

/*------------------------------------------------------------------------*/

#define APPERR(...) \
do { solver->error (__VA_ARGS__); } while (0)

int App::main (int argc, char ** argv) {

  for (int i = 1; i < argc; i++) {
    if (!strcmp (argv[i], "-h")) { print_usage (false); return 0; }
    if (!strcmp (argv[i], "--help")) { print_usage (true); return 0; }
    if (!strcmp (argv[i], "--version")) {
      printf ("%s\n", Dipple::version ());
      return 0;
    }
    if (!strcmp (argv[i], "--copyright")) {
      printf ("%s\n", Dipple::copyright ());
      return 0;
    }
  }

  Options::reportdefault = 1;
  solver = new Solver;

  const char * input_path = 0;

  for (int i = 1; i < argc; i++) {
    const char * arg = argv[i];
    if (!strcmp (arg, "-n") || !strcmp (arg, "--no-witness"))
      witness = false;
    else if (!strcmp (arg, "-q")) solver->set ("quiet", 1);
    else if (!strcmp (arg, "-v"))
      solver->set ("verbose", solver->get ("verbose") + 1);
#ifdef LOGGING
    else if (!strcmp (arg, "-l")) solver->set ("log", 1);
#endif
    else if (!strcmp (arg, "-")) {
      if (input_path) APPERR ("too many arguments");
      input_path = arg;
    } else if (arg[0] == '-' && arg[1] == '-' &&
               solver->set_long_option (arg)) { }
    else if (arg[0] == '-') APPERR ("invalid option '%s'", arg);
    else if (input_path) APPERR ("too many arguments");
    else input_path = arg;
  }

  if (input_path && !strcmp (input_path, "-")) input_path = 0;
  if (input_path && !File::exists (input_path))
    APPERR ("can not read input file '%s'", input_path);

  solver->section ("banner");
  solver->message ("Dipple DPLL SAT solver");
  solver->message ("%s", Dipple::copyright ());
  solver->message ("Version %s", Dipple::version ());

  solver->section ("parsing input");
  solver->message ("reading instances from '%s'",
    input_path ? input_path : "<stdin>");

  vector<Formula> formulas;
  const char * err;
  if (input_path) err = solver->read_instances (input_path, formulas);
  else err = solver->read_instances (stdin, "<stdin>", formulas);
  if (err) APPERR ("%s", err);

  solver->section ("options");
  solver->options ();

  solver->section ("solving");
  const int res = solve_all (formulas);

  solver->statistics ();
  solver->message ();
  solver->message ("exit %d", res);

  return res;
}

}

/*------------------------------------------------------------------------*/

int main (int argc, char ** argv) {
  Dipple::App app;
  return app.main (argc, argv);
}

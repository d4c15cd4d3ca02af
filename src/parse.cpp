#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/

Parser::Parser (Solver * solver, File * f) :
  internal (solver->internal), file (f)
{ }

inline int Parser::parse_char () { return file->get (); }

const char * Parser::parse_error (const char * fmt, ...) {
  char reason[128];
  va_list ap;
  va_start (ap, fmt);
  vsnprintf (reason, sizeof reason, fmt, ap);
  va_end (ap);
  return internal->format_error ("%s:%" PRIu64 ": parse error: %s",
    file->name (), file->lineno (), reason);
}

#define PER(...) \
do { \
  return parse_error (__VA_ARGS__); \
} while (0)

// White space within a line, thus everything 'isspace' accepts except
// the new line character.

static bool is_blank (int ch) {
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v';
}

/*------------------------------------------------------------------------*/

// Reads a literal token starting with 'ch' and leaves the character after
// the token in 'ch'.

inline const char * Parser::parse_lit (int & ch, Literal & lit) {
  bool negated = false;
  if (ch == '-') {
    if (!isdigit (ch = parse_char ())) PER ("expected digit after '-'");
    negated = true;
  } else if (!isdigit (ch)) PER ("expected digit or '-'");
  int var = ch - '0';
  while (isdigit (ch = parse_char ())) {
    const int digit = ch - '0';
    if (var > (INT_MAX - digit) / 10) PER ("variable index too large");
    var = 10*var + digit;
  }
  if (!is_blank (ch) && ch != '\n' && ch != EOF)
    PER ("expected white space after '%s%d'", negated ? "-" : "", var);
  lit = Literal (var, negated);
  return 0;
}

/*------------------------------------------------------------------------*/

// A line with literals closes a clause.  An empty line (or the end of the
// file) closes the formula if it has clauses.

const char *
Parser::parse_instances_non_profiled (vector<Formula> & formulas) {

#ifndef QUIET
  const double start = internal->process_time ();
#endif

  formulas.clear ();

  vector<Clause> clauses;
  vector<Literal> line;
  int64_t parsed = 0;

  for (int ch = parse_char ();; ch = parse_char ()) {
    while (is_blank (ch)) ch = parse_char ();
    if (ch != '\n' && ch != EOF) {
      for (;;) {
        Literal lit;
        const char * err = parse_lit (ch, lit);
        if (err) return err;
        line.push_back (lit);
        while (is_blank (ch)) ch = parse_char ();
        if (ch == '\n' || ch == EOF) break;
      }
      const Clause clause (line);
      LOG (clause, "parsed clause");
      clauses.push_back (clause);
      line.clear ();
      parsed++;
      if (ch == EOF) break;
    } else if (!clauses.empty ()) {
      LOG ("parsed formula %zu with %zu clauses",
        formulas.size () + 1, clauses.size ());
      formulas.push_back (Formula (clauses));
      clauses.clear ();
      if (ch == EOF) break;
    } else if (ch == EOF) break;
  }

  if (!clauses.empty ()) formulas.push_back (Formula (clauses));

  MSG ("parsed %zu formulas with %" PRId64 " clauses in %.2f seconds",
    formulas.size (), parsed, internal->process_time () - start);

  return 0;
}

const char * Parser::parse_instances (vector<Formula> & formulas) {
  const char * err = parse_instances_non_profiled (formulas);
  if (err) formulas.clear ();
  return err;
}

}

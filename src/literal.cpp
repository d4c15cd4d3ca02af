#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/

Literal::Literal (int var, bool negated) : _var (var), _negated (negated) {
  REQUIRE_VALID_VAR (var);
}

string Literal::str () const {
  char buffer[16];
  sprintf (buffer, "%s%d", _negated ? "-" : "", _var);
  return buffer;
}

Literal make_literal (int lit) {
  REQUIRE (lit != INT_MIN, "invalid literal '%d'", lit);
  return lit < 0 ? Literal (-lit, true) : Literal (lit);
}

/*------------------------------------------------------------------------*/

// Parse the text form of a literal.  Since these error messages do not
// have position information they are static strings.

const char * parse_literal (const char * token, Literal & lit) {
  const char * p = token;
  while (isspace ((unsigned char) *p)) p++;
  const char * end = p + strlen (p);
  while (end > p && isspace ((unsigned char) end[-1])) end--;
  if (p == end) return "empty literal token";
  bool negated = false;
  if (*p == '-') {
    negated = true;
    if (++p == end) return "expected digit after '-'";
    if (!isdigit ((unsigned char) *p)) return "expected digit after '-'";
  } else if (!isdigit ((unsigned char) *p))
    return "expected digit or '-'";
  int var = 0;
  while (p < end) {
    const int ch = (unsigned char) *p++;
    if (!isdigit (ch)) return "invalid character in literal token";
    const int digit = ch - '0';
    if (INT_MAX/10 < var || INT_MAX - digit < 10*var)
      return "variable index too large";
    var = 10*var + digit;
  }
  lit = Literal (var, negated);
  return 0;
}

/*------------------------------------------------------------------------*/

// Clauses are sets, thus literals are sorted and duplicates are removed.
// The sorted order also makes iteration over clauses deterministic.

Clause::Clause (const vector<Literal> & lits) : literals (lits) {
  sort (literals.begin (), literals.end ());
  literals.erase (unique (literals.begin (), literals.end ()),
                  literals.end ());
}

bool Clause::contains (const Literal & lit) const {
  return binary_search (literals.begin (), literals.end (), lit);
}

Clause make_clause (const vector<int> & lits) {
  vector<Literal> literals;
  literals.reserve (lits.size ());
  for (const auto & lit : lits)
    literals.push_back (make_literal (lit));
  return Clause (literals);
}

const char * parse_clause (const char * line, Clause & clause) {
  vector<Literal> literals;
  string token;
  const char * p = line;
  for (;;) {
    while (isspace ((unsigned char) *p)) p++;
    if (!*p) break;
    token.clear ();
    while (*p && !isspace ((unsigned char) *p)) token.push_back (*p++);
    Literal lit;
    const char * err = parse_literal (token.c_str (), lit);
    if (err) return err;
    literals.push_back (lit);
  }
  clause = Clause (literals);
  return 0;
}

/*------------------------------------------------------------------------*/

Formula::Formula (const vector<Clause> & c) : clauses (c) { }

bool Formula::has_empty_clause () const {
  for (const auto & c : clauses)
    if (c.empty ())
      return true;
  return false;
}

int Formula::max_var () const {
  int res = -1;
  for (const auto & c : clauses)
    for (const auto & lit : c)
      if (lit.var () > res)
        res = lit.var ();
  return res;
}

Formula make_formula (const vector< vector<int> > & clauses) {
  vector<Clause> res;
  res.reserve (clauses.size ());
  for (const auto & c : clauses)
    res.push_back (make_clause (c));
  return Formula (res);
}

}

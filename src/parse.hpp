#ifndef _parse_hpp_INCLUDED
#define _parse_hpp_INCLUDED

#include <vector>

namespace Dipple {

class File;
class Formula;
class Literal;
class Solver;
struct Internal;

// Instance files have one clause per line and blank lines between
// formulas.  Errors have the form '<name>:<line>: parse error: <reason>'.

class Parser {

  Internal * internal;
  File * file;

  int parse_char ();
  const char * parse_error (const char * fmt, ...);
  const char * parse_lit (int & ch, Literal & lit);
  const char * parse_instances_non_profiled (std::vector<Formula> &);

public:

  Parser (Solver *, File *);

  // On failure 'formulas' is cleared and the error returned.
  //
  const char * parse_instances (std::vector<Formula> & formulas);
};

}

#endif

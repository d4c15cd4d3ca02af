#ifndef _internal_hpp_INCLUDED
#define _internal_hpp_INCLUDED

#include <cassert>
#include <cctype>
#include <cinttypes>
#include <climits>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <string>
#include <vector>

/*------------------------------------------------------------------------*/

// Every internal header, thus source files only include this one.

#include "contract.hpp"
#include "dipple.hpp"
#include "file.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "options.hpp"
#include "parse.hpp"
#include "resources.hpp"
#include "stats.hpp"
#include "util.hpp"
#include "version.hpp"

/*------------------------------------------------------------------------*/

namespace Dipple {

using namespace std;

struct Internal {

  Internal * internal;          // for the message and logging macros

  int level;                    // current decision depth
  string prefix;                // of all messages
  Model model;                  // result of the last 'solve'
  Options opts;
  Stats stats;
  string error_message;         // returned by 'format_error'

  struct {
    int64_t report;             // decisions until next report
    int64_t delta;
  } lim;

  Internal ();

  /*----------------------------------------------------------------------*/

  // Rewrites 'formula' with 'lit' set to true into 'res'.  Returns 'false'
  // if this empties a clause ('res' is untouched then).
  //
  bool assign_literal (const Formula & formula, const Literal & lit,
                       Formula & res);

  bool find_unit (const Formula &, Literal &);
  bool propagate (Formula &, Model &);

  void find_pure_literals (const Formula &, const Model &,
                           vector<Literal> &);
  bool eliminate_pure_literals (Formula &, Model &);

  Literal decide (const Formula &, const Model &);

  bool simplify (Formula &, Model &);
  bool apply_partial_model (Formula &, const Model &);
  bool search (const Formula &, Model &);
  int solve (const Formula &, const Model * partial);

  void check_model (const Formula &, const Model * partial);

  /*----------------------------------------------------------------------*/

#ifndef QUIET
  bool printing (int verbosity);        // unless 'quiet' or too verbose
  void vverbose (int level, const char * fmt, va_list &);
  void verbose (int level, const char * fmt, ...);
  void message (const char * fmt, ...);
  void message ();
  void section (const char * title);    // c --- [ title ] -------
#endif

  void report (char type);
  void print_statistics ();

  // User errors print '*** dipple error: ...' and exit with '1'.
  //
  void verror (const char *, va_list &);
  void error (const char *, ...);

  // Keeps the message in 'error_message' and returns it.
  //
  const char * format_error (const char *, ...);

  double process_time ();
  double real_time ();
};

// Internal errors abort.
//
void fatal_message_start ();
void fatal_message_end ();
void fatal (const char *, ...);

}

#endif

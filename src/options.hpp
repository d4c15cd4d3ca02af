#ifndef _options_hpp_INCLUDED
#define _options_hpp_INCLUDED

#include <string>

/*------------------------------------------------------------------------*/

// All options in one table, sorted by name (checked at start-up).  Each
// line gives name, default, minimum, maximum and description.

#define OPTIONS \
\
OPTION( check,             1,  0,  1, "check satisfying models") \
LOGOPT( log,               0,  0,  1, "print logging messages") \
OPTION( pure,              1,  0,  1, "eliminate pure literals") \
QUTOPT( quiet,             0,  0,  1, "disable all messages") \
OPTION( report,reportdefault,  0,  1, "print progress reports") \
OPTION( reportint,       1e3,  1,2e9, "decisions before first report") \
QUTOPT( verbose,           0,  0,  3, "verbosity level") \

// The table above ends with an empty line because of the last '\'.

#ifdef LOGGING
#define LOGOPT OPTION
#else
#define LOGOPT(...) /**/
#endif

#ifdef QUIET
#define QUTOPT(...) /**/
#else
#define QUTOPT OPTION
#endif

/*------------------------------------------------------------------------*/

namespace Dipple {

struct Internal;
class Options;

struct Option {
  const char * name;
  int def, lo, hi;
  const char * description;
  int Options::* field;
};

class Options {

  Internal * internal;

  static Option table[];

  void set (const Option &, int val);

public:

  // The application reports progress by default, the library does not.
  // Has to be set before the first solver is created.
  //
  static int reportdefault;

#define OPTION(N,V,L,H,D) int N;
  OPTIONS
#undef OPTION

  // Sets defaults and then overwrites them from environment variables
  // 'DIPPLE_<NAME>', e.g., 'DIPPLE_PURE=false'.
  //
  Options (Internal *);

  static const Option * has (const char * name);

  bool set (const char * name, int val);
  int get (const char * name);

  // Splits '--<name>', '--no-<name>' and '--<name>=<val>' into name and
  // value.  Fails for unknown options and invalid values.
  //
  static bool parse_long_option (const char * arg, std::string & name,
                                 int & val);

  void print ();
  static void usage ();
};

}

#endif

#ifndef _logging_hpp_INCLUDED
#define _logging_hpp_INCLUDED

/*------------------------------------------------------------------------*/
#ifdef LOGGING
/*------------------------------------------------------------------------*/

// Debug logging compiled in with 'DIPPLE_LOGGING' and enabled at run-time
// through the 'log' option ('-l' in the application).  Each line shows the
// current decision level.

namespace Dipple {

struct Internal;
class Clause;
class Formula;
class Literal;

struct Logger {
  static void log (Internal *, const char * fmt, ...);
  static void log (Internal *, const Clause &, const char * fmt, ...);
  static void log (Internal *, const Formula &, const char * fmt, ...);

  // Returns one of a few rotating static buffers, thus a handful of
  // literals can be printed in one 'LOG' line.
  //
  static const char * loglit (const Literal &);
};

}

#define LOG(ARGS...) \
do { \
  if (internal->opts.log) Logger::log (internal, ##ARGS); \
} while (0)

#define LOGLIT(LIT) Logger::loglit (LIT)

/*------------------------------------------------------------------------*/
#else
/*------------------------------------------------------------------------*/

#define LOG(...) do { } while (0)
#define LOGLIT(...) ""

/*------------------------------------------------------------------------*/
#endif
/*------------------------------------------------------------------------*/

#endif

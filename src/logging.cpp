#ifdef LOGGING

#include "internal.hpp"

namespace Dipple {

static void start_line (Internal * internal, const char * fmt, va_list & ap)
{
  printf ("%sLOG %d ", internal->prefix.c_str (), internal->level);
  vprintf (fmt, ap);
}

static void end_line () {
  fputc ('\n', stdout);
  fflush (stdout);
}

static void print_clause (const Clause & c) {
  if (c.empty ()) fputs (" <empty>", stdout);
  for (const auto & lit : c)
    printf (" %s", Logger::loglit (lit));
}

void Logger::log (Internal * internal, const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  start_line (internal, fmt, ap);
  va_end (ap);
  end_line ();
}

void Logger::log (Internal * internal, const Clause & c,
                  const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  start_line (internal, fmt, ap);
  va_end (ap);
  printf (" size %zu clause", c.size ());
  print_clause (c);
  end_line ();
}

void Logger::log (Internal * internal, const Formula & f,
                  const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  start_line (internal, fmt, ap);
  va_end (ap);
  printf (" formula of %zu clauses", f.size ());
  for (const auto & c : f) {
    fputs (" [", stdout);
    print_clause (c);
    fputs (" ]", stdout);
  }
  end_line ();
}

const char * Logger::loglit (const Literal & lit) {
  static char buffers[4][16];
  static unsigned next;
  char * res = buffers[next++ & 3];
  snprintf (res, sizeof buffers[0], "%s%d",
    lit.negated () ? "-" : "", lit.var ());
  return res;
}

}

#endif

#include "internal.hpp"

namespace Dipple {

/*------------------------------------------------------------------------*/
#ifndef QUIET
/*------------------------------------------------------------------------*/

// Logging shows messages even if 'quiet' is set.

bool Internal::printing (int verbosity) {
#ifdef LOGGING
  if (opts.log) return true;
#endif
  return !opts.quiet && verbosity <= opts.verbose;
}

void Internal::vverbose (int level, const char * fmt, va_list & ap) {
  if (!printing (level)) return;
  fputs (prefix.c_str (), stdout);
  vprintf (fmt, ap);
  fputc ('\n', stdout);
  fflush (stdout);
}

void Internal::verbose (int level, const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  vverbose (level, fmt, ap);
  va_end (ap);
}

void Internal::message (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  vverbose (0, fmt, ap);
  va_end (ap);
}

void Internal::message () {
  if (!printing (0)) return;
  puts (prefix.c_str ());
  fflush (stdout);
}

void Internal::section (const char * title) {
  if (!printing (0)) return;
  if (stats.sections++) message ();
  string line = prefix + "--- [ " + title + " ] ";
  if (line.size () < 78) line.append (78 - line.size (), '-');
  puts (line.c_str ());
  message ();
}

/*------------------------------------------------------------------------*/
#endif
/*------------------------------------------------------------------------*/

void Internal::verror (const char * fmt, va_list & ap) {
  fflush (stdout);
  fputs ("*** dipple error: ", stderr);
  vfprintf (stderr, fmt, ap);
  fputc ('\n', stderr);
  fflush (stderr);
  exit (1);
}

void Internal::error (const char * fmt, ...) {
  va_list ap;
  va_start (ap, fmt);
  verror (fmt, ap);
  va_end (ap);
}

const char * Internal::format_error (const char * fmt, ...) {
  char buffer[256];
  va_list ap;
  va_start (ap, fmt);
  vsnprintf (buffer, sizeof buffer, fmt, ap);
  va_end (ap);
  error_message = buffer;
  return error_message.c_str ();
}

/*------------------------------------------------------------------------*/

void fatal_message_start () {
  fflush (stdout);
  fputs ("dipple: fatal error: ", stderr);
}

void fatal_message_end () {
  fputc ('\n', stderr);
  fflush (stderr);
  abort ();
}

void fatal (const char * fmt, ...) {
  fatal_message_start ();
  va_list ap;
  va_start (ap, fmt);
  vfprintf (stderr, fmt, ap);
  va_end (ap);
  fatal_message_end ();
}

}

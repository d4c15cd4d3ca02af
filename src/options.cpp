#include "internal.hpp"

namespace Dipple {

int Options::reportdefault;

Option Options::table[] = {
#define OPTION(N,V,L,H,D) { #N, (int) (V), (int) (L), (int) (H), D, &Options::N },
  OPTIONS
#undef OPTION
};

static const size_t size_of_table =
#define OPTION(N,V,L,H,D) 1 +
  OPTIONS
#undef OPTION
  0;

static bool option_before (const Option & o, const char * name) {
  return strcmp (o.name, name) < 0;
}

const Option * Options::has (const char * name) {
  const Option * end = table + size_of_table;
  const Option * res = lower_bound<const Option *> (table, end, name, option_before);
  if (res == end || strcmp (res->name, name)) return 0;
  return res;
}

/*------------------------------------------------------------------------*/

Options::Options (Internal * i) : internal (i) {

  for (size_t j = 1; j < size_of_table; j++)
    if (strcmp (table[j - 1].name, table[j].name) >= 0)
      FATAL ("option '%s' not sorted before '%s' in 'options.hpp'",
        table[j - 1].name, table[j].name);

  // 'reportdefault' is only known now.
  //
#define OPTION(N,V,L,H,D) N = (int) (V);
  OPTIONS
#undef OPTION

  for (size_t j = 0; j < size_of_table; j++) {
    Option & o = table[j];
    o.def = this->*o.field;
    assert (o.lo <= o.def && o.def <= o.hi);
    string key = "DIPPLE_";
    for (const char * p = o.name; *p; p++)
      key += (char) toupper ((unsigned char) *p);
    const char * str = getenv (key.c_str ());
    int val;
    if (str && parse_int_str (str, val)) set (o, val);
  }
}

/*------------------------------------------------------------------------*/

void Options::set (const Option & o, int val) {
  if (val < o.lo) val = o.lo;
  if (val > o.hi) val = o.hi;
  LOG ("option '%s' set to %d", o.name, val);
  this->*o.field = val;
}

bool Options::set (const char * name, int val) {
  const Option * o = has (name);
  if (o) set (*o, val);
  return o;
}

int Options::get (const char * name) {
  const Option * o = has (name);
  return o ? this->*o->field : 0;
}

bool Options::parse_long_option (const char * arg, string & name,
                                 int & val) {
  if (strncmp (arg, "--", 2)) return false;
  const char * p = arg + 2;
  const bool negated = !strncmp (p, "no-", 3);
  if (negated) p += 3;
  const char * value = strchr (p, '=');
  name.assign (p, value ? (size_t) (value - p) : strlen (p));
  if (!has (name.c_str ())) return false;
  if (!value) { val = !negated; return true; }
  return !negated && parse_int_str (value + 1, val);
}

/*------------------------------------------------------------------------*/

// Only options different from their default unless verbose.

void Options::print () {
#ifndef QUIET
  size_t different = 0;
  for (size_t j = 0; j < size_of_table; j++) {
    const Option & o = table[j];
    const int val = this->*o.field;
    if (val != o.def) different++;
    else if (!verbose) continue;
    MSG ("  --%s=%d%s", o.name, val,
      val == o.def ? "" : " (changed from default)");
  }
  if (!different) MSG ("all options have their default value");
#endif
}

void Options::usage () {
  for (size_t j = 0; j < size_of_table; j++) {
    const Option & o = table[j];
    char range[40];
    if (!o.lo && o.hi == 1) strcpy (range, "=bool");
    else snprintf (range, sizeof range, "=%d..%d", o.lo, o.hi);
    printf ("  --%s%-*s %s [%d]\n",
      o.name, (int) (24 - strlen (o.name)), range, o.description, o.def);
  }
}

}

#ifndef _file_hpp_INCLUDED
#define _file_hpp_INCLUDED

#include <cassert>
#include <cstdint>
#include <cstdio>

namespace Dipple {

struct Internal;

// Character input of instances with line counting.  Files opened from a
// path are closed on deletion, while given 'FILE' streams stay open.

class File {

  Internal * internal;
  FILE * file;
  bool owned;
  const char * _name;
  uint64_t _lineno;
  uint64_t _bytes;

  File (Internal *, FILE *, bool owned, const char * name);

public:

  static bool exists (const char * path);

  static File * read (Internal *, FILE *, const char * name);
  static File * read (Internal *, const char * path);   // zero on failure

  ~File ();

  int get () {
    int res = getc_unlocked (file);
    if (res == '\n') _lineno++;
    if (res != EOF) _bytes++;
    return res;
  }

  const char * name () const { return _name; }
  uint64_t lineno () const { return _lineno; }
};

}

#endif

#include "internal.hpp"

extern "C" {
#include <sys/stat.h>
#include <unistd.h>
}

namespace Dipple {

File::File (Internal * i, FILE * f, bool o, const char * n) :
  internal (i), file (f), owned (o), _name (n), _lineno (1), _bytes (0)
{
  assert (file);
  assert (_name);
}

bool File::exists (const char * path) {
  struct stat buf;
  return !stat (path, &buf) && S_ISREG (buf.st_mode) && !access (path, R_OK);
}

File * File::read (Internal * internal, FILE * f, const char * name) {
  VERBOSE (2, "reading '%s' from open stream", name);
  return new File (internal, f, false, name);
}

File * File::read (Internal * internal, const char * path) {
  FILE * f = fopen (path, "r");
  if (!f) {
    VERBOSE (2, "can not open '%s'", path);
    return 0;
  }
  VERBOSE (2, "opened '%s'", path);
  return new File (internal, f, true, path);
}

File::~File () {
  VERBOSE (2, "read %" PRIu64 " bytes in %" PRIu64 " lines from '%s'",
    _bytes, _lineno, _name);
  if (owned) fclose (file);
}

}

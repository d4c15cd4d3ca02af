#include "internal.hpp"

namespace Dipple {

// Digits are accumulated as 'double' and capped well above 'INT_MAX',
// which keeps the arithmetic exact for all values which are not clipped.

bool parse_int_str (const char * str, int & val) {
  if (!strcmp (str, "true")) { val = 1; return true; }
  if (!strcmp (str, "false")) { val = 0; return true; }
  const double cap = 1e10;
  const char * p = str;
  const bool negative = (*p == '-');
  if (negative) p++;
  if (!isdigit ((unsigned char) *p)) return false;
  double res = 0;
  while (isdigit ((unsigned char) *p))
    res = min (cap, 10 * res + (*p++ - '0'));
  if (*p == 'e') {
    if (!isdigit ((unsigned char) *++p)) return false;
    int exponent = 0;
    while (isdigit ((unsigned char) *p))
      exponent = min (10, 10 * exponent + (*p++ - '0'));
    while (exponent--) res = min (cap, 10 * res);
  }
  if (*p) return false;
  if (negative) res = -res;
  if (res < INT_MIN) val = INT_MIN;
  else if (res > INT_MAX) val = INT_MAX;
  else val = (int) res;
  return true;
}

}

#ifndef _util_hpp_INCLUDED
#define _util_hpp_INCLUDED

namespace Dipple {

inline double relative (double a, double b) { return b ? a / b : 0; }
inline double percent (double a, double b) { return relative (100 * a, b); }

// Parses 'true', 'false' and '[-]<digits>[e<digits>]' with the result
// clipped to 'int'.  Returns 'false' on anything else.
//
bool parse_int_str (const char * str, int & val);

}

#endif

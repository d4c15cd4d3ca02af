#ifndef _contract_hpp_INCLUDED
#define _contract_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// Checks of the requirements documented in 'dipple.hpp'.  A failed check
// names the API function and aborts.

#define CONTRACT_VIOLATED(...) \
do { \
  fatal_message_start (); \
  fprintf (stderr, "invalid API usage of '%s' in '%s': ", \
    __PRETTY_FUNCTION__, __FILE__); \
  fprintf (stderr, __VA_ARGS__); \
  fatal_message_end (); \
} while (0)

#define REQUIRE(COND,...) \
do { \
  if (!(COND)) CONTRACT_VIOLATED (__VA_ARGS__); \
} while (0)

#define REQUIRE_INITIALIZED() \
  REQUIRE (internal, "solver not initialized")

#define REQUIRE_VALID_STATE() \
do { \
  REQUIRE_INITIALIZED (); \
  REQUIRE (this->state () & VALID, "solver in invalid state"); \
} while (0)

#define REQUIRE_VALID_VAR(VAR) \
  REQUIRE ((VAR) >= 0, "negative variable '%d'", (int) (VAR))

/*------------------------------------------------------------------------*/

#endif

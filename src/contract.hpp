#ifndef _contract_hpp_INCLUDED
#define _contract_hpp_INCLUDED

/*------------------------------------------------------------------------*/

// If the user violates API contracts while calling functions declared in
// 'argus.hpp' and implemented in 'framework.cpp' and 'solver.cpp' then an
// error is reported and the program aborted.  This is different from the
// query failures 'UNKNOWN_ARGUMENT' and 'ARITY', which are part of the
// normal protocol and reported through 'Solver::error'.

#define CONTRACT_VIOLATED(...) \
  do { \
    fflush (stdout); \
    fprintf (stderr, "*** 'Argus' invalid API usage of '%s' in '%s': ", \
             __PRETTY_FUNCTION__, __FILE__); \
    fprintf (stderr, __VA_ARGS__); \
    fputc ('\n', stderr); \
    fflush (stderr); \
    abort (); \
  } while (0)

/*------------------------------------------------------------------------*/

// These are common shortcuts for API contracts (requirements).

#define REQUIRE(COND, ...) \
  do { \
    if ((COND)) \
      break; \
    CONTRACT_VIOLATED (__VA_ARGS__); \
  } while (0)

#define REQUIRE_INITIALIZED() \
  do { \
    REQUIRE (internal != 0, "internal solver not initialized"); \
  } while (0)

#define REQUIRE_BUILT() \
  do { \
    REQUIRE (_built, "framework not built"); \
  } while (0)

#define REQUIRE_VALID_INDEX(IDX) \
  do { \
    REQUIRE (0 <= (IDX) && (IDX) < (int) names.size (), \
             "invalid argument index '%d'", (int) (IDX)); \
  } while (0)

/*------------------------------------------------------------------------*/

#endif

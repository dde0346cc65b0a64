#pragma once

// Test support helpers.
//
// Release builds define NDEBUG, which would compile <cassert>'s assert() away
// and turn the tests into no-ops. Tests include this header and keep using
// assert(expr); the macro is replaced by an always-on check that reports the
// failing expression on stderr and exits with status 1.

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdlib>
#include <iostream>

namespace psyfit_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

} // namespace psyfit_test

#ifndef PSYFIT_TEST_ASSERT
#define PSYFIT_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::psyfit_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) PSYFIT_TEST_ASSERT(expr)

#ifndef TEST_CHECK
#define TEST_CHECK(expr) PSYFIT_TEST_ASSERT(expr)
#endif

#pragma once

#include <cmath>
#include <iostream>

/*
    Minimal expectation helpers shared by the test executables. A failed check prints its location and
    is counted; the test's main returns occ::test::Finish() so CTest sees a non-zero exit.

    OCC_CHECK is the only macro, it exists to capture the call site. Comparisons and exception checks are
    plain functions passed into it:

        OCC_CHECK(occ::test::Eq(snap.frame_index, 3u));
        OCC_CHECK(occ::test::Throws<occ::InvalidGeometry>([&] { engine.add_line(bad); }));
*/

namespace occ {
namespace test {

inline int& Failures() {
  static int n = 0;
  return n;
}

inline void Fail(const char* file, int line, const char* what) {
  std::cerr << file << ":" << line << ": check failed: " << what << "\n";
  ++Failures();
}

inline bool Near(double a, double b, double eps = 1e-4) { return std::abs(a - b) <= eps; }

// Prints both sides on mismatch
template <typename A, typename B>
bool Eq(const A& a, const B& b) {
  if (a == b) return true;
  std::cerr << "  lhs: " << a << "  rhs: " << b << "\n";
  return false;
}

// True only when fn throws E; any other exception propagates and fails the test executable
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

inline int Finish(const char* name) {
  if (Failures() == 0) {
    std::cout << name << ": OK\n";
    return 0;
  }
  std::cerr << name << ": " << Failures() << " check(s) failed\n";
  return 1;
}

} // namespace test
} // namespace occ

#define OCC_CHECK(cond) \
  do { \
    if (!(cond)) occ::test::Fail(__FILE__, __LINE__, #cond); \
  } while (0)

#include <rediszset/assert.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace rediszset::detail {

void assert_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  fmt::print(stderr, "[rediszset] assertion failed: {}\n  at {}:{} in {}\n", expr, file, line,
             func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace rediszset::detail

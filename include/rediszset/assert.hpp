#pragma once

namespace rediszset::detail {

/// Prints the failed condition and aborts.
[[noreturn]] void assert_fail(char const* expr, char const* file, int line,
                              char const* func) noexcept;

}  // namespace rediszset::detail

/// Internal invariants only (buffer sizes, sink state, cursor ownership). Arguments coming
/// from callers are validated and reported through error_info, never asserted.
#if !defined(NDEBUG)
#if defined(__GNUC__) || defined(__clang__)
#define REDISZSET_ASSERT(expr)                   \
  (__builtin_expect(!!(expr), 1)                 \
     ? (void)0                                   \
     : ::rediszset::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))
#else
#define REDISZSET_ASSERT(expr) \
  ((expr) ? (void)0 : ::rediszset::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))
#endif
#else
#define REDISZSET_ASSERT(expr) ((void)0)
#endif

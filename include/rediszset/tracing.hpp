#pragma once

#include <rediszset/execution_mode.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace rediszset {

/// Minimal command metadata for tracing callbacks.
struct dispatch_trace_info {
  std::uint64_t id{};
  std::string_view command{};  // Lifetime: valid only during the callback.
  std::size_t arg_count{0};
  execution_mode mode{execution_mode::direct};
};

struct dispatch_trace_start {
  dispatch_trace_info info{};
};

struct dispatch_trace_finish {
  dispatch_trace_info info{};

  /// Direct mode: round trip plus conversion.
  /// Queued modes: time spent enqueueing (the reply resolves later).
  std::chrono::nanoseconds duration{};

  /// True when the result is a deferred handle rather than a resolved value.
  bool deferred{false};

  /// Default constructed on success.
  std::error_code error{};

  /// Human-oriented detail (empty when redacted). Lifetime: valid only during the callback.
  std::string_view error_detail{};
};

/// Lightweight tracing hooks (no logging dependency).
///
/// Contract:
/// - Callbacks run on the caller's thread, inside the dispatching call.
/// - Implementations MUST NOT throw.
struct dispatch_trace_hooks {
  using on_start_fn = void (*)(void*, dispatch_trace_start const&);
  using on_finish_fn = void (*)(void*, dispatch_trace_finish const&);

  void* user_data{};
  on_start_fn on_start{};
  on_finish_fn on_finish{};

  [[nodiscard]] constexpr bool enabled() const noexcept {
    return on_start != nullptr || on_finish != nullptr;
  }
};

}  // namespace rediszset

#pragma once

#include <rediszset/tracing.hpp>

#include <cstdint>
#include <optional>

namespace rediszset {

/// Command-surface configuration.
struct config {
  // Tracing hooks (dispatch-level instrumentation).
  dispatch_trace_hooks trace_hooks{};
  // Redact error detail passed to trace hooks by default (detail = "").
  bool trace_redact_error_detail{true};

  /// COUNT hint sent with ZSCAN when scan_options carries none.
  /// nullopt leaves the page size to the store (10 by default on Redis).
  std::optional<std::int64_t> default_scan_count{};
};

}  // namespace rediszset

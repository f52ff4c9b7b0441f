#pragma once

#include <rediszset/command.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace rediszset {

/// Per-scan configuration.
struct scan_options {
  /// Glob-style pattern (MATCH). Filtering happens server-side after a page is read, so pages
  /// may come back empty while the scan continues.
  std::optional<std::string> match{};

  /// Page-size hint (COUNT). Must be positive.
  std::optional<std::int64_t> count{};
};

/// ZADD flags.
///
///   nx: only add new members      xx: only update existing members
///   gt / lt: only update when the new score is greater / less than the current one
///   ch: count changed members instead of added ones
struct zadd_args {
  bool nx{false};
  bool xx{false};
  bool gt{false};
  bool lt{false};
  bool ch{false};

  /// Rejects the combinations the store refuses (NX with XX, GT or LT; GT with LT).
  [[nodiscard]] auto validate() const -> expected<void, error_info>;

  /// Append the flags in the order ZADD expects them.
  void append_to(command& cmd) const;
};

}  // namespace rediszset

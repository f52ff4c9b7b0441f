#pragma once

#include <rediszset/command.hpp>
#include <rediszset/converters.hpp>
#include <rediszset/dispatcher.hpp>
#include <rediszset/error_info.hpp>
#include <rediszset/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rediszset {

enum class cursor_state : std::uint8_t {
  created,    // no round trip yet
  active,     // at least one page read, server cursor not yet "0"
  exhausted,  // server returned cursor "0"
  closed,     // close() was called
};

constexpr auto to_string(cursor_state s) noexcept -> char const* {
  switch (s) {
    case cursor_state::created:
      return "created";
    case cursor_state::active:
      return "active";
    case cursor_state::exhausted:
      return "exhausted";
    case cursor_state::closed:
      return "closed";
  }
  return "unknown";
}

/// Incremental iteration over a SCAN-family command.
///
/// Each next() performs exactly one round trip and returns that page. Pages may be empty
/// while the scan is still running (MATCH filters after reading); only the server cursor "0"
/// ends the iteration. The store may return an element more than once across pages.
///
/// Requirements:
/// - direct mode: next() fails with error::unsupported_in_mode (and sends nothing) while the
///   connection is pipelined or transactional
/// - the connection must outlive the cursor, or the cursor must be closed first
template <typename T>
class cursor {
 public:
  /// Builds the scan command for a cursor token.
  using step_fn = std::function<command(std::string_view token)>;
  using decode_fn = reply_converter<convert::scan_page<T>>;

  static constexpr std::string_view start_token = "0";

  cursor(dispatcher d, step_fn step, decode_fn decode,
         std::string start = std::string{start_token});

  cursor(cursor&&) = default;
  auto operator=(cursor&&) -> cursor& = default;
  cursor(cursor const&) = delete;
  auto operator=(cursor const&) -> cursor& = delete;

  /// Fetch the next page.
  /// Exhausted: empty page, no round trip. Closed: error::iterator_closed.
  auto next() -> expected<std::vector<T>, error_info>;

  [[nodiscard]] bool has_next() const noexcept {
    return state_ == cursor_state::created || state_ == cursor_state::active;
  }

  [[nodiscard]] auto state() const noexcept -> cursor_state { return state_; }

  /// Server cursor token to send on the next round trip.
  [[nodiscard]] auto cursor_id() const noexcept -> std::string const& { return token_; }

  /// Elements returned so far.
  [[nodiscard]] auto position() const noexcept -> std::size_t { return position_; }

  /// Release the connection. Idempotent.
  void close();

 private:
  std::optional<dispatcher> dispatcher_;
  step_fn step_;
  decode_fn decode_;
  std::string token_;
  std::size_t position_{0};
  cursor_state state_{cursor_state::created};
};

}  // namespace rediszset

#include <rediszset/detail/impl/cursor.ipp>

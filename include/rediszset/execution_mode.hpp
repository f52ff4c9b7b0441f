#pragma once

#include <cstdint>

namespace rediszset {

/// How the connection currently runs commands.
///
/// - direct:        each command is written, answered and resolved before the call returns
/// - pipelined:     commands are queued; replies resolve when the pipeline is flushed
/// - transactional: commands are queued inside MULTI; replies resolve on EXEC
enum class execution_mode : std::uint8_t {
  direct = 0,
  pipelined,
  transactional,
};

constexpr auto to_string(execution_mode m) noexcept -> char const* {
  switch (m) {
    case execution_mode::direct:
      return "direct";
    case execution_mode::pipelined:
      return "pipelined";
    case execution_mode::transactional:
      return "transactional";
  }
  return "unknown";
}

[[nodiscard]] constexpr bool is_queueing(execution_mode m) noexcept {
  return m != execution_mode::direct;
}

}  // namespace rediszset
